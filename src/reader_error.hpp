/* reader_error.hpp - error types reported by the reader.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <stdexcept>
#include <wx/string.h>

enum class error_severity {
	error,
	warning
};

enum class reader_error_code {
	generic,
	not_found,
	malformed_archive
};

class reader_exception : public std::runtime_error {
public:
	reader_exception(const wxString& msg, reader_error_code code = reader_error_code::generic, error_severity sev = error_severity::error) : std::runtime_error(msg.utf8_string()), message{msg}, error_code{code}, severity{sev} {
	}
	reader_exception(const wxString& msg, const wxString& p, reader_error_code code = reader_error_code::generic, error_severity sev = error_severity::error) : std::runtime_error(msg.utf8_string()), message{msg}, path{p}, error_code{code}, severity{sev} {
	}

	[[nodiscard]] const wxString& get_message() const noexcept {
		return message;
	}

	[[nodiscard]] const wxString& get_path() const noexcept {
		return path;
	}

	[[nodiscard]] reader_error_code get_error_code() const noexcept {
		return error_code;
	}

	[[nodiscard]] error_severity get_severity() const noexcept {
		return severity;
	}

	[[nodiscard]] bool is_not_found() const noexcept {
		return error_code == reader_error_code::not_found;
	}

	[[nodiscard]] wxString get_display_message() const {
		if (path.IsEmpty()) {
			return message;
		}
		return wxString::Format("%s: %s", path, message);
	}

private:
	wxString message;
	wxString path;
	reader_error_code error_code;
	error_severity severity;
};
