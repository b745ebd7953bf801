/* commands.hpp - command-line command dispatch header file.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "reader_service.hpp"
#include <ostream>
#include <wx/arrstr.h>
#include <wx/string.h>

enum class exit_status {
	ok = 0,
	failure = 1,
	usage = 2,
};

struct command_options {
	wxString anchor;
	wxString output_dir;
	wxString book_suffix;
};

// params[0] names the command, the rest are its arguments. Results go to out, diagnostics to the active wxLog target.
// Reader errors are logged and reported as exit_status::failure; bad or missing arguments as exit_status::usage.
[[nodiscard]] exit_status run_command(const wxArrayString& params, const command_options& options, reader_service& reader, std::ostream& out);
