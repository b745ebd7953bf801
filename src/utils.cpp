/* utils.cpp - contains various helper functions.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <cctype>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <wx/filename.h>
#include <wx/string.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;
constexpr int READ_BUFFER_SIZE = 4096;

int hex_value(char c) noexcept {
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

std::string url_encode_path(std::string_view in) {
	static const char hex[] = "0123456789ABCDEF";
	std::string out;
	out.reserve(in.size());
	for (const unsigned char ch : in) {
		const bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == '/' || ch == ':';
		if (unreserved) {
			out.push_back(static_cast<char>(ch));
		} else {
			out.push_back('%');
			out.push_back(hex[(ch >> 4) & 0xF]);
			out.push_back(hex[ch & 0xF]);
		}
	}
	return out;
}
} // namespace

std::string collapse_whitespace(std::string_view input) {
	std::string result;
	result.reserve(input.size());
	bool prev_was_space = false;
	for (size_t i = 0; i < input.size(); ++i) {
		const auto ch = static_cast<unsigned char>(input[i]);
		const bool is_nbsp = (i + 1 < input.size() && ch == UTF8_NBSP_FIRST && static_cast<unsigned char>(input[i + 1]) == UTF8_NBSP_SECOND);
		if ((std::isspace(ch) != 0) || is_nbsp) {
			if (!prev_was_space) {
				result += ' ';
				prev_was_space = true;
			}
			if (is_nbsp) {
				++i;
			}
		} else {
			result += input[i];
			prev_was_space = false;
		}
	}
	return result;
}

std::string trim_string(const std::string& str) {
	const auto first = str.find_first_not_of(" \t\r\n\f\v");
	if (first == std::string::npos) {
		return {};
	}
	const auto last = str.find_last_not_of(" \t\r\n\f\v");
	return str.substr(first, last - first + 1);
}

std::string remove_soft_hyphens(std::string_view input) {
	std::string result(input);
	const std::string sh = "\xC2\xAD";
	size_t pos = 0;
	while ((pos = result.find(sh, pos)) != std::string::npos) {
		result.erase(pos, sh.size());
	}
	return result;
}

std::string url_decode(std::string_view encoded) {
	std::string out;
	out.reserve(encoded.size());
	for (size_t i = 0; i < encoded.size(); ++i) {
		const char c = encoded[i];
		if (c == '%' && i + 2 < encoded.size()) {
			const int hi = hex_value(encoded[i + 1]);
			const int lo = hex_value(encoded[i + 2]);
			if (hi >= 0 && lo >= 0) {
				out.push_back(static_cast<char>((hi << 4) | lo));
				i += 2;
				continue;
			}
		}
		out.push_back(c);
	}
	return out;
}

std::string join_strings(const std::vector<std::string>& parts, std::string_view separator) {
	std::string result;
	for (size_t i = 0; i < parts.size(); ++i) {
		if (i > 0) {
			result += separator;
		}
		result += parts[i];
	}
	return result;
}

std::string safe_path_component(std::string_view segment) {
	const auto slash = segment.find_last_of("/\\");
	const std::string_view base = slash == std::string_view::npos ? segment : segment.substr(slash + 1);
	if (base.empty() || base == "." || base == "..") {
		return {};
	}
	return std::string{base};
}

std::string resolve_relative_path(std::string_view base_dir, std::string_view href) {
	std::vector<std::string> segments;
	auto push_segments = [&segments](std::string_view path) {
		size_t start = 0;
		while (start <= path.size()) {
			const auto end = path.find('/', start);
			const auto segment = path.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
			if (segment == "..") {
				if (!segments.empty()) {
					segments.pop_back();
				}
			} else if (!segment.empty() && segment != ".") {
				segments.emplace_back(segment);
			}
			if (end == std::string_view::npos) {
				break;
			}
			start = end + 1;
		}
	};
	if (href.empty() || href.front() != '/') {
		push_segments(base_dir);
	}
	push_segments(href);
	return join_strings(segments, "/");
}

std::string parent_directory(std::string_view path) {
	const auto slash = path.find_last_of('/');
	return slash == std::string_view::npos ? std::string{} : std::string{path.substr(0, slash)};
}

std::optional<std::string> read_file(const wxString& path) {
	if (!wxFileName::FileExists(path)) {
		return std::nullopt;
	}
	wxFileInputStream stream(path);
	if (!stream.IsOk()) {
		return std::nullopt;
	}
	std::ostringstream buffer;
	char buf[READ_BUFFER_SIZE];
	while (stream.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(stream.LastRead()));
	}
	return buffer.str();
}

bool write_file(const wxString& path, std::string_view data) {
	wxFileOutputStream stream(path);
	if (!stream.IsOk()) {
		return false;
	}
	if (!data.empty() && !stream.WriteAll(data.data(), data.size())) {
		return false;
	}
	return stream.Close();
}

std::string read_zip_entry(wxZipInputStream& zip) {
	std::ostringstream buffer;
	char buf[READ_BUFFER_SIZE];
	while (zip.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(zip.LastRead()));
	}
	return buffer.str();
}

wxZipEntry* find_zip_entry(const std::string& filename, const std::map<std::string, std::unique_ptr<wxZipEntry>>& entries) {
	auto it = entries.find(filename);
	if (it != entries.end()) {
		return it->second.get();
	}
	const auto decoded = url_decode(filename);
	if (decoded != filename) {
		it = entries.find(decoded);
		if (it != entries.end()) {
			return it->second.get();
		}
	}
	const auto encoded = url_encode_path(filename);
	if (encoded != filename) {
		it = entries.find(encoded);
		if (it != entries.end()) {
			return it->second.get();
		}
	}
	return nullptr;
}
