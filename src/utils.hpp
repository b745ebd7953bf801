/* utils.hpp - contains various helper functions.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <wx/string.h>
#include <wx/zipstrm.h>

[[nodiscard]] std::string collapse_whitespace(std::string_view input);
[[nodiscard]] std::string trim_string(const std::string& str);
[[nodiscard]] std::string remove_soft_hyphens(std::string_view input);
[[nodiscard]] std::string url_decode(std::string_view encoded);
[[nodiscard]] std::string join_strings(const std::vector<std::string>& parts, std::string_view separator);
// Reduces a request-supplied path segment to its final component, like a basename. Returns an empty string for
// segments that would still escape their directory ("", ".", "..").
[[nodiscard]] std::string safe_path_component(std::string_view segment);
// Joins href onto base_dir (both '/'-separated, archive-relative) and folds "." and ".." segments.
[[nodiscard]] std::string resolve_relative_path(std::string_view base_dir, std::string_view href);
[[nodiscard]] std::string parent_directory(std::string_view path);
[[nodiscard]] std::optional<std::string> read_file(const wxString& path);
[[nodiscard]] bool write_file(const wxString& path, std::string_view data);
[[nodiscard]] std::string read_zip_entry(wxZipInputStream& zip);
[[nodiscard]] wxZipEntry* find_zip_entry(const std::string& filename, const std::map<std::string, std::unique_ptr<wxZipEntry>>& entries);
