/* book_loader.hpp - book archive reading and writing header file.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "book.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <wx/string.h>

// Directory of a stored book: <books_dir>/<book_id>. Empty when book_id is not a plain directory name.
[[nodiscard]] wxString book_directory(const wxString& books_dir, const std::string& book_id);
// nullptr when the archive is missing or unreadable; unreadable archives are logged as warnings.
[[nodiscard]] std::shared_ptr<const book> load_book(const wxString& books_dir, const std::string& book_id);
[[nodiscard]] std::optional<book> parse_book_json(std::string_view json_text);
[[nodiscard]] std::string serialize_book_json(const book& b);
[[nodiscard]] bool save_book(const book& b, const wxString& directory);
