/* book.cpp - book, chapter and table of contents types.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "book.hpp"
#include "utils.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

std::string book_metadata::author_line() const {
	return join_strings(authors, ", ");
}

chapter::chapter(std::string id, std::string href, std::string title, std::string content, std::string text, int order) : chapter_id{std::move(id)}, source_href{std::move(href)}, chapter_title{std::move(title)}, html{std::move(content)}, plain_text{std::move(text)}, order_index{order} {
}

chapter chapter::with_content(std::string new_content) const {
	chapter narrowed{*this};
	narrowed.html = std::move(new_content);
	return narrowed;
}

std::optional<size_t> book::spine_index_for(std::string_view file_href) const {
	for (size_t i = 0; i < spine.size(); ++i) {
		if (spine[i].href() == file_href) {
			return i;
		}
	}
	const auto decoded = url_decode(file_href);
	for (size_t i = 0; i < spine.size(); ++i) {
		if (url_decode(spine[i].href()) == decoded) {
			return i;
		}
	}
	return std::nullopt;
}
