/* book.hpp - book, chapter and table of contents types.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct book_metadata {
	std::string title{"Untitled"};
	std::string language;
	std::vector<std::string> authors;
	std::string description;
	std::string publisher;
	std::string date;
	std::vector<std::string> identifiers;
	std::vector<std::string> subjects;

	[[nodiscard]] std::string author_line() const;
};

// One spine item. Never modified after load; narrowing produces a new value through with_content().
class chapter {
public:
	chapter(std::string id, std::string href, std::string title, std::string content, std::string text, int order);
	~chapter() = default;
	chapter(const chapter&) = default;
	chapter& operator=(const chapter&) = default;
	chapter(chapter&&) = default;
	chapter& operator=(chapter&&) = default;

	[[nodiscard]] const std::string& id() const noexcept {
		return chapter_id;
	}

	[[nodiscard]] const std::string& href() const noexcept {
		return source_href;
	}

	[[nodiscard]] const std::string& title() const noexcept {
		return chapter_title;
	}

	[[nodiscard]] const std::string& content() const noexcept {
		return html;
	}

	[[nodiscard]] const std::string& text() const noexcept {
		return plain_text;
	}

	[[nodiscard]] int order() const noexcept {
		return order_index;
	}

	[[nodiscard]] chapter with_content(std::string new_content) const;

private:
	std::string chapter_id;
	std::string source_href;
	std::string chapter_title;
	std::string html;
	std::string plain_text;
	int order_index{0};
};

struct toc_entry {
	std::string title;
	std::string href;
	std::string file_href;
	std::string anchor;
	std::vector<toc_entry> children;
};

struct book {
	book_metadata metadata;
	std::vector<chapter> spine;
	std::vector<toc_entry> toc;
	std::map<std::string, std::string> images;
	std::string source_file;
	std::string processed_at;
	int version{0};

	[[nodiscard]] std::optional<size_t> spine_index_for(std::string_view file_href) const;
};
