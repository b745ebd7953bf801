/* reader_service.hpp - chapter reading, library listing and asset lookup header file.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "book.hpp"
#include "book_cache.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <wx/string.h>

// Everything a renderer needs for one chapter request.
struct chapter_view {
	std::shared_ptr<const book> source;
	chapter current_chapter;
	size_t chapter_index{0};
	std::string book_id;
	std::optional<size_t> previous_index;
	std::optional<size_t> next_index;
	std::optional<std::string> anchor;
	bool is_subsection{false};

	[[nodiscard]] const std::string& content() const noexcept {
		return current_chapter.content();
	}
};

struct library_entry {
	std::string id;
	std::string title;
	std::string author;
	size_t chapter_count{0};
};

struct toc_target {
	size_t chapter_index{0};
	std::optional<std::string> anchor;
};

class reader_service {
public:
	reader_service(const wxString& books_dir, const wxString& book_suffix, size_t cache_capacity);
	reader_service(const wxString& books_dir, const wxString& book_suffix, book_cache::loader loader, size_t cache_capacity);
	~reader_service() = default;
	reader_service(const reader_service&) = delete;
	reader_service& operator=(const reader_service&) = delete;
	reader_service(reader_service&&) = delete;
	reader_service& operator=(reader_service&&) = delete;

	// The following throw reader_exception(not_found) for unknown books, chapters, images and TOC targets.
	[[nodiscard]] std::shared_ptr<const book> get_book(const std::string& book_id);
	[[nodiscard]] chapter_view read_chapter(const std::string& book_id, long chapter_index, const std::optional<std::string>& anchor = std::nullopt);
	[[nodiscard]] chapter_view read_first_chapter(const std::string& book_id);
	[[nodiscard]] toc_target resolve_toc_entry(const std::string& book_id, const toc_entry& entry);
	[[nodiscard]] wxString resolve_image(const std::string& book_id, const std::string& image_name) const;
	[[nodiscard]] std::vector<library_entry> library();

	[[nodiscard]] const wxString& get_books_dir() const noexcept {
		return books_dir;
	}

	[[nodiscard]] book_cache& get_cache() noexcept {
		return cache;
	}

private:
	wxString books_dir;
	wxString book_suffix;
	book_cache cache;
};

// Strips one leading '#' and maps an empty result to nullopt.
[[nodiscard]] std::optional<std::string> normalize_anchor(const std::optional<std::string>& anchor);
