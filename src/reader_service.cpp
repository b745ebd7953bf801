/* reader_service.cpp - chapter reading, library listing and asset lookup.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "reader_service.hpp"
#include "book.hpp"
#include "book_cache.hpp"
#include "book_loader.hpp"
#include "chapter_nav.hpp"
#include "constants.hpp"
#include "reader_error.hpp"
#include "section_extractor.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <wx/dir.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

reader_service::reader_service(const wxString& books_dir, const wxString& book_suffix, size_t cache_capacity) : reader_service(books_dir, book_suffix, [books_dir](const std::string& book_id) { return load_book(books_dir, book_id); }, cache_capacity) {
}

reader_service::reader_service(const wxString& books_dir, const wxString& book_suffix, book_cache::loader loader, size_t cache_capacity) : books_dir{books_dir}, book_suffix{book_suffix}, cache{std::move(loader), cache_capacity} {
}

std::shared_ptr<const book> reader_service::get_book(const std::string& book_id) {
	auto b = cache.get(book_id);
	if (!b) {
		throw reader_exception(_("Book not found"), wxString::FromUTF8(book_id), reader_error_code::not_found);
	}
	return b;
}

chapter_view reader_service::read_chapter(const std::string& book_id, long chapter_index, const std::optional<std::string>& anchor) {
	auto b = get_book(book_id);
	const chapter* current = get_chapter(b->spine, chapter_index);
	if (current == nullptr) {
		throw reader_exception(wxString::Format(_("Chapter %ld not found"), chapter_index), wxString::FromUTF8(book_id), reader_error_code::not_found);
	}
	const auto index = static_cast<size_t>(chapter_index);
	auto normalized = normalize_anchor(anchor);
	auto subsection = build_subsection_content(current->content(), normalized);
	if (normalized && !subsection) {
		wxLogVerbose("Anchor %s not found in chapter %zu of %s, showing the full chapter", wxString::FromUTF8(*normalized), index, wxString::FromUTF8(book_id));
	}
	const bool is_subsection = subsection.has_value();
	return chapter_view{
		b,
		is_subsection ? current->with_content(std::move(*subsection)) : *current,
		index,
		book_id,
		previous_index(index),
		next_index(index, b->spine.size()),
		std::move(normalized),
		is_subsection,
	};
}

chapter_view reader_service::read_first_chapter(const std::string& book_id) {
	return read_chapter(book_id, 0);
}

toc_target reader_service::resolve_toc_entry(const std::string& book_id, const toc_entry& entry) {
	const auto b = get_book(book_id);
	const auto index = b->spine_index_for(entry.file_href);
	if (!index) {
		throw reader_exception(wxString::Format(_("No chapter for %s"), wxString::FromUTF8(entry.file_href)), wxString::FromUTF8(book_id), reader_error_code::not_found);
	}
	return {*index, normalize_anchor(entry.anchor)};
}

wxString reader_service::resolve_image(const std::string& book_id, const std::string& image_name) const {
	const std::string safe_book_id = safe_path_component(book_id);
	const std::string safe_image_name = safe_path_component(image_name);
	if (safe_book_id.empty() || safe_image_name.empty()) {
		throw reader_exception(_("Image not found"), wxString::FromUTF8(image_name), reader_error_code::not_found);
	}
	wxFileName path(books_dir, wxString::FromUTF8(safe_image_name));
	path.AppendDir(wxString::FromUTF8(safe_book_id));
	path.AppendDir(IMAGES_DIR_NAME);
	if (!path.FileExists()) {
		throw reader_exception(_("Image not found"), path.GetFullPath(), reader_error_code::not_found);
	}
	return path.GetFullPath();
}

std::vector<library_entry> reader_service::library() {
	std::vector<library_entry> books;
	if (!wxDir::Exists(books_dir)) {
		wxLogWarning("Books directory %s does not exist", books_dir);
		return books;
	}
	const wxDir dir(books_dir);
	if (!dir.IsOpened()) {
		return books;
	}
	wxString name;
	bool cont = dir.GetFirst(&name, wxEmptyString, wxDIR_DIRS);
	while (cont) {
		if (name.EndsWith(book_suffix)) {
			const std::string id = name.utf8_string();
			if (const auto b = cache.get(id)) {
				books.push_back({id, b->metadata.title, b->metadata.author_line(), b->spine.size()});
			}
		}
		cont = dir.GetNext(&name);
	}
	std::sort(books.begin(), books.end(), [](const library_entry& a, const library_entry& b) {
		return a.id < b.id;
	});
	return books;
}

std::optional<std::string> normalize_anchor(const std::optional<std::string>& anchor) {
	if (!anchor) {
		return std::nullopt;
	}
	std::string value = *anchor;
	if (!value.empty() && value.front() == '#') {
		value.erase(0, 1);
	}
	if (value.empty()) {
		return std::nullopt;
	}
	return value;
}
