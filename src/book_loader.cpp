/* book_loader.cpp - book archive reading and writing.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "book_loader.hpp"
#include "book.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>

using nlohmann::json;

namespace {
std::vector<std::string> string_list(const json& j, const char* key) {
	std::vector<std::string> values;
	if (!j.contains(key)) {
		return values;
	}
	for (const auto& item : j.at(key)) {
		values.push_back(item.get<std::string>());
	}
	return values;
}

toc_entry toc_entry_from_json(const json& j) {
	toc_entry root;
	std::vector<std::pair<const json*, toc_entry*>> pending{{&j, &root}};
	while (!pending.empty()) {
		auto [node, entry] = pending.back();
		pending.pop_back();
		entry->title = node->value("title", "");
		entry->href = node->value("href", "");
		entry->file_href = node->value("file_href", "");
		entry->anchor = node->value("anchor", "");
		if (!node->contains("children")) {
			continue;
		}
		const auto& kids = node->at("children");
		entry->children.resize(kids.size());
		for (size_t i = 0; i < kids.size(); ++i) {
			pending.emplace_back(&kids[i], &entry->children[i]);
		}
	}
	return root;
}

json toc_entry_to_json(const toc_entry& entry) {
	json root;
	std::vector<std::pair<const toc_entry*, json*>> pending{{&entry, &root}};
	while (!pending.empty()) {
		auto [source, node] = pending.back();
		pending.pop_back();
		*node = {
			{"title", source->title},
			{"href", source->href},
			{"file_href", source->file_href},
			{"anchor", source->anchor},
			{"children", json::array()},
		};
		auto& kids = (*node)["children"];
		for (size_t i = 0; i < source->children.size(); ++i) {
			kids.push_back(json::object());
		}
		for (size_t i = 0; i < source->children.size(); ++i) {
			pending.emplace_back(&source->children[i], &kids[i]);
		}
	}
	return root;
}
} // namespace

wxString book_directory(const wxString& books_dir, const std::string& book_id) {
	const std::string safe_id = safe_path_component(book_id);
	if (safe_id.empty() || safe_id != book_id) {
		return {};
	}
	return books_dir + wxFileName::GetPathSeparator() + wxString::FromUTF8(safe_id);
}

std::shared_ptr<const book> load_book(const wxString& books_dir, const std::string& book_id) {
	const wxString dir = book_directory(books_dir, book_id);
	if (dir.IsEmpty()) {
		return nullptr;
	}
	const wxString path = dir + wxFileName::GetPathSeparator() + BOOK_FILE_NAME;
	const auto contents = read_file(path);
	if (!contents) {
		return nullptr;
	}
	auto parsed = parse_book_json(*contents);
	if (!parsed) {
		wxLogWarning("Error loading book %s: %s is not a valid book archive", wxString::FromUTF8(book_id), path);
		return nullptr;
	}
	wxLogVerbose("Loaded book %s (%zu chapters)", wxString::FromUTF8(book_id), parsed->spine.size());
	return std::make_shared<const book>(std::move(*parsed));
}

std::optional<book> parse_book_json(std::string_view json_text) {
	auto j = json::parse(json_text, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return std::nullopt;
	}
	try {
		book result;
		result.version = j.value("version", 0);
		result.source_file = j.value("source_file", "");
		result.processed_at = j.value("processed_at", "");
		if (j.contains("metadata")) {
			const auto& meta = j.at("metadata");
			result.metadata.title = meta.value("title", result.metadata.title);
			result.metadata.language = meta.value("language", "");
			result.metadata.description = meta.value("description", "");
			result.metadata.publisher = meta.value("publisher", "");
			result.metadata.date = meta.value("date", "");
			result.metadata.authors = string_list(meta, "authors");
			result.metadata.identifiers = string_list(meta, "identifiers");
			result.metadata.subjects = string_list(meta, "subjects");
		}
		const auto& spine = j.at("spine");
		if (!spine.is_array()) {
			return std::nullopt;
		}
		result.spine.reserve(spine.size());
		for (const auto& item : spine) {
			result.spine.emplace_back(item.value("id", ""), item.value("href", ""), item.value("title", ""), item.value("content", ""), item.value("text", ""), item.value("order", static_cast<int>(result.spine.size())));
		}
		if (j.contains("toc")) {
			for (const auto& item : j.at("toc")) {
				result.toc.push_back(toc_entry_from_json(item));
			}
		}
		if (j.contains("images")) {
			for (const auto& [name, path] : j.at("images").items()) {
				result.images[name] = path.get<std::string>();
			}
		}
		return result;
	} catch (const json::exception&) {
		return std::nullopt;
	}
}

std::string serialize_book_json(const book& b) {
	json spine = json::array();
	for (const auto& ch : b.spine) {
		spine.push_back({
			{"id", ch.id()},
			{"href", ch.href()},
			{"title", ch.title()},
			{"content", ch.content()},
			{"text", ch.text()},
			{"order", ch.order()},
		});
	}
	json toc = json::array();
	for (const auto& entry : b.toc) {
		toc.push_back(toc_entry_to_json(entry));
	}
	const json j = {
		{"version", BOOK_FORMAT_VERSION},
		{"metadata", {
			{"title", b.metadata.title},
			{"language", b.metadata.language},
			{"authors", b.metadata.authors},
			{"description", b.metadata.description},
			{"publisher", b.metadata.publisher},
			{"date", b.metadata.date},
			{"identifiers", b.metadata.identifiers},
			{"subjects", b.metadata.subjects},
		}},
		{"spine", std::move(spine)},
		{"toc", std::move(toc)},
		{"images", b.images},
		{"source_file", b.source_file},
		{"processed_at", b.processed_at},
	};
	return j.dump(1, '\t');
}

bool save_book(const book& b, const wxString& directory) {
	if (!wxFileName::DirExists(directory) && !wxFileName::Mkdir(directory, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
		wxLogError("Couldn't create directory %s", directory);
		return false;
	}
	const wxString path = directory + wxFileName::GetPathSeparator() + BOOK_FILE_NAME;
	if (!write_file(path, serialize_book_json(b))) {
		wxLogError("Couldn't write %s", path);
		return false;
	}
	return true;
}
