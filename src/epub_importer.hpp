/* epub_importer.hpp - EPUB to book archive conversion header file.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "book.hpp"
#include "html_tree.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <pugixml.hpp>
#include <string>
#include <vector>
#include <wx/string.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

struct import_result {
	book imported;
	std::string book_id;
	wxString directory;
	size_t image_count{0};
};

class epub_importer {
public:
	epub_importer() = default;
	~epub_importer() = default;
	epub_importer(const epub_importer&) = delete;
	epub_importer& operator=(const epub_importer&) = delete;
	epub_importer(epub_importer&&) = delete;
	epub_importer& operator=(epub_importer&&) = delete;

	// Writes <output_root>/<epub name><book_suffix>/ containing book.json and images/.
	// Throws reader_exception(malformed_archive) when the file isn't a usable EPUB.
	[[nodiscard]] import_result import(const wxString& epub_path, const wxString& output_root, const wxString& book_suffix) const;

	// Drops script and style elements and points image references at images/<file name>.
	static void clean_chapter(html_tree& tree);
	[[nodiscard]] static std::string extract_plain_text(const html_tree& tree);

private:
	struct manifest_item {
		std::string path;
		std::string href;
		std::string media_type;
		std::string properties;
	};

	struct epub_context {
		wxFileInputStream& file_stream;
		std::map<std::string, std::unique_ptr<wxZipEntry>> zip_entries;
		std::map<std::string, manifest_item> manifest_items;
		std::vector<std::string> spine_items;
		std::string opf_dir;
		std::string toc_ncx_id;
		std::string nav_doc_id;
		book_metadata metadata;

		explicit epub_context(wxFileInputStream& fs) : file_stream(fs) {
		}
	};

	static std::string read_entry(const std::string& path, const epub_context& ctx);
	static void parse_opf(const std::string& filename, epub_context& ctx);
	static std::vector<toc_entry> parse_toc(const epub_context& ctx);
	static std::vector<toc_entry> parse_epub3_nav(const std::string& nav_id, const epub_context& ctx);
	static void parse_epub3_nav_list(pugi::xml_node ol_element, std::vector<toc_entry>& toc_items, const std::string& nav_dir, const epub_context& ctx);
	static std::vector<toc_entry> parse_epub2_ncx(const std::string& ncx_id, const epub_context& ctx);
	static toc_entry parse_ncx_nav_point(pugi::xml_node nav_point, const std::string& ncx_dir, const epub_context& ctx);
	static toc_entry make_toc_entry(const std::string& title, const std::string& href, const std::string& base_dir, const epub_context& ctx);
	static std::vector<chapter> build_spine(const epub_context& ctx, const std::vector<toc_entry>& toc);
	static size_t extract_images(const epub_context& ctx, const wxString& images_dir, std::map<std::string, std::string>& images);
	static bool is_html_content(const std::string& media_type);
};
