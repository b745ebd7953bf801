/* epub_importer.cpp - EPUB to book archive conversion.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub_importer.hpp"
#include "book.hpp"
#include "book_loader.hpp"
#include "constants.hpp"
#include "html_tree.hpp"
#include "reader_error.hpp"
#include "section_extractor.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/datetime.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace {
struct text_collector : pugi::xml_tree_walker {
	std::string text;

	bool for_each(pugi::xml_node& node) override {
		if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
			text += node.value();
		}
		return true;
	}
};

std::string node_text(pugi::xml_node node) {
	text_collector collector;
	node.traverse(collector);
	return trim_string(collapse_whitespace(collector.text));
}

std::string local_name(std::string_view name) {
	const auto pos = name.find(':');
	return std::string{pos == std::string_view::npos ? name : name.substr(pos + 1)};
}

bool is_external_reference(std::string_view ref) {
	return ref.starts_with("data:") || ref.find("://") != std::string_view::npos;
}

constexpr bool is_block_element(std::string_view tag_name) noexcept {
	constexpr std::array block_elements = {
		"address",
		"article",
		"aside",
		"blockquote",
		"dd",
		"div",
		"dl",
		"dt",
		"figcaption",
		"figure",
		"footer",
		"h1",
		"h2",
		"h3",
		"h4",
		"h5",
		"h6",
		"header",
		"hr",
		"li",
		"main",
		"nav",
		"ol",
		"p",
		"pre",
		"section",
		"table",
		"td",
		"th",
		"tr",
		"ul",
	};
	return std::find(block_elements.begin(), block_elements.end(), tag_name) != block_elements.end();
}

void flatten_toc_titles(const std::vector<toc_entry>& entries, std::map<std::string, std::string>& titles) {
	std::vector<const toc_entry*> stack;
	for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
		stack.push_back(&*it);
	}
	while (!stack.empty()) {
		const auto* entry = stack.back();
		stack.pop_back();
		if (!entry->file_href.empty() && !entry->title.empty()) {
			titles.emplace(entry->file_href, entry->title);
		}
		for (auto it = entry->children.rbegin(); it != entry->children.rend(); ++it) {
			stack.push_back(&*it);
		}
	}
}
} // namespace

import_result epub_importer::import(const wxString& epub_path, const wxString& output_root, const wxString& book_suffix) const {
	wxFileInputStream fp(epub_path);
	if (!fp.IsOk()) {
		throw reader_exception(_("Failed to open EPUB file"), epub_path, reader_error_code::malformed_archive);
	}
	epub_context ctx(fp);
	{
		wxZipInputStream zip_index(fp);
		while (wxZipEntry* entry = zip_index.GetNextEntry()) {
			const std::string name = entry->GetName(wxPATH_UNIX).utf8_string();
			ctx.zip_entries[name] = std::unique_ptr<wxZipEntry>(entry);
		}
	}
	if (ctx.zip_entries.empty()) {
		throw reader_exception(_("Not a zip archive"), epub_path, reader_error_code::malformed_archive);
	}
	const std::string container_content = read_entry("META-INF/container.xml", ctx);
	pugi::xml_document container;
	if (container_content.empty() || !container.load_buffer(container_content.data(), container_content.size())) {
		throw reader_exception(_("Missing or invalid META-INF/container.xml"), epub_path, reader_error_code::malformed_archive);
	}
	auto rootfile = container.child("container").child("rootfiles").child("rootfile");
	if (rootfile == nullptr) {
		rootfile = container.find_node([](pugi::xml_node n) {
			return local_name(n.name()) == "rootfile";
		});
	}
	const std::string opf_filename = rootfile.attribute("full-path").as_string();
	if (opf_filename.empty()) {
		throw reader_exception(_("No OPF file found"), epub_path, reader_error_code::malformed_archive);
	}
	ctx.opf_dir = parent_directory(opf_filename);
	parse_opf(opf_filename, ctx);
	import_result result;
	result.imported.metadata = ctx.metadata;
	result.imported.toc = parse_toc(ctx);
	result.imported.spine = build_spine(ctx, result.imported.toc);
	if (result.imported.spine.empty()) {
		throw reader_exception(_("The book has no readable chapters"), epub_path, reader_error_code::malformed_archive);
	}
	if (result.imported.toc.empty()) {
		for (const auto& ch : result.imported.spine) {
			result.imported.toc.push_back({ch.title(), ch.href(), ch.href(), {}, {}});
		}
	}
	const wxFileName source(epub_path);
	result.book_id = (source.GetName() + book_suffix).utf8_string();
	result.directory = output_root + wxFileName::GetPathSeparator() + wxString::FromUTF8(result.book_id);
	const wxString images_dir = result.directory + wxFileName::GetPathSeparator() + IMAGES_DIR_NAME;
	if (!wxFileName::DirExists(images_dir) && !wxFileName::Mkdir(images_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
		throw reader_exception(_("Couldn't create output directory"), images_dir);
	}
	result.image_count = extract_images(ctx, images_dir, result.imported.images);
	result.imported.source_file = source.GetFullName().utf8_string();
	result.imported.processed_at = wxDateTime::Now().FormatISOCombined().utf8_string();
	result.imported.version = BOOK_FORMAT_VERSION;
	if (!save_book(result.imported, result.directory)) {
		throw reader_exception(_("Couldn't write book archive"), result.directory);
	}
	wxLogMessage("Imported %s: %zu chapters, %zu images", source.GetFullName(), result.imported.spine.size(), result.image_count);
	return result;
}

void epub_importer::clean_chapter(html_tree& tree) {
	const auto removable = tree.find_all_matching([](const html_tree& t, node_id id) {
		return t.tag(id) == "script" || t.tag(id) == "style";
	});
	for (const node_id id : removable) {
		tree.remove(id);
	}
	const auto images = tree.find_all_matching([](const html_tree& t, node_id id) {
		return t.tag(id) == "img" || t.tag(id) == "image";
	});
	for (const node_id id : images) {
		for (const char* attr_name : {"src", "href", "xlink:href"}) {
			const auto value = tree.attribute(id, attr_name);
			if (!value || value->empty() || is_external_reference(*value)) {
				continue;
			}
			std::string path{*value};
			path = path.substr(0, path.find('#'));
			const std::string name = safe_path_component(url_decode(path));
			if (!name.empty()) {
				if (!tree.set_attribute(id, attr_name, "images/" + name)) {
					wxLogWarning("Couldn't rewrite image reference %s", wxString::FromUTF8(*value));
				}
			}
		}
	}
}

std::string epub_importer::extract_plain_text(const html_tree& tree) {
	const auto text_nodes = tree.find_all_matching([](const html_tree& t, node_id id) {
		return t.is_text(id);
	});
	std::string result;
	std::optional<node_id> previous_block;
	for (const node_id id : text_nodes) {
		const std::string fragment = trim_string(collapse_whitespace(remove_soft_hyphens(tree.text(id))));
		if (fragment.empty()) {
			continue;
		}
		const auto block = tree.find_ancestor(id, [](const html_tree& t, node_id n) {
			return is_block_element(t.tag(n));
		});
		if (!result.empty()) {
			result += block == previous_block ? ' ' : '\n';
		}
		result += fragment;
		previous_block = block;
	}
	return result;
}

std::string epub_importer::read_entry(const std::string& path, const epub_context& ctx) {
	wxZipEntry* entry = find_zip_entry(path, ctx.zip_entries);
	if (entry == nullptr) {
		return {};
	}
	ctx.file_stream.SeekI(0);
	wxZipInputStream zis(ctx.file_stream);
	if (!zis.OpenEntry(*entry)) {
		return {};
	}
	return read_zip_entry(zis);
}

void epub_importer::parse_opf(const std::string& filename, epub_context& ctx) {
	const std::string opf_content = read_entry(filename, ctx);
	if (opf_content.empty()) {
		throw reader_exception(_("Failed to open OPF file"), wxString::FromUTF8(filename), reader_error_code::malformed_archive);
	}
	pugi::xml_document doc;
	if (!doc.load_buffer(opf_content.data(), opf_content.size())) {
		throw reader_exception(_("Invalid OPF"), wxString::FromUTF8(filename), reader_error_code::malformed_archive);
	}
	auto package = doc.child("package");
	if (package == nullptr) {
		package = doc.first_child();
	}
	auto& meta = ctx.metadata;
	bool have_title = false;
	if (auto metadata = package.child("metadata")) {
		for (auto child : metadata.children()) {
			const std::string name = local_name(child.name());
			const std::string value = trim_string(collapse_whitespace(child.text().as_string()));
			if (value.empty()) {
				continue;
			}
			if (name == "title" && !have_title) {
				meta.title = value;
				have_title = true;
			} else if (name == "creator") {
				meta.authors.push_back(value);
			} else if (name == "language" && meta.language.empty()) {
				meta.language = value;
			} else if (name == "description" && meta.description.empty()) {
				meta.description = value;
			} else if (name == "publisher" && meta.publisher.empty()) {
				meta.publisher = value;
			} else if (name == "date" && meta.date.empty()) {
				meta.date = value;
			} else if (name == "identifier") {
				meta.identifiers.push_back(value);
			} else if (name == "subject") {
				meta.subjects.push_back(value);
			}
		}
	}
	auto manifest = package.child("manifest");
	if (manifest == nullptr) {
		throw reader_exception(_("No manifest"), wxString::FromUTF8(filename), reader_error_code::malformed_archive);
	}
	for (auto item_node : manifest.children("item")) {
		manifest_item item;
		item.href = item_node.attribute("href").as_string();
		item.path = resolve_relative_path(ctx.opf_dir, url_decode(item.href));
		item.media_type = item_node.attribute("media-type").as_string();
		item.properties = item_node.attribute("properties").as_string();
		const std::string id = item_node.attribute("id").as_string();
		if (item.media_type == "application/x-dtbncx+xml") {
			ctx.toc_ncx_id = id;
		} else if (item.properties.find("nav") != std::string::npos) {
			ctx.nav_doc_id = id;
		}
		ctx.manifest_items.emplace(id, std::move(item));
	}
	auto spine = package.child("spine");
	if (spine == nullptr) {
		throw reader_exception(_("No spine"), wxString::FromUTF8(filename), reader_error_code::malformed_archive);
	}
	if (ctx.toc_ncx_id.empty()) {
		const std::string toc_attr = spine.attribute("toc").as_string();
		if (!toc_attr.empty()) {
			ctx.toc_ncx_id = toc_attr;
		}
	}
	for (auto itemref : spine.children("itemref")) {
		ctx.spine_items.push_back(itemref.attribute("idref").as_string());
	}
}

std::vector<toc_entry> epub_importer::parse_toc(const epub_context& ctx) {
	std::vector<toc_entry> toc;
	if (!ctx.nav_doc_id.empty()) {
		toc = parse_epub3_nav(ctx.nav_doc_id, ctx);
	}
	if (toc.empty() && !ctx.toc_ncx_id.empty()) {
		toc = parse_epub2_ncx(ctx.toc_ncx_id, ctx);
	}
	if (toc.empty()) {
		wxLogVerbose("No usable table of contents, falling back to one entry per chapter");
	}
	return toc;
}

std::vector<toc_entry> epub_importer::parse_epub3_nav(const std::string& nav_id, const epub_context& ctx) {
	std::vector<toc_entry> toc;
	auto it = ctx.manifest_items.find(nav_id);
	if (it == ctx.manifest_items.end()) {
		return toc;
	}
	const auto& nav_file = it->second.path;
	const std::string nav_content = read_entry(nav_file, ctx);
	pugi::xml_document doc;
	if (nav_content.empty() || !doc.load_buffer(nav_content.data(), nav_content.size())) {
		wxLogWarning("Couldn't parse navigation document %s", wxString::FromUTF8(nav_file));
		return toc;
	}
	auto toc_nav = doc.find_node([](pugi::xml_node n) {
		return std::string_view{n.name()} == "nav" && std::string_view{n.attribute("epub:type").as_string()} == "toc";
	});
	if (toc_nav == nullptr) {
		toc_nav = doc.find_node([](pugi::xml_node n) {
			return std::string_view{n.name()} == "nav";
		});
	}
	if (toc_nav) {
		if (auto ol = toc_nav.child("ol")) {
			parse_epub3_nav_list(ol, toc, parent_directory(nav_file), ctx);
		}
	}
	return toc;
}

void epub_importer::parse_epub3_nav_list(pugi::xml_node ol_element, std::vector<toc_entry>& toc_items, const std::string& nav_dir, const epub_context& ctx) {
	for (auto li : ol_element.children("li")) {
		toc_entry item;
		if (auto a = li.child("a")) {
			item = make_toc_entry(node_text(a), a.attribute("href").as_string(), nav_dir, ctx);
		} else if (auto span = li.child("span")) {
			item.title = node_text(span);
		}
		if (auto ol = li.child("ol")) {
			parse_epub3_nav_list(ol, item.children, nav_dir, ctx);
		}
		if (!item.title.empty() || !item.children.empty()) {
			toc_items.push_back(std::move(item));
		}
	}
}

std::vector<toc_entry> epub_importer::parse_epub2_ncx(const std::string& ncx_id, const epub_context& ctx) {
	std::vector<toc_entry> toc;
	auto it = ctx.manifest_items.find(ncx_id);
	if (it == ctx.manifest_items.end()) {
		return toc;
	}
	const auto& ncx_file = it->second.path;
	const std::string ncx_content = read_entry(ncx_file, ctx);
	pugi::xml_document doc;
	if (ncx_content.empty() || !doc.load_buffer(ncx_content.data(), ncx_content.size())) {
		wxLogWarning("Couldn't parse NCX table of contents %s", wxString::FromUTF8(ncx_file));
		return toc;
	}
	auto nav_map = doc.child("ncx").child("navMap");
	for (auto nav_point : nav_map.children("navPoint")) {
		toc.push_back(parse_ncx_nav_point(nav_point, parent_directory(ncx_file), ctx));
	}
	return toc;
}

toc_entry epub_importer::parse_ncx_nav_point(pugi::xml_node nav_point, const std::string& ncx_dir, const epub_context& ctx) {
	const std::string title = node_text(nav_point.child("navLabel").child("text"));
	const std::string src = nav_point.child("content").attribute("src").as_string();
	toc_entry item = make_toc_entry(title, src, ncx_dir, ctx);
	for (auto child : nav_point.children("navPoint")) {
		item.children.push_back(parse_ncx_nav_point(child, ncx_dir, ctx));
	}
	return item;
}

toc_entry epub_importer::make_toc_entry(const std::string& title, const std::string& href, const std::string& base_dir, const epub_context& ctx) {
	toc_entry item;
	item.title = title;
	if (href.empty()) {
		return item;
	}
	const auto hash_pos = href.find('#');
	const std::string file_part = href.substr(0, hash_pos);
	if (hash_pos != std::string::npos) {
		item.anchor = url_decode(href.substr(hash_pos + 1));
	}
	std::string full_path = file_part.empty() ? std::string{} : resolve_relative_path(base_dir, url_decode(file_part));
	if (!ctx.opf_dir.empty() && full_path.starts_with(ctx.opf_dir + "/")) {
		full_path.erase(0, ctx.opf_dir.size() + 1);
	}
	item.file_href = full_path;
	item.href = item.anchor.empty() ? full_path : full_path + "#" + item.anchor;
	return item;
}

std::vector<chapter> epub_importer::build_spine(const epub_context& ctx, const std::vector<toc_entry>& toc) {
	std::map<std::string, std::string> toc_titles;
	flatten_toc_titles(toc, toc_titles);
	std::vector<chapter> spine;
	for (const auto& idref : ctx.spine_items) {
		auto it = ctx.manifest_items.find(idref);
		if (it == ctx.manifest_items.end()) {
			wxLogWarning("Spine item %s is missing from the manifest", wxString::FromUTF8(idref));
			continue;
		}
		const auto& item = it->second;
		if (!is_html_content(item.media_type)) {
			continue;
		}
		const std::string content = read_entry(item.path, ctx);
		auto tree = html_tree::parse(content);
		if (!tree) {
			wxLogWarning("Couldn't parse chapter %s", wxString::FromUTF8(item.path));
			continue;
		}
		clean_chapter(*tree);
		std::string href = item.path;
		if (!ctx.opf_dir.empty() && href.starts_with(ctx.opf_dir + "/")) {
			href.erase(0, ctx.opf_dir.size() + 1);
		}
		std::string title;
		if (auto toc_title = toc_titles.find(href); toc_title != toc_titles.end()) {
			title = toc_title->second;
		} else if (const auto heading = tree->find_first_matching([](const html_tree& t, node_id id) { return heading_level(t.tag(id)).has_value(); })) {
			title = trim_string(collapse_whitespace(tree->visible_text(*heading)));
		}
		if (title.empty()) {
			title = href;
		}
		spine.emplace_back(idref, href, title, tree->inner_html(tree->root()), extract_plain_text(*tree), static_cast<int>(spine.size()));
	}
	return spine;
}

size_t epub_importer::extract_images(const epub_context& ctx, const wxString& images_dir, std::map<std::string, std::string>& images) {
	size_t count = 0;
	for (const auto& [id, item] : ctx.manifest_items) {
		if (!item.media_type.starts_with("image/")) {
			continue;
		}
		const std::string name = safe_path_component(item.path);
		const std::string data = read_entry(item.path, ctx);
		if (name.empty() || data.empty()) {
			wxLogWarning("Skipping unreadable image %s", wxString::FromUTF8(item.path));
			continue;
		}
		const wxString target = images_dir + wxFileName::GetPathSeparator() + wxString::FromUTF8(name);
		if (!write_file(target, data)) {
			wxLogWarning("Couldn't write image %s", target);
			continue;
		}
		images[name] = "images/" + name;
		++count;
	}
	return count;
}

bool epub_importer::is_html_content(const std::string& media_type) {
	return media_type == "application/xhtml+xml" || media_type == "text/html";
}
