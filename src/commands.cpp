/* commands.cpp - command-line command dispatch implementation.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "commands.hpp"
#include "book.hpp"
#include "constants.hpp"
#include "epub_importer.hpp"
#include "reader_error.hpp"
#include "reader_service.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <wx/log.h>
#include <wx/translation.h>

using nlohmann::json;

namespace {
struct command_context {
	const wxArrayString& params;
	const command_options& options;
	reader_service& reader;
	std::ostream& out;
};

json optional_index(const std::optional<size_t>& index) {
	return index ? json(*index) : json(nullptr);
}

bool require_params(const command_context& ctx, size_t count, const wxString& usage) {
	if (ctx.params.GetCount() >= count) {
		return true;
	}
	wxLogError(_("Usage: %s %s"), APP_NAME.Lower(), usage);
	return false;
}

exit_status cmd_library(const command_context& ctx) {
	const auto books = ctx.reader.library();
	if (books.empty()) {
		wxLogMessage(_("No books found in %s"), ctx.reader.get_books_dir());
	}
	for (const auto& entry : books) {
		ctx.out << entry.id << '\t' << entry.title << '\t' << entry.author << '\t' << entry.chapter_count << '\n';
	}
	return exit_status::ok;
}

exit_status cmd_read(const command_context& ctx) {
	if (!require_params(ctx, 2, "read <book> [chapter]")) {
		return exit_status::usage;
	}
	long chapter_index = 0;
	if (ctx.params.GetCount() > 2 && !ctx.params[2].ToLong(&chapter_index)) {
		wxLogError(_("Invalid chapter index: %s"), ctx.params[2]);
		return exit_status::usage;
	}
	std::optional<std::string> anchor;
	if (!ctx.options.anchor.IsEmpty()) {
		anchor = ctx.options.anchor.utf8_string();
	}
	const auto view = ctx.reader.read_chapter(ctx.params[1].utf8_string(), chapter_index, anchor);
	const json result = {
		{"book_id", view.book_id},
		{"book_title", view.source->metadata.title},
		{"chapter_index", view.chapter_index},
		{"chapter_title", view.current_chapter.title()},
		{"previous_index", optional_index(view.previous_index)},
		{"next_index", optional_index(view.next_index)},
		{"anchor", view.anchor ? json(*view.anchor) : json(nullptr)},
		{"is_subsection", view.is_subsection},
		{"content", view.content()},
	};
	ctx.out << result.dump(1, '\t') << '\n';
	return exit_status::ok;
}

exit_status cmd_toc(const command_context& ctx) {
	if (!require_params(ctx, 2, "toc <book>")) {
		return exit_status::usage;
	}
	const auto b = ctx.reader.get_book(ctx.params[1].utf8_string());
	struct pending_entry {
		const toc_entry* entry;
		int depth;
	};
	std::vector<pending_entry> stack;
	for (auto it = b->toc.rbegin(); it != b->toc.rend(); ++it) {
		stack.push_back({&*it, 0});
	}
	while (!stack.empty()) {
		const auto [entry, depth] = stack.back();
		stack.pop_back();
		ctx.out << std::string(static_cast<size_t>(depth) * 2, ' ') << entry->title;
		if (const auto index = b->spine_index_for(entry->file_href)) {
			ctx.out << '\t' << *index;
			if (!entry->anchor.empty()) {
				ctx.out << '#' << entry->anchor;
			}
		}
		ctx.out << '\n';
		for (auto it = entry->children.rbegin(); it != entry->children.rend(); ++it) {
			stack.push_back({&*it, depth + 1});
		}
	}
	return exit_status::ok;
}

exit_status cmd_image(const command_context& ctx) {
	if (!require_params(ctx, 3, "image <book> <name>")) {
		return exit_status::usage;
	}
	ctx.out << ctx.reader.resolve_image(ctx.params[1].utf8_string(), ctx.params[2].utf8_string()).utf8_string() << '\n';
	return exit_status::ok;
}

exit_status cmd_import(const command_context& ctx) {
	if (!require_params(ctx, 2, "import <file.epub>")) {
		return exit_status::usage;
	}
	const wxString target = ctx.options.output_dir.IsEmpty() ? ctx.reader.get_books_dir() : ctx.options.output_dir;
	epub_importer importer;
	const auto result = importer.import(ctx.params[1], target, ctx.options.book_suffix);
	ctx.out << result.book_id << '\n';
	return exit_status::ok;
}

exit_status dispatch(const command_context& ctx) {
	const wxString& command = ctx.params[0];
	if (command == "library") {
		return cmd_library(ctx);
	}
	if (command == "read") {
		return cmd_read(ctx);
	}
	if (command == "toc") {
		return cmd_toc(ctx);
	}
	if (command == "image") {
		return cmd_image(ctx);
	}
	if (command == "import") {
		return cmd_import(ctx);
	}
	wxLogError(_("Unknown command: %s"), command);
	return exit_status::usage;
}
} // namespace

exit_status run_command(const wxArrayString& params, const command_options& options, reader_service& reader, std::ostream& out) {
	if (params.IsEmpty()) {
		wxLogError(_("No command given"));
		return exit_status::usage;
	}
	try {
		return dispatch({params, options, reader, out});
	} catch (const reader_exception& e) {
		wxLogError("%s", e.get_display_message());
		return exit_status::failure;
	}
}
