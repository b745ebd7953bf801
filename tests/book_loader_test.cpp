/* book_loader_test.cpp - tests for the on-disk book archive.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "book.hpp"
#include "book_loader.hpp"
#include "constants.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <wx/filename.h>
#include <wx/log.h>

namespace {
book sample_book() {
	book b;
	b.metadata.title = "Sample";
	b.metadata.authors = {"Ada", "Grace"};
	b.metadata.language = "en";
	b.spine.emplace_back("ch1", "text/ch1.xhtml", "One", "<h1>One</h1><p>first</p>", "One\nfirst", 0);
	b.spine.emplace_back("ch2", "text/ch2.xhtml", "Two", "<h1>Two</h1>", "Two", 1);
	toc_entry part{"Part", "text/ch1.xhtml", "text/ch1.xhtml", "", {}};
	part.children.push_back({"Section", "text/ch2.xhtml#s1", "text/ch2.xhtml", "s1", {}});
	b.toc.push_back(part);
	b.images["cover.png"] = "images/cover.png";
	b.source_file = "sample.epub";
	b.version = BOOK_FORMAT_VERSION;
	return b;
}
} // namespace

TEST(BookLoader, ParsesMinimalArchive) {
	const auto parsed = parse_book_json(R"({"spine": [{"id": "c", "content": "<p>x</p>"}]})");
	ASSERT_TRUE(parsed.has_value());
	EXPECT_EQ(parsed->metadata.title, "Untitled");
	ASSERT_EQ(parsed->spine.size(), 1u);
	EXPECT_EQ(parsed->spine[0].id(), "c");
	EXPECT_EQ(parsed->spine[0].content(), "<p>x</p>");
	EXPECT_EQ(parsed->spine[0].order(), 0);
	EXPECT_TRUE(parsed->toc.empty());
}

TEST(BookLoader, RejectsMalformedArchives) {
	EXPECT_FALSE(parse_book_json("not json").has_value());
	EXPECT_FALSE(parse_book_json("[]").has_value());
	EXPECT_FALSE(parse_book_json(R"({"metadata": {"title": "No spine"}})").has_value());
	EXPECT_FALSE(parse_book_json(R"({"spine": {"id": "c"}})").has_value());
}

TEST(BookLoader, SerializedArchiveKeepsStructure) {
	const auto parsed = parse_book_json(serialize_book_json(sample_book()));
	ASSERT_TRUE(parsed.has_value());
	EXPECT_EQ(parsed->metadata.author_line(), "Ada, Grace");
	ASSERT_EQ(parsed->spine.size(), 2u);
	EXPECT_EQ(parsed->spine[1].title(), "Two");
	ASSERT_EQ(parsed->toc.size(), 1u);
	ASSERT_EQ(parsed->toc[0].children.size(), 1u);
	EXPECT_EQ(parsed->toc[0].children[0].anchor, "s1");
	EXPECT_EQ(parsed->images.at("cover.png"), "images/cover.png");
	EXPECT_EQ(parsed->version, BOOK_FORMAT_VERSION);
}

TEST(BookLoader, NestedTocKeepsOrderAndDepth) {
	constexpr int depth = 500;
	book b = sample_book();
	toc_entry* level = &b.toc[0];
	for (int i = 0; i < depth; ++i) {
		level->children.push_back({"Sibling " + std::to_string(i), "text/ch2.xhtml", "text/ch2.xhtml", "", {}});
		level->children.push_back({"Level " + std::to_string(i), "text/ch1.xhtml", "text/ch1.xhtml", "", {}});
		level = &level->children.back();
	}
	const auto parsed = parse_book_json(serialize_book_json(b));
	ASSERT_TRUE(parsed.has_value());
	ASSERT_EQ(parsed->toc.size(), 1u);
	const toc_entry* current = &parsed->toc[0];
	EXPECT_EQ(current->children.front().anchor, "s1");
	for (int i = 0; i < depth; ++i) {
		ASSERT_EQ(current->children.size(), i == 0 ? 3u : 2u);
		const auto& kids = current->children;
		EXPECT_EQ(kids[kids.size() - 2].title, "Sibling " + std::to_string(i));
		EXPECT_EQ(kids.back().title, "Level " + std::to_string(i));
		current = &kids.back();
	}
	EXPECT_TRUE(current->children.empty());
}

TEST(BookLoader, SpineIndexForFileHref) {
	const auto b = sample_book();
	EXPECT_EQ(b.spine_index_for("text/ch2.xhtml"), 1u);
	EXPECT_EQ(b.spine_index_for("text/ch3.xhtml"), std::nullopt);
}

TEST(BookLoader, BookDirectoryRejectsPaths) {
	EXPECT_TRUE(book_directory("/books", "").IsEmpty());
	EXPECT_TRUE(book_directory("/books", "..").IsEmpty());
	EXPECT_TRUE(book_directory("/books", "../etc").IsEmpty());
	EXPECT_TRUE(book_directory("/books", "a/b").IsEmpty());
	EXPECT_FALSE(book_directory("/books", "novel_data").IsEmpty());
}

TEST(BookLoader, SavesAndLoadsFromDirectory) {
	const temp_dir books;
	ASSERT_TRUE(save_book(sample_book(), books.join("sample_data")));
	EXPECT_TRUE(wxFileName::FileExists(books.join("sample_data") + wxFileName::GetPathSeparator() + BOOK_FILE_NAME));
	const auto loaded = load_book(books.get_path(), "sample_data");
	ASSERT_NE(loaded, nullptr);
	EXPECT_EQ(loaded->metadata.title, "Sample");
	EXPECT_EQ(loaded->spine.size(), 2u);
}

TEST(BookLoader, MissingOrCorruptBooksLoadAsAbsent) {
	const temp_dir books;
	EXPECT_EQ(load_book(books.get_path(), "nothing_data"), nullptr);
	EXPECT_EQ(load_book(books.get_path(), "../nothing_data"), nullptr);
	ASSERT_TRUE(wxFileName::Mkdir(books.join("broken_data")));
	ASSERT_TRUE(write_file(books.join("broken_data") + wxFileName::GetPathSeparator() + BOOK_FILE_NAME, "{\"spine\": ["));
	const wxLogNull no_log;
	EXPECT_EQ(load_book(books.get_path(), "broken_data"), nullptr);
}
