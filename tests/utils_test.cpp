/* utils_test.cpp - tests for string and path helpers.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "test_helpers.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <string>

TEST(Utils, CollapseWhitespaceAndTrim) {
	EXPECT_EQ(collapse_whitespace("a \t\n b\xC2\xA0\xC2\xA0" "c"), "a b c");
	EXPECT_EQ(trim_string("  padded\n"), "padded");
	EXPECT_EQ(trim_string(" \t "), "");
}

TEST(Utils, RemoveSoftHyphens) {
	EXPECT_EQ(remove_soft_hyphens("hy\xC2\xADphen\xC2\xAD"), "hyphen");
}

TEST(Utils, UrlDecode) {
	EXPECT_EQ(url_decode("chapter%201.xhtml"), "chapter 1.xhtml");
	EXPECT_EQ(url_decode("%E2%80%94"), "\xE2\x80\x94");
	EXPECT_EQ(url_decode("bad%zzescape%2"), "bad%zzescape%2");
	EXPECT_EQ(url_decode("a+b"), "a+b");
}

TEST(Utils, JoinStrings) {
	EXPECT_EQ(join_strings({}, ", "), "");
	EXPECT_EQ(join_strings({"one"}, ", "), "one");
	EXPECT_EQ(join_strings({"one", "two", "three"}, ", "), "one, two, three");
}

TEST(Utils, SafePathComponentKeepsOnlyBaseName) {
	EXPECT_EQ(safe_path_component("cover.png"), "cover.png");
	EXPECT_EQ(safe_path_component("../../etc/passwd"), "passwd");
	EXPECT_EQ(safe_path_component("..\\..\\boot.ini"), "boot.ini");
	EXPECT_EQ(safe_path_component(".."), "");
	EXPECT_EQ(safe_path_component("."), "");
	EXPECT_EQ(safe_path_component("dir/"), "");
	EXPECT_EQ(safe_path_component(""), "");
}

TEST(Utils, ResolveRelativePath) {
	EXPECT_EQ(resolve_relative_path("OEBPS/text", "../images/a.png"), "OEBPS/images/a.png");
	EXPECT_EQ(resolve_relative_path("OEBPS", "./ch1.xhtml"), "OEBPS/ch1.xhtml");
	EXPECT_EQ(resolve_relative_path("", "ch1.xhtml"), "ch1.xhtml");
	EXPECT_EQ(resolve_relative_path("OEBPS", "/root.xhtml"), "root.xhtml");
	EXPECT_EQ(resolve_relative_path("a", "../../b"), "b");
}

TEST(Utils, ParentDirectory) {
	EXPECT_EQ(parent_directory("OEBPS/content.opf"), "OEBPS");
	EXPECT_EQ(parent_directory("a/b/c"), "a/b");
	EXPECT_EQ(parent_directory("content.opf"), "");
}

TEST(Utils, ReadAndWriteFiles) {
	const temp_dir dir;
	const wxString path = dir.join("data.bin");
	EXPECT_EQ(read_file(path), std::nullopt);
	const std::string payload("bytes\0with nul", 14);
	ASSERT_TRUE(write_file(path, payload));
	EXPECT_EQ(read_file(path), payload);
	ASSERT_TRUE(write_file(path, ""));
	EXPECT_EQ(read_file(path), std::string{});
}
