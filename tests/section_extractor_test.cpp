/* section_extractor_test.cpp - tests for heading-bounded section extraction.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "anchor_resolver.hpp"
#include "html_tree.hpp"
#include "section_extractor.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <string>

namespace {
constexpr const char* nested_sections = R"(<h2 id="a">A</h2><p>a1</p><h3 id="b">B</h3><p>b1</p><h2 id="c">C</h2><p>c1</p>)";

std::string extract(const std::string& html, const std::string& anchor) {
	return build_subsection_content(html, anchor).value_or("<none>");
}
} // namespace

static_assert(heading_level("h1") == 1);
static_assert(heading_level("h6") == 6);
static_assert(!heading_level("h7").has_value());
static_assert(!heading_level("h").has_value());
static_assert(!heading_level("hr").has_value());
static_assert(!heading_level("header").has_value());

TEST(SectionExtractor, NoAnchorMeansFullChapter) {
	EXPECT_EQ(build_subsection_content(nested_sections, std::nullopt), std::nullopt);
	EXPECT_EQ(build_subsection_content(nested_sections, std::string{}), std::nullopt);
}

TEST(SectionExtractor, UnresolvedAnchorMeansFullChapter) {
	EXPECT_EQ(build_subsection_content(nested_sections, std::string{"nowhere"}), std::nullopt);
}

TEST(SectionExtractor, HeadingSpanIncludesDeeperHeadings) {
	EXPECT_EQ(extract(nested_sections, "a"), R"(<h2 id="a">A</h2><p>a1</p><h3 id="b">B</h3><p>b1</p>)");
}

TEST(SectionExtractor, SubheadingStopsAtHigherLevelHeading) {
	EXPECT_EQ(extract(nested_sections, "b"), R"(<h3 id="b">B</h3><p>b1</p>)");
}

TEST(SectionExtractor, LastHeadingRunsToEndOfSiblings) {
	EXPECT_EQ(extract(nested_sections, "c"), R"(<h2 id="c">C</h2><p>c1</p>)");
}

TEST(SectionExtractor, StopsAtSameLevelHeading) {
	const std::string html = R"(<h2 id="x">X</h2><p>x1</p><h2>Y</h2><p>y1</p>)";
	EXPECT_EQ(extract(html, "x"), R"(<h2 id="x">X</h2><p>x1</p>)");
}

TEST(SectionExtractor, StopsAtShallowerHeading) {
	const std::string html = R"(<h3 id="x">X</h3><h4>X.1</h4><h1>Part Two</h1><p>more</p>)";
	EXPECT_EQ(extract(html, "x"), R"(<h3 id="x">X</h3><h4>X.1</h4>)");
}

TEST(SectionExtractor, TargetInsideHeadingPromotesToHeading) {
	const std::string html = R"(<h2><span id="s">A</span></h2><p>a1</p><h2>B</h2>)";
	EXPECT_EQ(extract(html, "s"), R"(<h2><span id="s">A</span></h2><p>a1</p>)");
}

TEST(SectionExtractor, NonHeadingTargetRunsToEndOfParent) {
	const std::string html = R"(<p>before</p><p id="t">target</p><p>after</p><div>more</div>)";
	EXPECT_EQ(extract(html, "t"), R"(<p id="t">target</p><p>after</p><div>more</div>)");
}

TEST(SectionExtractor, NonHeadingTargetIgnoresFollowingHeadings) {
	const std::string html = R"(<p id="t">target</p><h1>Next</h1><p>after</p>)";
	EXPECT_EQ(extract(html, "t"), R"(<p id="t">target</p><h1>Next</h1><p>after</p>)");
}

TEST(SectionExtractor, LoneTargetIsItsOwnSpan) {
	const std::string html = R"(<div><p>x</p><span id="t">only</span></div><p>outside</p>)";
	EXPECT_EQ(extract(html, "t"), R"(<span id="t">only</span>)");
}

TEST(SectionExtractor, LinkFallbackSpansFromTheLink) {
	const std::string html = R"(<p>lead <a href="#n">link</a> tail</p><p>after</p>)";
	EXPECT_EQ(extract(html, "n"), R"(<a href="#n">link</a> tail)");
}

TEST(SectionExtractor, ExtractionIsIdempotent) {
	const auto first = build_subsection_content(nested_sections, std::string{"a"});
	const auto second = build_subsection_content(nested_sections, std::string{"a"});
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(first, second);
	const auto tree = html_tree::parse(nested_sections);
	ASSERT_TRUE(tree.has_value());
	const auto target = resolve_anchor(*tree, "a");
	ASSERT_TRUE(target.has_value());
	EXPECT_EQ(tree->to_html(find_section_span(*tree, *target)), tree->to_html(find_section_span(*tree, *target)));
}

TEST(SectionExtractor, SpanReturnsNodesInDocumentOrder) {
	const auto tree = html_tree::parse(nested_sections);
	ASSERT_TRUE(tree.has_value());
	const auto target = resolve_anchor(*tree, "a");
	ASSERT_TRUE(target.has_value());
	const auto span = find_section_span(*tree, *target);
	const auto top = tree->children(tree->root());
	ASSERT_EQ(span.size(), 4u);
	for (size_t i = 0; i < span.size(); ++i) {
		EXPECT_EQ(span[i], top[i]);
	}
}

TEST(SectionExtractor, ReparsedSpanKeepsVisibleText) {
	const std::string html = R"(<h2 id="a">Caf&eacute; &amp; <em>bar</em></h2><p>x &lt; y</p><ul><li>one</li><li>two</li></ul><h2>next</h2>)";
	const auto tree = html_tree::parse(html);
	ASSERT_TRUE(tree.has_value());
	const auto target = resolve_anchor(*tree, "a");
	ASSERT_TRUE(target.has_value());
	const auto span = find_section_span(*tree, *target);
	const auto reparsed = html_tree::parse(tree->to_html(span));
	ASSERT_TRUE(reparsed.has_value());
	EXPECT_EQ(reparsed->visible_text(reparsed->root()), tree->visible_text(span));
	EXPECT_EQ(tree->visible_text(span), "Caf\xC3\xA9 & barx < yonetwo");
}

TEST(SectionExtractor, RawTextSurvivesReparse) {
	const std::string html = R"(<h2 id="a">A</h2><xmp>a<b</xmp>)";
	const auto tree = html_tree::parse(html);
	ASSERT_TRUE(tree.has_value());
	const auto target = resolve_anchor(*tree, "a");
	ASSERT_TRUE(target.has_value());
	const auto span = find_section_span(*tree, *target);
	const std::string serialized = tree->to_html(span);
	EXPECT_NE(serialized.find("<xmp>a<b</xmp>"), std::string::npos);
	const auto reparsed = html_tree::parse(serialized);
	ASSERT_TRUE(reparsed.has_value());
	EXPECT_EQ(tree->visible_text(span), "Aa<b");
	EXPECT_EQ(reparsed->visible_text(reparsed->root()), tree->visible_text(span));
}

TEST(SectionExtractor, PreLeadingNewlineSurvivesReparse) {
	const std::string html = "<h2 id=\"a\">A</h2><pre>\n\nline</pre>";
	const auto tree = html_tree::parse(html);
	ASSERT_TRUE(tree.has_value());
	const auto target = resolve_anchor(*tree, "a");
	ASSERT_TRUE(target.has_value());
	const auto span = find_section_span(*tree, *target);
	const auto reparsed = html_tree::parse(tree->to_html(span));
	ASSERT_TRUE(reparsed.has_value());
	const auto pre = reparsed->find_first_matching([](const html_tree& t, node_id id) {
		return t.tag(id) == "pre";
	});
	ASSERT_TRUE(pre.has_value());
	EXPECT_EQ(reparsed->visible_text(*pre), "\nline");
	EXPECT_EQ(reparsed->visible_text(reparsed->root()), tree->visible_text(span));
}
