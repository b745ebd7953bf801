/* section_extractor.cpp - heading-bounded section extraction implementation.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "section_extractor.hpp"
#include "anchor_resolver.hpp"
#include "html_tree.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
bool is_heading(const html_tree& tree, node_id id) {
	return heading_level(tree.tag(id)).has_value();
}
} // namespace

std::vector<node_id> find_section_span(const html_tree& tree, node_id target) {
	node_id start = target;
	auto start_level = heading_level(tree.tag(target));
	if (!start_level) {
		if (const auto owner = tree.find_ancestor(target, is_heading)) {
			start = *owner;
			start_level = heading_level(tree.tag(start));
		}
	}
	std::vector<node_id> span{start};
	for (auto sibling = tree.next_sibling(start); sibling; sibling = tree.next_sibling(*sibling)) {
		const auto level = heading_level(tree.tag(*sibling));
		if (start_level && level && *level <= *start_level) {
			break;
		}
		span.push_back(*sibling);
	}
	return span;
}

std::optional<std::string> build_subsection_content(std::string_view html, const std::optional<std::string>& anchor) {
	if (!anchor || anchor->empty()) {
		return std::nullopt;
	}
	const auto tree = html_tree::parse(html);
	if (!tree) {
		return std::nullopt;
	}
	const auto target = resolve_anchor(*tree, *anchor);
	if (!target) {
		return std::nullopt;
	}
	return tree->to_html(find_section_span(*tree, *target));
}
