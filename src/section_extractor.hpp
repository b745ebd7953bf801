/* section_extractor.hpp - heading-bounded section extraction header file.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "html_tree.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

inline constexpr int MAX_HEADING_LEVELS = 6;

[[nodiscard]] constexpr std::optional<int> heading_level(std::string_view tag_name) noexcept {
	if (tag_name.size() == 2 && tag_name[0] == 'h' && tag_name[1] >= '1' && tag_name[1] <= '0' + MAX_HEADING_LEVELS) {
		return tag_name[1] - '0';
	}
	return std::nullopt;
}

// Returns the heading that owns target (target itself, or its nearest heading ancestor) followed by every later
// sibling up to, not including, the next heading of the same or a higher level. Without an owning heading the span
// starts at target and runs to the end of its parent's children.
[[nodiscard]] std::vector<node_id> find_section_span(const html_tree& tree, node_id target);

// Parses html, resolves anchor and serializes the owning section. nullopt means the full chapter should be shown.
[[nodiscard]] std::optional<std::string> build_subsection_content(std::string_view html, const std::optional<std::string>& anchor);
