/* anchor_resolver.cpp - anchor lookup implementation.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "anchor_resolver.hpp"
#include "html_tree.hpp"
#include <optional>
#include <string>
#include <string_view>

std::optional<node_id> resolve_anchor(const html_tree& tree, std::string_view anchor) {
	if (anchor.empty()) {
		return std::nullopt;
	}
	if (auto target = tree.find_by_attribute("id", anchor)) {
		return target;
	}
	if (auto target = tree.find_by_attribute("name", anchor)) {
		return target;
	}
	const std::string link_href = "#" + std::string{anchor};
	return tree.find_first_matching([&link_href](const html_tree& t, node_id id) {
		if (t.tag(id) != "a") {
			return false;
		}
		const auto href = t.attribute(id, "href");
		return href && *href == link_href;
	});
}
