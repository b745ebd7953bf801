/* html_tree.hpp - arena-backed HTML document model header file.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <lexbor/html/html.h>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using node_id = size_t;

struct html_attribute {
	std::string name;
	std::string value;
};

struct element_data {
	std::string tag;
	std::vector<html_attribute> attributes;
	std::vector<node_id> children;
};

struct text_data {
	std::string data;
};

struct html_node {
	std::variant<element_data, text_data> data;
	std::optional<node_id> parent;
	size_t index_in_parent{0};
	lxb_dom_node_t* handle{nullptr};
};

// A parsed HTML fragment. Nodes live in a flat arena and refer to each other by index; the root stands for the source
// document's <body>. The lexbor document stays alive alongside the arena and is what gets serialized, so every edit
// goes to both.
class html_tree {
public:
	using node_predicate = std::function<bool(const html_tree&, node_id)>;
	static constexpr node_id root_id = 0;

	~html_tree() = default;
	html_tree(const html_tree&) = delete;
	html_tree& operator=(const html_tree&) = delete;
	html_tree(html_tree&&) = default;
	html_tree& operator=(html_tree&&) = default;

	// Returns nullopt only when lexbor cannot produce a document body at all.
	[[nodiscard]] static std::optional<html_tree> parse(std::string_view html);

	[[nodiscard]] node_id root() const noexcept {
		return root_id;
	}

	[[nodiscard]] size_t size() const noexcept {
		return nodes.size();
	}

	[[nodiscard]] bool is_element(node_id id) const noexcept;
	[[nodiscard]] bool is_text(node_id id) const noexcept;
	[[nodiscard]] std::string_view tag(node_id id) const noexcept;
	[[nodiscard]] std::string_view text(node_id id) const noexcept;
	[[nodiscard]] std::span<const html_attribute> attributes(node_id id) const noexcept;
	[[nodiscard]] std::optional<std::string_view> attribute(node_id id, std::string_view name) const noexcept;
	[[nodiscard]] std::span<const node_id> children(node_id id) const noexcept;
	[[nodiscard]] std::optional<node_id> parent(node_id id) const noexcept;
	[[nodiscard]] std::optional<node_id> next_sibling(node_id id) const noexcept;
	[[nodiscard]] std::optional<node_id> previous_sibling(node_id id) const noexcept;

	// Searches the descendants of the root in document order (pre-order, depth first).
	[[nodiscard]] std::optional<node_id> find_first_matching(const node_predicate& pred) const;
	[[nodiscard]] std::vector<node_id> find_all_matching(const node_predicate& pred) const;
	[[nodiscard]] std::optional<node_id> find_by_attribute(std::string_view name, std::string_view value) const;
	// Walks strictly upward from id; the node itself is never tested.
	[[nodiscard]] std::optional<node_id> find_ancestor(node_id id, const node_predicate& pred) const;

	[[nodiscard]] std::string to_html(node_id id) const;
	[[nodiscard]] std::string to_html(std::span<const node_id> span) const;
	[[nodiscard]] std::string inner_html(node_id id) const;
	[[nodiscard]] std::string visible_text(node_id id) const;
	[[nodiscard]] std::string visible_text(std::span<const node_id> span) const;

	// Returns false, leaving the node untouched, when lexbor rejects the attribute.
	[[nodiscard]] bool set_attribute(node_id id, std::string_view name, std::string_view value);
	void remove(node_id id);

private:
	struct document_deleter {
		void operator()(lxb_html_document_t* document) const noexcept {
			if (document) {
				lxb_html_document_destroy(document);
			}
		}
	};
	using document_ptr = std::unique_ptr<lxb_html_document_t, document_deleter>;

	document_ptr doc;
	std::vector<html_node> nodes;

	explicit html_tree(document_ptr document);
	node_id append_element(node_id parent, std::string tag, std::vector<html_attribute> attributes, lxb_dom_node_t* handle);
	node_id append_text(node_id parent, std::string data, lxb_dom_node_t* handle);
	void attach(node_id parent, node_id child);
	void write_html(node_id id, std::string& out) const;
	void write_text(node_id id, std::string& out) const;
	[[nodiscard]] const element_data* element(node_id id) const noexcept;
	[[nodiscard]] element_data* element(node_id id) noexcept;
	[[nodiscard]] static bool is_script_or_style(std::string_view tag_name) noexcept;
};
