/* html_tree.cpp - arena-backed HTML document model implementation.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "html_tree.hpp"
#include <algorithm>
#include <cstddef>
#include <lexbor/dom/interfaces/attr.h>
#include <lexbor/dom/interfaces/element.h>
#include <lexbor/dom/interfaces/node.h>
#include <lexbor/html/html.h>
#include <lexbor/html/serialize.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {
std::string to_string(const lxb_char_t* data, size_t length) {
	return data ? std::string{reinterpret_cast<const char*>(data), length} : std::string{};
}

std::string qualified_name(lxb_dom_element_t* element) {
	size_t len = 0;
	const auto* name = lxb_dom_element_qualified_name(element, &len);
	return to_string(name, len);
}

std::vector<html_attribute> read_attributes(lxb_dom_element_t* element) {
	std::vector<html_attribute> attributes;
	for (auto* attr = lxb_dom_element_first_attribute(element); attr != nullptr; attr = lxb_dom_element_next_attribute(attr)) {
		size_t name_len = 0;
		const auto* name = lxb_dom_attr_qualified_name(attr, &name_len);
		size_t value_len = 0;
		const auto* value = lxb_dom_attr_value(attr, &value_len);
		attributes.push_back({to_string(name, name_len), to_string(value, value_len)});
	}
	return attributes;
}
} // namespace

html_tree::html_tree(document_ptr document) : doc{std::move(document)} {
}

std::optional<html_tree> html_tree::parse(std::string_view html) {
	document_ptr doc{lxb_html_document_create()};
	if (!doc) {
		return std::nullopt;
	}
	const auto status = lxb_html_document_parse(doc.get(), reinterpret_cast<const lxb_char_t*>(html.data()), html.size());
	if (status != LXB_STATUS_OK) {
		return std::nullopt;
	}
	auto* body = lxb_html_document_body_element(doc.get());
	if (body == nullptr) {
		return std::nullopt;
	}
	auto* body_node = lxb_dom_interface_node(body);
	html_tree tree{std::move(doc)};
	tree.nodes.push_back({element_data{"body", read_attributes(lxb_dom_interface_element(body)), {}}, std::nullopt, 0, body_node});
	// Children are pushed in reverse so they pop, and get attached, in source order.
	std::vector<std::pair<lxb_dom_node_t*, node_id>> pending;
	auto push_children = [&pending](lxb_dom_node_t* node, node_id parent) {
		const auto mark = pending.size();
		for (auto* child = node->first_child; child != nullptr; child = child->next) {
			pending.emplace_back(child, parent);
		}
		std::reverse(pending.begin() + static_cast<std::ptrdiff_t>(mark), pending.end());
	};
	push_children(body_node, root_id);
	while (!pending.empty()) {
		auto [node, parent_id] = pending.back();
		pending.pop_back();
		switch (node->type) {
			case LXB_DOM_NODE_TYPE_ELEMENT: {
				auto* element = lxb_dom_interface_element(node);
				const node_id id = tree.append_element(parent_id, qualified_name(element), read_attributes(element), node);
				push_children(node, id);
				break;
			}
			case LXB_DOM_NODE_TYPE_TEXT:
			case LXB_DOM_NODE_TYPE_CDATA_SECTION: {
				const auto& str = lxb_dom_interface_character_data(node)->data;
				tree.append_text(parent_id, to_string(str.data, str.length), node);
				break;
			}
			default:
				break;
		}
	}
	return tree;
}

bool html_tree::is_element(node_id id) const noexcept {
	return element(id) != nullptr;
}

bool html_tree::is_text(node_id id) const noexcept {
	return id < nodes.size() && std::holds_alternative<text_data>(nodes[id].data);
}

std::string_view html_tree::tag(node_id id) const noexcept {
	const auto* el = element(id);
	return el ? std::string_view{el->tag} : std::string_view{};
}

std::string_view html_tree::text(node_id id) const noexcept {
	if (!is_text(id)) {
		return {};
	}
	return std::get<text_data>(nodes[id].data).data;
}

std::span<const html_attribute> html_tree::attributes(node_id id) const noexcept {
	const auto* el = element(id);
	return el ? std::span<const html_attribute>{el->attributes} : std::span<const html_attribute>{};
}

std::optional<std::string_view> html_tree::attribute(node_id id, std::string_view name) const noexcept {
	for (const auto& attr : attributes(id)) {
		if (attr.name == name) {
			return std::string_view{attr.value};
		}
	}
	return std::nullopt;
}

std::span<const node_id> html_tree::children(node_id id) const noexcept {
	const auto* el = element(id);
	return el ? std::span<const node_id>{el->children} : std::span<const node_id>{};
}

std::optional<node_id> html_tree::parent(node_id id) const noexcept {
	return id < nodes.size() ? nodes[id].parent : std::nullopt;
}

std::optional<node_id> html_tree::next_sibling(node_id id) const noexcept {
	const auto parent_id = parent(id);
	if (!parent_id) {
		return std::nullopt;
	}
	const auto siblings = children(*parent_id);
	const size_t next = nodes[id].index_in_parent + 1;
	if (next >= siblings.size()) {
		return std::nullopt;
	}
	return siblings[next];
}

std::optional<node_id> html_tree::previous_sibling(node_id id) const noexcept {
	const auto parent_id = parent(id);
	if (!parent_id || nodes[id].index_in_parent == 0) {
		return std::nullopt;
	}
	return children(*parent_id)[nodes[id].index_in_parent - 1];
}

std::optional<node_id> html_tree::find_first_matching(const node_predicate& pred) const {
	const auto top = children(root_id);
	std::vector<node_id> stack(top.rbegin(), top.rend());
	while (!stack.empty()) {
		const node_id id = stack.back();
		stack.pop_back();
		if (pred(*this, id)) {
			return id;
		}
		const auto kids = children(id);
		stack.insert(stack.end(), kids.rbegin(), kids.rend());
	}
	return std::nullopt;
}

std::vector<node_id> html_tree::find_all_matching(const node_predicate& pred) const {
	std::vector<node_id> matches;
	const auto top = children(root_id);
	std::vector<node_id> stack(top.rbegin(), top.rend());
	while (!stack.empty()) {
		const node_id id = stack.back();
		stack.pop_back();
		if (pred(*this, id)) {
			matches.push_back(id);
		}
		const auto kids = children(id);
		stack.insert(stack.end(), kids.rbegin(), kids.rend());
	}
	return matches;
}

std::optional<node_id> html_tree::find_by_attribute(std::string_view name, std::string_view value) const {
	return find_first_matching([name, value](const html_tree& tree, node_id id) {
		const auto attr = tree.attribute(id, name);
		return attr && *attr == value;
	});
}

std::optional<node_id> html_tree::find_ancestor(node_id id, const node_predicate& pred) const {
	for (auto current = parent(id); current; current = parent(*current)) {
		if (pred(*this, *current)) {
			return current;
		}
	}
	return std::nullopt;
}

std::string html_tree::to_html(node_id id) const {
	std::string out;
	write_html(id, out);
	return out;
}

std::string html_tree::to_html(std::span<const node_id> span) const {
	std::string out;
	for (const node_id id : span) {
		write_html(id, out);
	}
	return out;
}

std::string html_tree::inner_html(node_id id) const {
	return to_html(children(id));
}

std::string html_tree::visible_text(node_id id) const {
	std::string out;
	write_text(id, out);
	return out;
}

std::string html_tree::visible_text(std::span<const node_id> span) const {
	std::string out;
	for (const node_id id : span) {
		write_text(id, out);
	}
	return out;
}

bool html_tree::set_attribute(node_id id, std::string_view name, std::string_view value) {
	auto* el = element(id);
	if (el == nullptr) {
		return false;
	}
	auto* attr = lxb_dom_element_set_attribute(lxb_dom_interface_element(nodes[id].handle), reinterpret_cast<const lxb_char_t*>(name.data()), name.size(), reinterpret_cast<const lxb_char_t*>(value.data()), value.size());
	if (attr == nullptr) {
		return false;
	}
	for (auto& existing : el->attributes) {
		if (existing.name == name) {
			existing.value = value;
			return true;
		}
	}
	el->attributes.push_back({std::string{name}, std::string{value}});
	return true;
}

void html_tree::remove(node_id id) {
	const auto parent_id = parent(id);
	if (!parent_id) {
		return;
	}
	auto& siblings = element(*parent_id)->children;
	const size_t index = nodes[id].index_in_parent;
	siblings.erase(siblings.begin() + static_cast<std::ptrdiff_t>(index));
	for (size_t i = index; i < siblings.size(); ++i) {
		nodes[siblings[i]].index_in_parent = i;
	}
	nodes[id].parent.reset();
	nodes[id].index_in_parent = 0;
	lxb_dom_node_remove(nodes[id].handle);
}

node_id html_tree::append_element(node_id parent, std::string tag, std::vector<html_attribute> attributes, lxb_dom_node_t* handle) {
	const node_id id = nodes.size();
	nodes.push_back({element_data{std::move(tag), std::move(attributes), {}}, std::nullopt, 0, handle});
	attach(parent, id);
	return id;
}

node_id html_tree::append_text(node_id parent, std::string data, lxb_dom_node_t* handle) {
	const node_id id = nodes.size();
	nodes.push_back({text_data{std::move(data)}, std::nullopt, 0, handle});
	attach(parent, id);
	return id;
}

void html_tree::attach(node_id parent, node_id child) {
	auto& siblings = element(parent)->children;
	nodes[child].parent = parent;
	nodes[child].index_in_parent = siblings.size();
	siblings.push_back(child);
}

void html_tree::write_html(node_id id, std::string& out) const {
	if (id >= nodes.size() || nodes[id].handle == nullptr) {
		return;
	}
	lexbor_str_t str{};
	if (lxb_html_serialize_tree_str(nodes[id].handle, &str) == LXB_STATUS_OK && str.data != nullptr) {
		out.append(reinterpret_cast<const char*>(str.data), str.length);
	}
	if (str.data != nullptr) {
		lexbor_str_destroy(&str, doc->dom_document.text, false);
	}
}

void html_tree::write_text(node_id id, std::string& out) const {
	std::vector<node_id> stack{id};
	while (!stack.empty()) {
		const node_id current = stack.back();
		stack.pop_back();
		if (is_text(current)) {
			out += text(current);
			continue;
		}
		if (is_script_or_style(tag(current))) {
			continue;
		}
		const auto kids = children(current);
		stack.insert(stack.end(), kids.rbegin(), kids.rend());
	}
}

const element_data* html_tree::element(node_id id) const noexcept {
	return id < nodes.size() ? std::get_if<element_data>(&nodes[id].data) : nullptr;
}

element_data* html_tree::element(node_id id) noexcept {
	return id < nodes.size() ? std::get_if<element_data>(&nodes[id].data) : nullptr;
}

bool html_tree::is_script_or_style(std::string_view tag_name) noexcept {
	return tag_name == "script" || tag_name == "style";
}
