/* book_cache.cpp - bounded least-recently-used book cache.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "book_cache.hpp"
#include "book.hpp"
#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <wx/log.h>
#include <wx/string.h>

book_cache::book_cache(loader load_fn, size_t capacity) : load{std::move(load_fn)}, max_entries{std::max<size_t>(capacity, 1)} {
}

std::shared_ptr<const book> book_cache::get(const std::string& book_id) {
	{
		const std::lock_guard lock(mutex);
		if (auto it = index.find(book_id); it != index.end()) {
			entries.splice(entries.begin(), entries, it->second);
			return it->second->second;
		}
	}
	// Loading happens unlocked; concurrent misses on one id may both load, and the first insert wins.
	auto loaded = load(book_id);
	if (!loaded) {
		return nullptr;
	}
	const std::lock_guard lock(mutex);
	if (auto it = index.find(book_id); it != index.end()) {
		entries.splice(entries.begin(), entries, it->second);
		return it->second->second;
	}
	entries.emplace_front(book_id, std::move(loaded));
	index[book_id] = entries.begin();
	while (entries.size() > max_entries) {
		wxLogVerbose("Evicting book %s from cache", wxString::FromUTF8(entries.back().first));
		index.erase(entries.back().first);
		entries.pop_back();
	}
	return entries.front().second;
}

bool book_cache::contains(const std::string& book_id) const {
	const std::lock_guard lock(mutex);
	return index.contains(book_id);
}

size_t book_cache::size() const {
	const std::lock_guard lock(mutex);
	return entries.size();
}

void book_cache::clear() {
	const std::lock_guard lock(mutex);
	index.clear();
	entries.clear();
}
