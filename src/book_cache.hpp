/* book_cache.hpp - bounded least-recently-used book cache header file.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "book.hpp"
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

class book_cache {
public:
	using loader = std::function<std::shared_ptr<const book>(const std::string& book_id)>;

	book_cache(loader load_fn, size_t capacity);
	~book_cache() = default;
	book_cache(const book_cache&) = delete;
	book_cache& operator=(const book_cache&) = delete;
	book_cache(book_cache&&) = delete;
	book_cache& operator=(book_cache&&) = delete;

	// Returns the cached book, loading it on a miss. A failed load returns nullptr and leaves nothing behind.
	[[nodiscard]] std::shared_ptr<const book> get(const std::string& book_id);
	[[nodiscard]] bool contains(const std::string& book_id) const;
	[[nodiscard]] size_t size() const;

	[[nodiscard]] size_t capacity() const noexcept {
		return max_entries;
	}

	void clear();

private:
	using entry = std::pair<std::string, std::shared_ptr<const book>>;

	loader load;
	size_t max_entries;
	mutable std::mutex mutex;
	std::list<entry> entries; // Most recently used first.
	std::unordered_map<std::string, std::list<entry>::iterator> index;
};
