/* chapter_nav.cpp - spine bounds checking and adjacency.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "chapter_nav.hpp"
#include "book.hpp"
#include <cstddef>
#include <optional>
#include <span>
#include <utility>

const chapter* get_chapter(std::span<const chapter> spine, long index) noexcept {
	if (index < 0 || std::cmp_greater_equal(index, spine.size())) {
		return nullptr;
	}
	return &spine[static_cast<size_t>(index)];
}

std::optional<size_t> previous_index(size_t index) noexcept {
	if (index == 0) {
		return std::nullopt;
	}
	return index - 1;
}

std::optional<size_t> next_index(size_t index, size_t length) noexcept {
	if (length == 0 || index >= length - 1) {
		return std::nullopt;
	}
	return index + 1;
}
