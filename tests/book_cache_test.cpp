/* book_cache_test.cpp - tests for the least-recently-used book cache.
 *
 * Lectern.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "book.hpp"
#include "book_cache.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <latch>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
class counting_loader {
public:
	std::shared_ptr<const book> operator()(const std::string& book_id) {
		++loads[book_id];
		if (book_id.starts_with("missing")) {
			return nullptr;
		}
		auto b = std::make_shared<book>();
		b->metadata.title = book_id;
		return b;
	}

	std::map<std::string, int> loads;
};
} // namespace

TEST(BookCache, LoadsOnceAndServesHits) {
	counting_loader loader;
	book_cache cache([&loader](const std::string& id) { return loader(id); }, 4);
	const auto first = cache.get("alpha");
	const auto second = cache.get("alpha");
	ASSERT_NE(first, nullptr);
	EXPECT_EQ(first, second);
	EXPECT_EQ(first->metadata.title, "alpha");
	EXPECT_EQ(loader.loads["alpha"], 1);
	EXPECT_TRUE(cache.contains("alpha"));
	EXPECT_EQ(cache.size(), 1u);
}

TEST(BookCache, EvictsLeastRecentlyUsed) {
	counting_loader loader;
	book_cache cache([&loader](const std::string& id) { return loader(id); }, 2);
	(void)cache.get("a");
	(void)cache.get("b");
	(void)cache.get("a");
	(void)cache.get("c");
	EXPECT_EQ(cache.size(), 2u);
	EXPECT_TRUE(cache.contains("a"));
	EXPECT_FALSE(cache.contains("b"));
	EXPECT_TRUE(cache.contains("c"));
	(void)cache.get("b");
	EXPECT_EQ(loader.loads["b"], 2);
	EXPECT_FALSE(cache.contains("a"));
}

TEST(BookCache, FailedLoadsAreNotRemembered) {
	counting_loader loader;
	book_cache cache([&loader](const std::string& id) { return loader(id); }, 2);
	EXPECT_EQ(cache.get("missing-one"), nullptr);
	EXPECT_EQ(cache.get("missing-one"), nullptr);
	EXPECT_EQ(loader.loads["missing-one"], 2);
	EXPECT_EQ(cache.size(), 0u);
	EXPECT_FALSE(cache.contains("missing-one"));
}

TEST(BookCache, CapacityIsAtLeastOne) {
	counting_loader loader;
	book_cache cache([&loader](const std::string& id) { return loader(id); }, 0);
	EXPECT_EQ(cache.capacity(), 1u);
	(void)cache.get("a");
	(void)cache.get("b");
	EXPECT_EQ(cache.size(), 1u);
	EXPECT_TRUE(cache.contains("b"));
}

TEST(BookCache, ClearDropsEverything) {
	counting_loader loader;
	book_cache cache([&loader](const std::string& id) { return loader(id); }, 3);
	const auto held = cache.get("a");
	(void)cache.get("b");
	cache.clear();
	EXPECT_EQ(cache.size(), 0u);
	EXPECT_FALSE(cache.contains("a"));
	EXPECT_EQ(held->metadata.title, "a");
}

TEST(BookCache, ConcurrentMissesConvergeToOneEntry) {
	constexpr int thread_count = 8;
	std::atomic<int> loads{0};
	std::latch all_loading{thread_count};
	book_cache cache(
		[&loads, &all_loading](const std::string& id) {
			++loads;
			all_loading.arrive_and_wait();
			auto b = std::make_shared<book>();
			b->metadata.title = id;
			return std::shared_ptr<const book>(std::move(b));
		},
		2);
	std::vector<std::shared_ptr<const book>> results(thread_count);
	std::vector<std::thread> threads;
	for (int i = 0; i < thread_count; ++i) {
		threads.emplace_back([&cache, &results, i]() {
			results[static_cast<size_t>(i)] = cache.get("shared");
		});
	}
	for (auto& t : threads) {
		t.join();
	}
	EXPECT_EQ(loads.load(), thread_count);
	EXPECT_EQ(cache.size(), 1u);
	const auto cached = cache.get("shared");
	ASSERT_NE(cached, nullptr);
	EXPECT_EQ(cached->metadata.title, "shared");
	EXPECT_EQ(loads.load(), thread_count);
	for (const auto& result : results) {
		EXPECT_EQ(result, cached);
	}
}
