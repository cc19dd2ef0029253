#include "signature_cache.h"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

namespace {

TEST(SignatureCacheTest, ObjectSignature) {
	EXPECT_EQ("Ljava/lang/String;", SignatureCache::objectSignature("java.lang.String"));
	EXPECT_EQ("LFoo;", SignatureCache::objectSignature("Foo"));
	EXPECT_EQ("La/b/C$D;", SignatureCache::objectSignature("a.b.C$D"));
}

TEST(SignatureCacheTest, MissStoresEntry) {
	SignatureCache cache;
	EXPECT_EQ(0u, cache.size());
	EXPECT_EQ("Ljava/util/List;", cache.getOrCompute("java.util.List"));
	EXPECT_EQ(1u, cache.size());
	EXPECT_EQ("Ljava/util/List;", cache.getOrCompute("java.util.List"));
	EXPECT_EQ(1u, cache.size());
	EXPECT_EQ("Ljava/util/Map;", cache.getOrCompute("java.util.Map"));
	EXPECT_EQ(2u, cache.size());
}

TEST(SignatureCacheTest, ClearEmptiesAndRecomputes) {
	SignatureCache cache;
	std::string before = cache.getOrCompute("java.lang.Object");
	cache.clear();
	EXPECT_EQ(0u, cache.size());
	EXPECT_EQ(before, cache.getOrCompute("java.lang.Object"));
}

TEST(SignatureCacheTest, SharedInstanceIsStable) {
	EXPECT_EQ(&SignatureCache::shared(), &SignatureCache::shared());
}

TEST(SignatureCacheTest, ConcurrentMissesConverge) {
	SignatureCache cache;
	const int kThreads = 8;
	const int kNames = 64;

	std::vector<std::vector<std::string>> seen(kThreads);
	std::vector<std::thread> threads;
	for (int t = 0; t < kThreads; ++t) {
		threads.emplace_back([&cache, &seen, t, kNames]() {
			for (int i = 0; i < kNames; ++i) {
				seen[t].push_back(cache.getOrCompute("pkg.Class" + std::to_string(i)));
			}
		});
	}
	for (auto& thread : threads) {
		thread.join();
	}

	EXPECT_EQ(static_cast<size_t>(kNames), cache.size());
	for (int t = 1; t < kThreads; ++t) {
		EXPECT_EQ(seen[0], seen[t]);
	}
	EXPECT_EQ("Lpkg/Class7;", seen[0][7]);
}

} // namespace
