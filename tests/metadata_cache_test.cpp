//
// Created by Giuseppe Francione on 10/12/25.
//

#include <gtest/gtest.h>
#include "metadata_cache.hpp"
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace archivist;

namespace {

ImageMetadata sized(const int w) {
    ImageMetadata m;
    m.width = w;
    m.height = w;
    m.format = "PNG";
    return m;
}

} // namespace

TEST(MetadataCacheTest, PutThenGet) {
    MetadataCache cache(10);
    EXPECT_FALSE(cache.get("missing").has_value());

    cache.put("a", sized(7));
    const auto hit = cache.get("a");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->width, 7);
    EXPECT_EQ(hit->format, "PNG");
    EXPECT_EQ(cache.size(), 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(MetadataCacheTest, KeyCombinesPathSizeAndTime) {
    const auto t = std::chrono::system_clock::now();
    const std::string k1 = MetadataCache::make_key("/p/a.jpg", 100, t);
    const std::string k2 = MetadataCache::make_key("/p/a.jpg", 101, t);
    const std::string k3 = MetadataCache::make_key("/p/a.jpg", 100, t + std::chrono::hours(1));
    EXPECT_NE(k1, k2);
    EXPECT_NE(k1, k3);
    EXPECT_EQ(k1.rfind("/p/a.jpg|100|", 0), 0u);
    // yyyyMMddHHmmss
    EXPECT_EQ(k1.size(), std::string("/p/a.jpg|100|").size() + 14);
}

TEST(MetadataCacheTest, EvictsWithHysteresisWhenFull) {
    MetadataCache cache(200);
    for (int i = 0; i < 200; ++i) cache.put("k" + std::to_string(i), sized(i));
    EXPECT_EQ(cache.size(), 200u);

    // the 201st insert evicts count - capacity + 100 = 100 entries
    cache.put("k200", sized(200));
    EXPECT_EQ(cache.size(), 101u);
    EXPECT_TRUE(cache.get("k200").has_value());
}

TEST(MetadataCacheTest, EvictsLeastRecentlyAccessed) {
    MetadataCache cache(200);
    for (int i = 0; i < 200; ++i) cache.put("k" + std::to_string(i), sized(i));

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    const auto kept = cache.get("k0");
    ASSERT_TRUE(kept.has_value());

    cache.put("new", sized(1));
    EXPECT_TRUE(cache.get("k0").has_value());
    EXPECT_TRUE(cache.get("new").has_value());
}

TEST(MetadataCacheTest, UpdatingExistingKeyDoesNotEvict) {
    MetadataCache cache(200);
    for (int i = 0; i < 200; ++i) cache.put("k" + std::to_string(i), sized(i));
    cache.put("k5", sized(55));
    EXPECT_EQ(cache.size(), 200u);
}

TEST(MetadataCacheTest, ConcurrentAccess) {
    MetadataCache cache(1000);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                const std::string key = std::to_string(t) + ":" + std::to_string(i);
                cache.put(key, sized(i));
                (void)cache.get(key);
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_LE(cache.size(), 1000u);
    EXPECT_GT(cache.size(), 0u);
}
