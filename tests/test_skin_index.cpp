/**
 * Valstore - Skin Index Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "FakeRiot.hpp"
#include "core/StoreError.hpp"
#include "network/SessionContext.hpp"
#include "store/SkinIndex.hpp"

using namespace valstore;
using namespace valstore::test;

TEST(SkinIndexTest, MapsSkinLevelsAndChromasToParent) {
    auto index = SkinIndex::fromFeed(sampleSkinFeed());

    for (const char* uuid : {"aaaa0000-0000-0000-0000-000000000001",
                             "bbbb0000-0000-0000-0000-000000000001",
                             "cccc0000-0000-0000-0000-000000000001"}) {
        auto info = index.lookup(uuid);
        ASSERT_TRUE(info.has_value()) << uuid;
        EXPECT_EQ(info->displayName, "Prime Vandal");
        EXPECT_EQ(info->iconUrl, "https://media.example/prime.png");
    }
}

TEST(SkinIndexTest, LookupIgnoresCase) {
    auto index = SkinIndex::fromFeed(sampleSkinFeed());

    EXPECT_TRUE(index.lookup("AAAA0000-0000-0000-0000-000000000002").has_value());
    EXPECT_TRUE(index.lookup("BBBB0000-0000-0000-0000-000000000001").has_value());
}

TEST(SkinIndexTest, IconFallsBackToFirstLevel) {
    auto index = SkinIndex::fromFeed(sampleSkinFeed());

    auto info = index.lookup("aaaa0000-0000-0000-0000-000000000002");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->displayName, "Reaver Sheriff");
    EXPECT_EQ(info->iconUrl, "https://media.example/reaver-l1.png");
}

TEST(SkinIndexTest, UnknownUuidAndMalformedFeed) {
    auto index = SkinIndex::fromFeed(sampleSkinFeed());
    EXPECT_FALSE(index.lookup("ffffffff-0000-0000-0000-000000000000").has_value());

    EXPECT_EQ(SkinIndex::fromFeed(nlohmann::json::object()).size(), 0u);
    EXPECT_EQ(SkinIndex::fromFeed({{"data", "nope"}}).size(), 0u);
}

TEST(SkinIndexTest, BuildRequestsLanguage) {
    ScriptedRiot riot;
    FakeProvider provider(riot);
    SessionContext session(provider.factory()(), DEFAULT_UA);

    auto index = buildSkinIndex(session, "ja-JP");

    EXPECT_EQ(index.size(), 5u);
    auto requests = provider.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].request.url.toString(),
              "https://valorant-api.com/v1/weapons/skins?language=ja-JP");
}

TEST(SkinIndexTest, BuildFailureIsUpstreamError) {
    FakeProvider provider([](const HttpRequest&, int) { return textResponse(502, "bad gateway"); });
    HttpOptions options;
    options.maxTransientRetries = 0;
    SessionContext session(provider.factory()(), DEFAULT_UA, options);

    try {
        buildSkinIndex(session, "en-US");
        FAIL() << "expected StoreException";
    } catch (const StoreException& e) {
        EXPECT_EQ(e.kind(), StoreError::UpstreamError);
        EXPECT_EQ(e.httpStatus(), 502);
    }
}

TEST(SkinIndexCacheTest, ReusesFreshIndexPerLanguage) {
    SkinIndexCache cache(3600);
    int builds = 0;
    auto builder = [&builds]() {
        ++builds;
        return SkinIndex::fromFeed(sampleSkinFeed());
    };

    auto first = cache.get("ja-JP", builder);
    auto second = cache.get("ja-JP", builder);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(builds, 1);

    cache.get("en-US", builder);
    EXPECT_EQ(builds, 2);
}

TEST(SkinIndexCacheTest, ZeroTtlAlwaysRebuilds) {
    SkinIndexCache cache(0);
    int builds = 0;
    auto builder = [&builds]() {
        ++builds;
        return SkinIndex::fromFeed(sampleSkinFeed());
    };

    cache.get("ja-JP", builder);
    cache.get("ja-JP", builder);
    EXPECT_EQ(builds, 2);
}

TEST(SkinIndexCacheTest, FailedBuildIsNotCached) {
    SkinIndexCache cache(3600);

    EXPECT_THROW(cache.get("ja-JP", []() -> SkinIndex {
        throw StoreException(StoreError::UpstreamError, "feed down", 503);
    }), StoreException);

    auto index = cache.get("ja-JP", []() { return SkinIndex::fromFeed(sampleSkinFeed()); });
    EXPECT_EQ(index->size(), 5u);
}

TEST(SkinIndexCacheTest, ConcurrentCallersShareOneBuild) {
    SkinIndexCache cache(3600);
    std::atomic_int builds{0};
    auto builder = [&builds]() {
        ++builds;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return SkinIndex::fromFeed(sampleSkinFeed());
    };

    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<const SkinIndex>> results(4);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&cache, &builder, &results, i]() {
            results[i] = cache.get("ja-JP", builder);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(builds.load(), 1);
    for (const auto& result : results) {
        EXPECT_EQ(result.get(), results[0].get());
    }
}
