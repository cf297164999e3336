#include <gtest/gtest.h>

#include "analytics_provider.hpp"
#include "test_fakes.hpp"

#include <chrono>
#include <string>

using testing_support::FakeAnalyticsProvider;

TEST(CachingAnalyticsProvider, ServesRepeatLookupsFromCache)
{
    FakeAnalyticsProvider              upstream;
    livelink::CachingAnalyticsProvider cache(upstream, std::chrono::seconds(300));
    upstream.set(testing_support::sampleAnalytics("abc123", 4));

    EXPECT_EQ(cache.getAnalyticsSnapshot("abc123", 30).totalClicks, 4);
    upstream.set(testing_support::sampleAnalytics("abc123", 8));
    EXPECT_EQ(cache.getAnalyticsSnapshot("abc123", 30).totalClicks, 4);
    EXPECT_EQ(upstream.calls().size(), 1u);
}

TEST(CachingAnalyticsProvider, KeysOnCodeAndWindow)
{
    FakeAnalyticsProvider              upstream;
    livelink::CachingAnalyticsProvider cache(upstream, std::chrono::seconds(300));

    cache.getAnalyticsSnapshot("abc123", 30);
    cache.getAnalyticsSnapshot("abc123", 1);
    cache.getAnalyticsSnapshot("xyz999", 30);
    EXPECT_EQ(upstream.calls().size(), 3u);
    EXPECT_EQ(cache.size(), 3u);

    cache.clear();
    cache.getAnalyticsSnapshot("abc123", 30);
    EXPECT_EQ(upstream.calls().size(), 4u);
}

TEST(CachingAnalyticsProvider, ExpiredEntriesAreRefetched)
{
    FakeAnalyticsProvider              upstream;
    livelink::CachingAnalyticsProvider cache(upstream, std::chrono::seconds(0));

    cache.getAnalyticsSnapshot("abc123", 30);
    cache.getAnalyticsSnapshot("abc123", 30);
    EXPECT_EQ(upstream.calls().size(), 2u);
}

TEST(CachingAnalyticsProvider, FailuresAreNotCached)
{
    FakeAnalyticsProvider              upstream;
    livelink::CachingAnalyticsProvider cache(upstream, std::chrono::seconds(300));
    upstream.failFor("abc123");

    EXPECT_THROW(cache.getAnalyticsSnapshot("abc123", 30), livelink::AnalyticsError);
    EXPECT_THROW(cache.getAnalyticsSnapshot("abc123", 30), livelink::AnalyticsError);
    EXPECT_EQ(upstream.calls().size(), 2u);
    EXPECT_EQ(cache.size(), 0u);

    try
    {
        cache.getAnalyticsSnapshot("abc123", 30);
    }
    catch (const livelink::AnalyticsError& ex)
    {
        EXPECT_EQ(ex.shortCode(), "abc123");
    }
}

TEST(CachingAnalyticsProvider, ExpiredEntriesForOtherCodesAreSwept)
{
    FakeAnalyticsProvider              upstream;
    livelink::CachingAnalyticsProvider cache(upstream, std::chrono::seconds(0));

    for (int i = 0; i < 200; ++i)
        cache.getAnalyticsSnapshot("code" + std::to_string(i), 30);
    EXPECT_EQ(upstream.calls().size(), 200u);
    EXPECT_LE(cache.size(), 1u);
}

TEST(CachingAnalyticsProvider, SizeIsCappedWhileEntriesAreFresh)
{
    FakeAnalyticsProvider              upstream;
    livelink::CachingAnalyticsProvider cache(upstream, std::chrono::seconds(300), 3);

    for (int i = 0; i < 10; ++i)
        cache.getAnalyticsSnapshot("code" + std::to_string(i), 30);
    EXPECT_EQ(cache.size(), 3u);

    // The newest entries survive.
    cache.getAnalyticsSnapshot("code9", 30);
    EXPECT_EQ(upstream.calls().size(), 10u);
    cache.getAnalyticsSnapshot("code0", 30);
    EXPECT_EQ(upstream.calls().size(), 11u);
    EXPECT_EQ(cache.size(), 3u);
}
