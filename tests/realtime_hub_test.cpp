#include <gtest/gtest.h>

#include "realtime_hub.hpp"
#include "test_fakes.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using testing_support::FakeAnalyticsProvider;
using testing_support::FakeConnection;

namespace
{

    class RealtimeHubTest : public ::testing::Test
    {
      protected:
        RealtimeHubTest() : diagMgr(testing_support::quietLogConfig()), hub(analytics, diagMgr, options()) {}

        static realtime::HubOptions options()
        {
            realtime::HubOptions opts;
            opts.fetchWorkers = 2;
            return opts;
        }

        std::shared_ptr<FakeConnection> connect(const std::string& peer)
        {
            auto conn = std::make_shared<FakeConnection>(peer);
            EXPECT_TRUE(hub.registerConnection(conn));
            hub.processPending();
            return conn;
        }

        // Runs the loop body until every queued command, fetch and targeted delivery is handled.
        void settle()
        {
            hub.processPending();
            ASSERT_TRUE(hub.waitForFetches(std::chrono::milliseconds(2000)));
            hub.processPending();
        }

        void subscribe(const std::shared_ptr<FakeConnection>& conn, const std::string& topic)
        {
            hub.subscribe(conn->id(), topic);
            settle();
        }

        FakeAnalyticsProvider   analytics;
        diag::DiagnosticManager diagMgr;
        realtime::RealtimeHub   hub;
    };

} // namespace

TEST_F(RealtimeHubTest, ClickReachesOnlySubscribersOfItsTopic)
{
    auto c1 = connect("c1");
    auto c2 = connect("c2");
    subscribe(c1, "abc123");
    subscribe(c2, "xyz999");
    c1->clearFrames();
    c2->clearFrames();

    EXPECT_TRUE(hub.broadcastClick("abc123", "203.0.113.7", "Mozilla/5.0 (Windows NT 10.0) Chrome/120.0", ""));
    hub.processPending();

    auto clicks = c1->messagesOfType("click");
    ASSERT_EQ(clicks.size(), 1u);
    EXPECT_EQ(c1->messages().size(), 1u);
    EXPECT_EQ(clicks[0]["short_code"], "abc123");
    EXPECT_EQ(clicks[0]["data"]["client_ip"], "203.0.113.7");
    EXPECT_EQ(clicks[0]["data"]["browser"], "Chrome");
    EXPECT_EQ(clicks[0]["data"]["os"], "Windows");
    EXPECT_TRUE(clicks[0]["timestamp"].is_string());

    EXPECT_TRUE(c2->messages().empty());
}

TEST_F(RealtimeHubTest, UnsubscribedConnectionReceivesNothing)
{
    auto c1 = connect("c1");
    subscribe(c1, "abc123");
    hub.unsubscribe(c1->id(), "abc123");
    hub.processPending();
    c1->clearFrames();

    hub.broadcastClick("abc123", "198.51.100.1", "", "");
    hub.processPending();

    EXPECT_TRUE(c1->messages().empty());
    EXPECT_TRUE(hub.activeSubscriptionCounts().empty());
}

TEST_F(RealtimeHubTest, FirstSubscribeSendsZeroSnapshotWhenNoDataExists)
{
    auto c1 = connect("c1");
    subscribe(c1, "abc123");

    auto initial = c1->messagesOfType("initial_analytics");
    ASSERT_EQ(initial.size(), 1u);
    EXPECT_EQ(initial[0]["short_code"], "abc123");
    EXPECT_EQ(initial[0]["data"]["short_code"], "abc123");
    EXPECT_EQ(initial[0]["data"]["total_clicks"], 0);
    EXPECT_TRUE(initial[0]["data"]["daily_clicks"].empty());
    EXPECT_TRUE(initial[0]["data"]["country_stats"].empty());

    auto calls = analytics.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].first, "abc123");
    EXPECT_EQ(calls[0].second, 30);
}

TEST_F(RealtimeHubTest, InitialSnapshotCarriesStoredAnalytics)
{
    analytics.set(testing_support::sampleAnalytics("abc123", 42));
    auto c1 = connect("c1");
    subscribe(c1, "abc123");

    auto initial = c1->messagesOfType("initial_analytics");
    ASSERT_EQ(initial.size(), 1u);
    EXPECT_EQ(initial[0]["data"]["total_clicks"], 42);
    EXPECT_EQ(initial[0]["data"]["country_stats"][0]["country_code"], "US");
}

TEST_F(RealtimeHubTest, DuplicateSubscribeIsNoOp)
{
    auto c1 = connect("c1");
    subscribe(c1, "abc123");
    subscribe(c1, "abc123");

    EXPECT_EQ(hub.activeSubscriptionCounts().at("abc123"), 1u);
    EXPECT_EQ(analytics.calls().size(), 1u);
    EXPECT_EQ(c1->messagesOfType("initial_analytics").size(), 1u);

    c1->clearFrames();
    hub.broadcastClick("abc123", "", "", "");
    hub.processPending();
    EXPECT_EQ(c1->messagesOfType("click").size(), 1u);
}

TEST_F(RealtimeHubTest, UnsubscribeWithoutSubscriptionIsNoOp)
{
    auto c1 = connect("c1");
    auto c2 = connect("c2");
    subscribe(c2, "xyz999");

    hub.unsubscribe(c1->id(), "xyz999");
    hub.unsubscribe(c1->id(), "never");
    hub.processPending();

    EXPECT_EQ(hub.activeConnectionCount(), 2u);
    auto counts = hub.activeSubscriptionCounts();
    ASSERT_EQ(counts.size(), 1u);
    EXPECT_EQ(counts.at("xyz999"), 1u);
}

TEST_F(RealtimeHubTest, DisconnectRemovesAllSubscriptionsAndEmptyTopics)
{
    auto c1 = connect("c1");
    auto c2 = connect("c2");
    subscribe(c1, "abc123");
    subscribe(c1, "xyz999");
    subscribe(c2, "xyz999");
    EXPECT_EQ(hub.activeTopics().size(), 2u);

    hub.unregisterConnection(c1->id());
    hub.processPending();

    EXPECT_EQ(hub.activeConnectionCount(), 1u);
    auto counts = hub.activeSubscriptionCounts();
    EXPECT_EQ(counts.count("abc123"), 0u);
    EXPECT_EQ(counts.at("xyz999"), 1u);

    hub.unregisterConnection(c2->id());
    hub.unregisterConnection(c2->id());
    hub.processPending();

    EXPECT_EQ(hub.activeConnectionCount(), 0u);
    EXPECT_TRUE(hub.activeSubscriptionCounts().empty());
    EXPECT_EQ(hub.metrics().subscriptions, 0u);
}

TEST_F(RealtimeHubTest, SubscribeFromUnknownHandleIsIgnored)
{
    FakeConnection stranger("stranger");
    hub.subscribe(stranger.id(), "abc123");
    settle();

    EXPECT_TRUE(hub.activeSubscriptionCounts().empty());
    EXPECT_TRUE(analytics.calls().empty());
}

TEST_F(RealtimeHubTest, FailedSendDropsSubscriber)
{
    auto c1 = connect("c1");
    auto c2 = connect("c2");
    subscribe(c1, "abc123");
    subscribe(c2, "abc123");
    c1->failSendsWith(realtime::SendStatus::Timeout);

    hub.broadcastClick("abc123", "", "", "");
    hub.processPending();

    EXPECT_EQ(c1->closeCalls(), 1);
    EXPECT_EQ(hub.activeConnectionCount(), 1u);
    EXPECT_EQ(hub.activeSubscriptionCounts().at("abc123"), 1u);
    EXPECT_EQ(c2->messagesOfType("click").size(), 1u);
    EXPECT_EQ(hub.metrics().failedSends, 1u);
}

TEST_F(RealtimeHubTest, UpdatesForOneTopicArriveInSubmissionOrder)
{
    auto c1 = connect("c1");
    subscribe(c1, "abc123");
    c1->clearFrames();

    for (int i = 0; i < 5; ++i)
        hub.broadcast(realtime::makeUpdate(realtime::UpdateKind::Click, "abc123", {{"seq", i}}));
    hub.processPending();

    auto clicks = c1->messagesOfType("click");
    ASSERT_EQ(clicks.size(), 5u);
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(clicks[static_cast<std::size_t>(i)]["data"]["seq"], i);
}

TEST_F(RealtimeHubTest, ConversionIsBroadcastWithItsPayload)
{
    auto c1 = connect("c1");
    subscribe(c1, "abc123");
    c1->clearFrames();

    livelink::ConversionEvent conv;
    conv.id              = 7;
    conv.shortCode       = "abc123";
    conv.goalId          = 3;
    conv.conversionType  = "purchase";
    conv.conversionValue = 19.99;
    conv.clickId         = 11;
    EXPECT_TRUE(hub.broadcastConversion("abc123", conv));
    hub.processPending();

    auto msgs = c1->messagesOfType("conversion");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0]["data"]["goal_id"], 3);
    EXPECT_EQ(msgs[0]["data"]["conversion_type"], "purchase");
    EXPECT_EQ(msgs[0]["data"]["click_id"], 11);
    EXPECT_EQ(msgs[0]["data"]["attribution_model"], "last_click");
}

TEST_F(RealtimeHubTest, ClientMessagesDriveSubscriptions)
{
    auto c1 = connect("c1");
    hub.handleClientMessage(c1, R"({"type":"subscribe","short_code":"abc123"})");
    settle();
    EXPECT_EQ(hub.activeSubscriptionCounts().at("abc123"), 1u);

    hub.handleClientMessage(c1, R"({"type":"unsubscribe","short_code":"abc123"})");
    hub.processPending();
    EXPECT_TRUE(hub.activeSubscriptionCounts().empty());
}

TEST_F(RealtimeHubTest, PingIsAnsweredWithPong)
{
    auto c1 = connect("c1");
    hub.handleClientMessage(c1, R"({"type":"ping"})");

    auto pongs = c1->messagesOfType("pong");
    ASSERT_EQ(pongs.size(), 1u);
    EXPECT_EQ(pongs[0]["short_code"], "");
    EXPECT_TRUE(pongs[0]["data"].is_null());
}

TEST_F(RealtimeHubTest, MalformedMessagesAreIgnored)
{
    auto c1 = connect("c1");
    hub.handleClientMessage(c1, "not json");
    hub.handleClientMessage(c1, R"({"type":"dance","short_code":"abc123"})");
    hub.handleClientMessage(c1, R"({"type":"subscribe","short_code":"bad code!"})");
    hub.handleClientMessage(c1, R"({"type":"subscribe"})");
    settle();

    EXPECT_TRUE(c1->isOpen());
    EXPECT_EQ(hub.activeConnectionCount(), 1u);
    EXPECT_TRUE(hub.activeSubscriptionCounts().empty());
    EXPECT_TRUE(c1->messages().empty());
}

TEST_F(RealtimeHubTest, FailedInitialFetchSendsNothing)
{
    analytics.failFor("abc123");
    auto c1 = connect("c1");
    subscribe(c1, "abc123");

    EXPECT_TRUE(c1->messages().empty());
    EXPECT_EQ(hub.activeSubscriptionCounts().at("abc123"), 1u);
    EXPECT_EQ(hub.metrics().fetchFailures, 1u);
}

TEST_F(RealtimeHubTest, InitialSnapshotIsDroppedAfterUnsubscribe)
{
    auto c1 = connect("c1");
    analytics.holdFetches();
    hub.subscribe(c1->id(), "abc123");
    hub.processPending();
    hub.unsubscribe(c1->id(), "abc123");
    hub.processPending();

    analytics.releaseFetches();
    settle();

    EXPECT_TRUE(c1->messages().empty());
}

TEST_F(RealtimeHubTest, SubscribeBurstDuringSlowAnalyticsStillGetsEveryInitialSnapshot)
{
    std::vector<std::shared_ptr<FakeConnection>> conns;
    for (int i = 0; i < 300; ++i)
        conns.push_back(connect("c" + std::to_string(i)));

    analytics.holdFetches();
    for (std::size_t i = 0; i < conns.size(); ++i)
    {
        char code[8];
        std::snprintf(code, sizeof(code), "t%03d", static_cast<int>(i));
        hub.subscribe(conns[i]->id(), code);
    }
    hub.processPending();
    EXPECT_EQ(hub.pendingSnapshotTopics(), 300u);

    analytics.releaseFetches();
    settle();

    for (const auto& conn : conns)
        EXPECT_EQ(conn->messagesOfType("initial_analytics").size(), 1u) << conn->peer();
    EXPECT_EQ(hub.pendingSnapshotTopics(), 0u);
    EXPECT_EQ(hub.metrics().fetchFailures, 0u);
}

TEST_F(RealtimeHubTest, SubscribersWaitingOnOneTopicShareOneFetch)
{
    auto c1 = connect("c1");
    auto c2 = connect("c2");
    auto c3 = connect("c3");
    analytics.set(testing_support::sampleAnalytics("abc123", 7));

    analytics.holdFetches();
    hub.subscribe(c1->id(), "abc123");
    hub.subscribe(c2->id(), "abc123");
    hub.subscribe(c3->id(), "abc123");
    hub.processPending();
    EXPECT_EQ(hub.pendingSnapshotTopics(), 1u);

    analytics.releaseFetches();
    settle();

    EXPECT_EQ(analytics.calls().size(), 1u);
    for (const auto& conn : {c1, c2, c3})
    {
        auto initial = conn->messagesOfType("initial_analytics");
        ASSERT_EQ(initial.size(), 1u);
        EXPECT_EQ(initial[0]["data"]["total_clicks"], 7);
    }

    // The topic is no longer pending, so a later subscriber triggers a fresh fetch.
    auto c4 = connect("c4");
    subscribe(c4, "abc123");
    EXPECT_EQ(analytics.calls().size(), 2u);
    EXPECT_EQ(c4->messagesOfType("initial_analytics").size(), 1u);
}

TEST_F(RealtimeHubTest, FailedSharedFetchReleasesTheTopic)
{
    auto c1 = connect("c1");
    analytics.failFor("abc123");
    subscribe(c1, "abc123");
    EXPECT_EQ(hub.pendingSnapshotTopics(), 0u);

    auto c2 = connect("c2");
    subscribe(c2, "abc123");
    EXPECT_EQ(analytics.calls().size(), 2u);
    EXPECT_EQ(hub.metrics().fetchFailures, 2u);
}

TEST_F(RealtimeHubTest, StopClosesEveryConnection)
{
    auto c1 = connect("c1");
    auto c2 = connect("c2");
    subscribe(c1, "abc123");

    hub.stop();

    EXPECT_EQ(c1->closeCalls(), 1);
    EXPECT_EQ(c2->closeCalls(), 1);
    EXPECT_EQ(hub.activeConnectionCount(), 0u);
    EXPECT_FALSE(hub.broadcastClick("abc123", "", "", ""));
    EXPECT_FALSE(hub.registerConnection(std::make_shared<FakeConnection>("late")));
}

TEST(RealtimeHubThreaded, LoopDeliversBroadcasts)
{
    FakeAnalyticsProvider   analytics;
    diag::DiagnosticManager diagMgr(testing_support::quietLogConfig());
    realtime::RealtimeHub   hub(analytics, diagMgr);
    hub.start();
    ASSERT_TRUE(hub.isRunning());

    auto c1 = std::make_shared<FakeConnection>("c1");
    ASSERT_TRUE(hub.registerConnection(c1));
    hub.subscribe(c1->id(), "abc123");
    ASSERT_TRUE(testing_support::waitUntil([&]() { return !c1->messagesOfType("initial_analytics").empty(); }));

    hub.broadcastClick("abc123", "192.0.2.1", "curl/8.0", "");
    ASSERT_TRUE(testing_support::waitUntil([&]() { return !c1->messagesOfType("click").empty(); }));
    EXPECT_EQ(c1->messagesOfType("click")[0]["data"]["device"], "bot");
    EXPECT_EQ(hub.activeConnectionCount(), 1u);

    hub.stop();
    EXPECT_FALSE(hub.isRunning());
    EXPECT_EQ(c1->closeCalls(), 1);
}
