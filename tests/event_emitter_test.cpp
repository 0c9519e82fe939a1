#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

TEST(EventEmitter, AssignsStrictlyIncreasingSequenceNumbers) {
    EventEmitter emitter;
    auto a = emitter.publish(EventType::job_queued, "j1", "");
    auto b = emitter.publish(EventType::job_started, "j1", "fast-1");
    auto c = emitter.publish(EventType::job_completed, "j1", "fast-1");
    EXPECT_EQ(a, 1u);
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(emitter.last_sequence(), c);
}

TEST(EventEmitter, DeliversInPublishOrder) {
    auto emitter = std::make_shared<EventEmitter>();
    EventRecorder rec(emitter);
    for (int i = 0; i < 50; ++i) emitter->publish(EventType::progress_updated, "job", "", {{"i", i}});

    auto events = rec.events();
    ASSERT_EQ(events.size(), 50u);
    for (std::size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].payload["i"].get<int>(), static_cast<int>(i));
        if (i > 0) {
            EXPECT_GT(events[i].sequence, events[i - 1].sequence);
        }
    }
}

TEST(EventEmitter, FilterMatchesTypesAndIds) {
    auto emitter = std::make_shared<EventEmitter>();
    EventFilter f;
    f.types = {EventType::job_failed, EventType::job_completed};
    f.job_id = "wanted";
    EventRecorder rec(emitter, f);

    emitter->publish(EventType::job_completed, "other", "");
    emitter->publish(EventType::job_started, "wanted", "");
    emitter->publish(EventType::job_failed, "wanted", "", {{"error_detail", "boom"}});

    auto events = rec.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::job_failed);
    EXPECT_EQ(events[0].payload["error_detail"], "boom");
}

TEST(EventEmitter, ThrowingSubscriberDoesNotStopOthers) {
    auto emitter = std::make_shared<EventEmitter>();
    LogCapture logs;
    emitter->subscribe([](const CompressionEvent&) { throw std::runtime_error("subscriber exploded"); });
    EventRecorder rec(emitter);

    EXPECT_NO_THROW(emitter->publish(EventType::job_queued, "j", ""));
    EXPECT_NO_THROW(emitter->publish(EventType::job_started, "j", ""));

    EXPECT_EQ(rec.events().size(), 2u);
    EXPECT_EQ(emitter->delivery_failures(), 2u);
    EXPECT_TRUE(logs.contains("subscriber exploded"));
}

TEST(EventEmitter, UnsubscribeStopsDelivery) {
    auto emitter = std::make_shared<EventEmitter>();
    std::atomic<int> calls{0};
    auto id = emitter->subscribe([&](const CompressionEvent&) { ++calls; });
    emitter->publish(EventType::job_queued, "a", "");
    ASSERT_TRUE(emitter->flush());
    EXPECT_TRUE(emitter->unsubscribe(id));
    EXPECT_FALSE(emitter->unsubscribe(id));
    emitter->publish(EventType::job_queued, "b", "");
    ASSERT_TRUE(emitter->flush());
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(emitter->subscriber_count(), 0u);
}

TEST(EventEmitter, HistoryIsBoundedAndReplayable) {
    EventEmitter emitter(3);
    for (int i = 0; i < 5; ++i) emitter.publish(EventType::progress_updated, "j", "", {{"i", i}});

    auto recent = emitter.get_recent(10);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent.front().payload["i"], 2);
    EXPECT_EQ(recent.back().payload["i"], 4);

    auto last_two = emitter.get_recent(2);
    ASSERT_EQ(last_two.size(), 2u);
    EXPECT_EQ(last_two[0].payload["i"], 3);

    auto since = emitter.get_since(3);
    ASSERT_EQ(since.size(), 2u);
    EXPECT_EQ(since[0].sequence, 4u);
    EXPECT_EQ(emitter.get_since(3, 1).size(), 1u);
}

TEST(EventEmitter, GetRecentAppliesFilter) {
    EventEmitter emitter;
    emitter.publish(EventType::agent_status_changed, "", "fast-1");
    emitter.publish(EventType::job_queued, "j1", "");
    emitter.publish(EventType::agent_status_changed, "", "deep-1");

    EventFilter f;
    f.agent_id = "deep-1";
    auto recent = emitter.get_recent(5, f);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].agent_id, "deep-1");
}

TEST(EventEmitter, FlushFromCallbackReturnsFalse) {
    auto emitter = std::make_shared<EventEmitter>();
    std::atomic<int> flushed{-1};
    emitter->subscribe([&](const CompressionEvent&) { flushed = emitter->flush() ? 1 : 0; });
    emitter->publish(EventType::job_queued, "j", "");
    ASSERT_TRUE(emitter->flush());
    EXPECT_EQ(flushed.load(), 0);
}

TEST(EventEmitter, EventSerializesToJsonRecord) {
    EventEmitter emitter;
    emitter.publish(EventType::swarm_health_changed, "", "", {{"level", "degraded"}});
    auto ev = emitter.get_recent(1).at(0);
    auto j = event_to_json(ev);
    EXPECT_EQ(j["type"], "swarm_health_changed");
    EXPECT_EQ(j["sequence"], 1);
    EXPECT_TRUE(j["job_id"].is_null());
    EXPECT_TRUE(j["agent_id"].is_null());
    EXPECT_EQ(j["payload"]["level"], "degraded");
    EXPECT_TRUE(j["timestamp"].is_string());
}

TEST(EventEmitter, TypeNamesRoundTrip) {
    EXPECT_EQ(event_type_from_name("job_paused"), EventType::job_paused);
    EXPECT_EQ(std::string(event_type_name(EventType::job_resumed)), "job_resumed");
    EXPECT_FALSE(event_type_from_name("job_exploded").has_value());
}

TEST(DefaultEmitter, ScopedGuardRestoresPrevious) {
    auto before = get_default_emitter();
    auto mine = std::make_shared<EventEmitter>();
    {
        ScopedDefaultEmitter guard(mine);
        EXPECT_EQ(get_default_emitter(), mine);
    }
    EXPECT_EQ(get_default_emitter(), before);
}

TEST(DefaultEmitter, SetReturnsReplacedInstance) {
    auto original = get_default_emitter();
    auto replacement = std::make_shared<EventEmitter>();
    auto prev = set_default_emitter(replacement);
    EXPECT_EQ(prev, original);
    EXPECT_EQ(set_default_emitter(prev), replacement);
    EXPECT_EQ(get_default_emitter(), original);
}
