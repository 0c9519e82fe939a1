#include "../services/swarm/include/agent_swarm.hpp"
#include "../services/swarm/include/agent_catalog.hpp"
#include "../shared/cpp/common/include/errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>

class AgentSwarmTest : public ::testing::Test {
protected:
    void SetUp() override {
        emitter = std::make_shared<EventEmitter>();
        config.clock = clock.fn();
        config.failure_threshold = 2;
        config.degraded_cooldown = std::chrono::milliseconds(1000);
    }

    std::shared_ptr<AgentSwarm> make_swarm(std::vector<AgentDefinition> defs) {
        auto swarm = std::make_shared<AgentSwarm>(config, emitter);
        swarm->initialize(defs);
        return swarm;
    }

    FakeClock clock;
    SwarmConfig config;
    std::shared_ptr<EventEmitter> emitter;
};

TEST_F(AgentSwarmTest, InitializeOnceOnly) {
    auto swarm = make_swarm(default_agent_catalog());
    EXPECT_TRUE(swarm->initialized());
    EXPECT_EQ(swarm->agents().size(), default_agent_catalog().size());
    for (const auto& a : swarm->agents()) EXPECT_EQ(a.status, AgentStatus::idle);
    EXPECT_THROW(swarm->initialize(default_agent_catalog()), AlreadyInitializedError);
}

TEST_F(AgentSwarmTest, InitializeRejectsBadCatalogs) {
    AgentSwarm empty(config, emitter);
    EXPECT_THROW(empty.initialize({}), ValidationError);
    EXPECT_FALSE(empty.initialized());

    AgentSwarm dup(config, emitter);
    EXPECT_THROW(dup.initialize({{"a", AgentTier::fast, {"compress"}}, {"a", AgentTier::deep, {"verify"}}}),
                 ValidationError);

    AgentSwarm nocap(config, emitter);
    EXPECT_THROW(nocap.initialize({{"a", AgentTier::fast, {}}}), ValidationError);
}

TEST_F(AgentSwarmTest, GeneratesIdsForUnnamedDefinitions) {
    auto swarm = make_swarm({{"", AgentTier::fast, {"compress"}}, {"", AgentTier::deep, {"compress"}}});
    auto agents = swarm->agents();
    EXPECT_EQ(agents[0].id, "fast-1");
    EXPECT_EQ(agents[1].id, "deep-2");
    EXPECT_EQ(swarm->agents(AgentTier::deep).size(), 1u);
}

TEST_F(AgentSwarmTest, AcquireBeforeInitializeIsAnError) {
    AgentSwarm swarm(config, emitter);
    EXPECT_THROW(swarm.acquire("compress"), InvalidStateError);
}

TEST_F(AgentSwarmTest, AcquireMarksBusyAndReturnsNoneWhenExhausted) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"fast-compress"}}});
    EventRecorder rec(emitter, EventFilter{{EventType::agent_status_changed}, "", "f1"});

    auto id = swarm->acquire("fast-compress");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "f1");
    EXPECT_EQ(swarm->agent("f1")->status, AgentStatus::busy);
    EXPECT_FALSE(swarm->acquire("fast-compress").has_value());
    EXPECT_FALSE(swarm->acquire("deep-compress").has_value());

    auto events = rec.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].payload["previous"], "idle");
    EXPECT_EQ(events[0].payload["status"], "busy");
}

TEST_F(AgentSwarmTest, TaskReferenceIsKeptWhileBusy) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    Task task;
    task.id = "task-1";
    task.job_id = "job-1";
    task.capability = "compress";
    ASSERT_EQ(swarm->acquire(task), std::optional<std::string>("f1"));
    auto a = swarm->agent("f1");
    EXPECT_EQ(a->current_task_id, "task-1");
    EXPECT_EQ(a->current_job_id, "job-1");

    swarm->release("f1", TaskOutcome::success);
    a = swarm->agent("f1");
    EXPECT_TRUE(a->current_task_id.empty());
    EXPECT_TRUE(a->current_job_id.empty());
}

TEST_F(AgentSwarmTest, ReleaseUpdatesMetrics) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    swarm->acquire("compress");
    clock.advance(std::chrono::milliseconds(200));
    swarm->release("f1", TaskOutcome::success);
    swarm->acquire("compress");
    clock.advance(std::chrono::milliseconds(400));
    swarm->release("f1", TaskOutcome::failure);
    swarm->acquire("compress");
    swarm->release("f1", TaskOutcome::cancelled);

    const auto m = swarm->agent("f1")->metrics;
    EXPECT_EQ(m.tasks_completed, 1u);
    EXPECT_EQ(m.tasks_failed, 1u);
    EXPECT_EQ(m.tasks_cancelled, 1u);
    EXPECT_EQ(m.consecutive_failures, 1u);
    EXPECT_DOUBLE_EQ(m.average_duration_ms, 300.0);

    auto h = swarm->swarm_health();
    EXPECT_EQ(h.tasks_completed, 1u);
    EXPECT_DOUBLE_EQ(h.average_task_duration_ms, 300.0);
}

TEST_F(AgentSwarmTest, ReleaseOfIdleOrUnknownAgentFails) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    EXPECT_THROW(swarm->release("f1", TaskOutcome::success), InvalidStateError);
    EXPECT_THROW(swarm->release("ghost", TaskOutcome::success), NotFoundError);
}

TEST_F(AgentSwarmTest, ConsecutiveFailuresDegradeAndSuccessResetsStreak) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});

    swarm->acquire("compress");
    swarm->release("f1", TaskOutcome::failure);
    swarm->acquire("compress");
    swarm->release("f1", TaskOutcome::success);
    EXPECT_EQ(swarm->agent("f1")->metrics.consecutive_failures, 0u);

    swarm->acquire("compress");
    swarm->release("f1", TaskOutcome::failure);
    EXPECT_EQ(swarm->agent("f1")->status, AgentStatus::idle);
    swarm->acquire("compress");
    swarm->release("f1", TaskOutcome::failure);
    EXPECT_EQ(swarm->agent("f1")->status, AgentStatus::degraded);
}

TEST_F(AgentSwarmTest, DegradedAgentUsedAsFallbackOnlyWhenAllowed) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    for (int i = 0; i < 2; ++i) {
        swarm->acquire("compress");
        swarm->release("f1", TaskOutcome::failure);
    }
    ASSERT_EQ(swarm->agent("f1")->status, AgentStatus::degraded);
    EXPECT_EQ(swarm->acquire("compress"), std::optional<std::string>("f1"));

    config.fallback_to_degraded = false;
    auto strict = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    for (int i = 0; i < 2; ++i) {
        strict->acquire("compress");
        strict->release("f1", TaskOutcome::failure);
    }
    EXPECT_FALSE(strict->acquire("compress").has_value());
}

TEST_F(AgentSwarmTest, DegradedRecoversAfterCooldownOrReset) {
    config.fallback_to_degraded = false;
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}, {"f2", AgentTier::fast, {"compress"}}});
    for (auto id : {"f1", "f2"}) {
        for (int i = 0; i < 2; ++i) {
            Task t;
            t.id = std::string("t-") + id;
            t.capability = "compress";
            ASSERT_EQ(swarm->acquire(t), std::optional<std::string>(id));
            swarm->release(id, TaskOutcome::failure);
        }
        ASSERT_EQ(swarm->agent(id)->status, AgentStatus::degraded);
    }

    swarm->reset("f1");
    EXPECT_EQ(swarm->agent("f1")->status, AgentStatus::idle);
    EXPECT_EQ(swarm->agent("f1")->metrics.consecutive_failures, 0u);
    EXPECT_THROW(swarm->reset("f1"), InvalidStateError);

    EXPECT_EQ(swarm->recover_degraded(), 0u);
    clock.advance(std::chrono::milliseconds(1000));
    EXPECT_EQ(swarm->recover_degraded(), 1u);
    EXPECT_EQ(swarm->agent("f2")->status, AgentStatus::idle);
}

TEST_F(AgentSwarmTest, OfflineAgentsAreNeverAcquired) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    swarm->mark_offline("f1");
    swarm->mark_offline("f1");
    EXPECT_FALSE(swarm->acquire("compress").has_value());
    EXPECT_THROW(swarm->reset("f1"), InvalidStateError);

    swarm->mark_online("f1");
    EXPECT_EQ(swarm->agent("f1")->status, AgentStatus::idle);
    EXPECT_THROW(swarm->mark_online("f1"), InvalidStateError);
    EXPECT_TRUE(swarm->acquire("compress").has_value());
    EXPECT_THROW(swarm->mark_offline("ghost"), NotFoundError);
}

TEST_F(AgentSwarmTest, OfflineWhileBusyKeepsTaskUntilReleased) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    swarm->acquire("compress");
    swarm->mark_offline("f1");
    swarm->mark_online("f1");
    EXPECT_EQ(swarm->agent("f1")->status, AgentStatus::busy);

    swarm->mark_offline("f1");
    swarm->release("f1", TaskOutcome::success);
    EXPECT_EQ(swarm->agent("f1")->status, AgentStatus::offline);
    EXPECT_EQ(swarm->agent("f1")->metrics.tasks_completed, 1u);
    swarm->mark_online("f1");
    EXPECT_EQ(swarm->agent("f1")->status, AgentStatus::idle);
}

TEST_F(AgentSwarmTest, AgentBackOnlineIsNotHandedOutTwice) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    ASSERT_EQ(swarm->acquire("compress"), std::optional<std::string>("f1"));
    EXPECT_TRUE(swarm->agent("f1")->task_in_flight);
    EXPECT_FALSE(swarm->agent("f1")->current_task_id.empty());

    swarm->mark_offline("f1");
    swarm->mark_online("f1");
    EXPECT_FALSE(swarm->acquire("compress").has_value());

    swarm->mark_offline("f1");
    EXPECT_NO_THROW(swarm->release("f1", TaskOutcome::success));
    EXPECT_FALSE(swarm->agent("f1")->task_in_flight);
    EXPECT_THROW(swarm->release("f1", TaskOutcome::success), InvalidStateError);
}

TEST_F(AgentSwarmTest, CancelledFallbackTaskLeavesAgentDegraded) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    for (int i = 0; i < 2; ++i) {
        swarm->acquire("compress");
        swarm->release("f1", TaskOutcome::failure);
    }
    ASSERT_EQ(swarm->agent("f1")->status, AgentStatus::degraded);

    ASSERT_EQ(swarm->acquire("compress"), std::optional<std::string>("f1"));
    swarm->release("f1", TaskOutcome::cancelled);
    auto a = swarm->agent("f1");
    EXPECT_EQ(a->status, AgentStatus::degraded);
    EXPECT_EQ(a->metrics.consecutive_failures, 2u);

    // cooldown runs from the original degradation
    clock.advance(std::chrono::milliseconds(1000));
    EXPECT_EQ(swarm->recover_degraded(), 1u);
    EXPECT_EQ(swarm->agent("f1")->status, AgentStatus::idle);
}

TEST_F(AgentSwarmTest, HealthEventsOnlyWhenLevelChanges) {
    auto swarm = make_swarm({{"a", AgentTier::fast, {"compress"}},
                             {"b", AgentTier::fast, {"compress"}},
                             {"c", AgentTier::fast, {"compress"}},
                             {"d", AgentTier::fast, {"compress"}}});
    EventRecorder rec(emitter, EventFilter{{EventType::swarm_health_changed}, "", ""});
    EXPECT_EQ(swarm->swarm_health().level, HealthLevel::healthy);

    swarm->acquire("compress");  // busy still counts as available
    swarm->mark_offline("a");    // 3/4 available: healthy
    EXPECT_EQ(swarm->swarm_health().level, HealthLevel::healthy);
    swarm->mark_offline("b");    // 2/4: degraded
    swarm->mark_offline("c");    // 1/4: critical
    swarm->mark_online("c");     // 2/4: degraded

    auto events = rec.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].payload["previous_level"], "healthy");
    EXPECT_EQ(events[0].payload["level"], "degraded");
    EXPECT_EQ(events[1].payload["level"], "critical");
    EXPECT_EQ(events[2].payload["level"], "degraded");

    auto h = swarm->swarm_health();
    EXPECT_EQ(h.offline, 2u);
    EXPECT_DOUBLE_EQ(h.offline_fraction, 0.5);
    EXPECT_EQ(health_to_json(h)["level"], "degraded");
}

TEST_F(AgentSwarmTest, AvailabilityListenersFireOnRelease) {
    auto swarm = make_swarm({{"f1", AgentTier::fast, {"compress"}}});
    std::atomic<int> fired{0};
    int id = swarm->add_availability_listener([&] { ++fired; });
    swarm->acquire("compress");
    EXPECT_EQ(fired.load(), 0);
    swarm->release("f1", TaskOutcome::success);
    EXPECT_EQ(fired.load(), 1);

    swarm->remove_availability_listener(id);
    swarm->acquire("compress");
    swarm->release("f1", TaskOutcome::success);
    EXPECT_EQ(fired.load(), 1);
}

TEST_F(AgentSwarmTest, SupportsReflectsCatalog) {
    auto swarm = make_swarm(default_agent_catalog());
    EXPECT_TRUE(swarm->supports("fast-compress"));
    EXPECT_TRUE(swarm->supports("deep-compress"));
    EXPECT_TRUE(swarm->supports("verify"));
    EXPECT_FALSE(swarm->supports("encrypt"));
}

TEST(AgentCatalog, ParsesJsonAndRejectsBadEntries) {
    auto defs = agent_catalog_from_json(nlohmann::json::parse(R"([
        {"id": "x", "tier": "deep", "capabilities": ["deep-compress", "verify"]},
        {"tier": "fast", "capability": "fast-compress"}
    ])"));
    ASSERT_EQ(defs.size(), 2u);
    EXPECT_EQ(defs[0].tier, AgentTier::deep);
    EXPECT_EQ(defs[0].capabilities.size(), 2u);
    EXPECT_EQ(defs[1].capabilities, std::vector<std::string>{"fast-compress"});

    EXPECT_THROW(agent_catalog_from_json(nlohmann::json::object()), ValidationError);
    EXPECT_THROW(agent_catalog_from_json(nlohmann::json::parse(R"([{"tier": "huge", "capability": "c"}])")),
                 ValidationError);
    EXPECT_THROW(agent_catalog_from_json(nlohmann::json::parse(R"([{"tier": "fast"}])")), ValidationError);
}
