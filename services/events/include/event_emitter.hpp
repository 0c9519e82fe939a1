#pragma once
#include "compression_event.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using EventCallback = std::function<void(const CompressionEvent&)>;
using SubscriptionId = std::uint64_t;

// Pub/sub hub for job and agent lifecycle events.
//
// publish() stamps the sequence number, stores the event in a bounded history
// and hands it to a dispatcher thread, so subscribers never run on the
// publisher's stack. Delivery order is publish order. A throwing subscriber is
// logged and counted; the remaining subscribers still get the event.
// Must not be destroyed from inside one of its own subscriber callbacks.
class EventEmitter {
public:
    explicit EventEmitter(std::size_t history_size = 1000);
    ~EventEmitter();

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    SubscriptionId subscribe(EventCallback callback, EventFilter filter = {});
    bool unsubscribe(SubscriptionId id);

    // Returns the sequence number assigned to the event.
    std::uint64_t publish(CompressionEvent ev);
    std::uint64_t publish(EventType type, const std::string& job_id, const std::string& agent_id,
                          nlohmann::json payload = nlohmann::json::object());

    // Last n matching events, oldest first.
    std::vector<CompressionEvent> get_recent(std::size_t n, const EventFilter& filter = {}) const;
    // Events with sequence > after, oldest first, at most limit of them.
    std::vector<CompressionEvent> get_since(std::uint64_t after, std::size_t limit = 1000) const;

    // Blocks until every event published so far has been delivered.
    // Returns false on timeout or when called from a subscriber callback.
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    std::size_t subscriber_count() const;
    std::uint64_t last_sequence() const;
    std::uint64_t delivery_failures() const { return failures_.load(); }
    std::size_t history_size() const { return history_limit_; }

private:
    struct Subscription {
        SubscriptionId id;
        EventFilter filter;
        EventCallback callback;
        std::atomic<bool> active{true};
    };

    void dispatch_loop();
    void deliver(const CompressionEvent& ev, const std::vector<std::shared_ptr<Subscription>>& subs);

    std::size_t history_limit_;

    mutable std::mutex mtx_;
    std::condition_variable pending_cv_;
    std::condition_variable delivered_cv_;
    std::deque<CompressionEvent> history_;
    std::deque<CompressionEvent> pending_;
    std::vector<std::shared_ptr<Subscription>> subscribers_;
    SubscriptionId next_subscription_{1};
    std::uint64_t sequence_{0};
    std::uint64_t delivered_{0};
    bool stopping_{false};

    std::atomic<std::uint64_t> failures_{0};
    std::thread dispatcher_;
};

// Process-wide default emitter. Created on first use unless one was installed
// at startup; set_default_emitter returns the instance it replaced.
std::shared_ptr<EventEmitter> get_default_emitter();
std::shared_ptr<EventEmitter> set_default_emitter(std::shared_ptr<EventEmitter> emitter);

// Installs an emitter as the default for the lifetime of the guard and puts
// the previous one back afterwards. Meant for test fixtures.
class ScopedDefaultEmitter {
public:
    explicit ScopedDefaultEmitter(std::shared_ptr<EventEmitter> emitter)
        : previous_(set_default_emitter(std::move(emitter))) {}
    ~ScopedDefaultEmitter() { set_default_emitter(std::move(previous_)); }

    ScopedDefaultEmitter(const ScopedDefaultEmitter&) = delete;
    ScopedDefaultEmitter& operator=(const ScopedDefaultEmitter&) = delete;

private:
    std::shared_ptr<EventEmitter> previous_;
};
