#include "../include/event_emitter.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include <algorithm>

EventEmitter::EventEmitter(std::size_t history_size)
    : history_limit_(history_size == 0 ? 1 : history_size) {
    dispatcher_ = std::thread(&EventEmitter::dispatch_loop, this);
}

EventEmitter::~EventEmitter() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    pending_cv_.notify_all();
    if (dispatcher_.joinable()) dispatcher_.join();
}

SubscriptionId EventEmitter::subscribe(EventCallback callback, EventFilter filter) {
    auto sub = std::make_shared<Subscription>();
    sub->filter = std::move(filter);
    sub->callback = std::move(callback);
    std::lock_guard<std::mutex> lock(mtx_);
    sub->id = next_subscription_++;
    subscribers_.push_back(sub);
    return sub->id;
}

bool EventEmitter::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [&](const std::shared_ptr<Subscription>& s) { return s->id == id; });
    if (it == subscribers_.end()) return false;
    (*it)->active.store(false);
    subscribers_.erase(it);
    return true;
}

std::uint64_t EventEmitter::publish(CompressionEvent ev) {
    std::uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        seq = ++sequence_;
        ev.sequence = seq;
        ev.timestamp = std::chrono::system_clock::now();
        history_.push_back(ev);
        while (history_.size() > history_limit_) history_.pop_front();
        pending_.push_back(std::move(ev));
    }
    pending_cv_.notify_one();
    return seq;
}

std::uint64_t EventEmitter::publish(EventType type, const std::string& job_id, const std::string& agent_id,
                                    nlohmann::json payload) {
    CompressionEvent ev;
    ev.type = type;
    ev.job_id = job_id;
    ev.agent_id = agent_id;
    ev.payload = std::move(payload);
    return publish(std::move(ev));
}

std::vector<CompressionEvent> EventEmitter::get_recent(std::size_t n, const EventFilter& filter) const {
    std::vector<CompressionEvent> out;
    if (n == 0) return out;
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto it = history_.rbegin(); it != history_.rend() && out.size() < n; ++it) {
        if (filter.matches(*it)) out.push_back(*it);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<CompressionEvent> EventEmitter::get_since(std::uint64_t after, std::size_t limit) const {
    std::vector<CompressionEvent> out;
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& ev : history_) {
        if (ev.sequence <= after) continue;
        if (out.size() >= limit) break;
        out.push_back(ev);
    }
    return out;
}

bool EventEmitter::flush(std::chrono::milliseconds timeout) {
    if (std::this_thread::get_id() == dispatcher_.get_id()) return false;
    std::unique_lock<std::mutex> lock(mtx_);
    const auto target = sequence_;
    return delivered_cv_.wait_for(lock, timeout, [&] { return delivered_ >= target; });
}

std::size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return subscribers_.size();
}

std::uint64_t EventEmitter::last_sequence() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sequence_;
}

void EventEmitter::dispatch_loop() {
    for (;;) {
        CompressionEvent ev;
        std::vector<std::shared_ptr<Subscription>> subs;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            pending_cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            // drain what is already queued before honouring shutdown
            if (pending_.empty()) break;
            ev = std::move(pending_.front());
            pending_.pop_front();
            subs = subscribers_;
        }

        deliver(ev, subs);

        {
            std::lock_guard<std::mutex> lock(mtx_);
            delivered_ = ev.sequence;
        }
        delivered_cv_.notify_all();
    }
}

void EventEmitter::deliver(const CompressionEvent& ev, const std::vector<std::shared_ptr<Subscription>>& subs) {
    for (const auto& sub : subs) {
        if (!sub->active.load() || !sub->filter.matches(ev)) continue;
        try {
            sub->callback(ev);
        } catch (const std::exception& e) {
            failures_.fetch_add(1);
            log_error("events", "subscriber " + std::to_string(sub->id) + " failed on " +
                      event_type_name(ev.type) + " #" + std::to_string(ev.sequence) + ": " + e.what());
        } catch (...) {
            failures_.fetch_add(1);
            log_error("events", "subscriber " + std::to_string(sub->id) + " failed on " +
                      event_type_name(ev.type) + " #" + std::to_string(ev.sequence) + ": unknown error");
        }
    }
}

namespace {
std::mutex g_default_mtx;
std::shared_ptr<EventEmitter> g_default_emitter;
}

std::shared_ptr<EventEmitter> get_default_emitter() {
    std::lock_guard<std::mutex> lock(g_default_mtx);
    if (!g_default_emitter) g_default_emitter = std::make_shared<EventEmitter>();
    return g_default_emitter;
}

std::shared_ptr<EventEmitter> set_default_emitter(std::shared_ptr<EventEmitter> emitter) {
    std::lock_guard<std::mutex> lock(g_default_mtx);
    std::shared_ptr<EventEmitter> prev = std::move(g_default_emitter);
    g_default_emitter = std::move(emitter);
    return prev;
}
