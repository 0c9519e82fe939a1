#include "../include/priority_queue.hpp"
#include <algorithm>

void InMemoryPriorityQueue::enqueue(PendingEntry entry) {
    std::lock_guard<std::mutex> lock(mtx_);
    lanes_[lane_of(entry.priority)].push_back(std::move(entry));
}

std::optional<PendingEntry> InMemoryPriorityQueue::find_first(
    const std::function<bool(const PendingEntry&)>& pred) const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto lane = lanes_.rbegin(); lane != lanes_.rend(); ++lane) {
        for (const auto& e : *lane) {
            if (pred(e)) return e;
        }
    }
    return std::nullopt;
}

bool InMemoryPriorityQueue::remove(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& lane : lanes_) {
        auto it = std::find_if(lane.begin(), lane.end(), [&](const PendingEntry& e) { return e.job_id == job_id; });
        if (it != lane.end()) {
            lane.erase(it);
            return true;
        }
    }
    return false;
}

std::size_t InMemoryPriorityQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = 0;
    for (const auto& lane : lanes_) n += lane.size();
    return n;
}

std::size_t InMemoryPriorityQueue::size(JobPriority priority) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return lanes_[lane_of(priority)].size();
}
