#pragma once
#include "job.hpp"
#include <array>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

struct PendingEntry {
    std::string job_id;
    std::string capability;
    JobPriority priority{JobPriority::normal};
};

// Queued job ids in one FIFO lane per priority. Lookups scan lanes from
// critical down to low, front to back.
class InMemoryPriorityQueue {
public:
    void enqueue(PendingEntry entry);
    // First entry in priority/FIFO order that satisfies pred; not removed.
    std::optional<PendingEntry> find_first(const std::function<bool(const PendingEntry&)>& pred) const;
    bool remove(const std::string& job_id);
    std::size_t size() const;
    std::size_t size(JobPriority priority) const;
    bool empty() const { return size() == 0; }

private:
    static std::size_t lane_of(JobPriority p) { return static_cast<std::size_t>(p); }

    mutable std::mutex mtx_;
    std::array<std::deque<PendingEntry>, 4> lanes_;
};
