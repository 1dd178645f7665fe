#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace canvas {

// Deferred tasks on the UI thread. The host advances the clock once per
// frame; nothing runs between calls to advance_to().
class TaskScheduler {
public:
    using TaskId = std::uint64_t;
    using Task = std::function<void()>;

    TaskId schedule(std::uint64_t delay_ms, Task task);
    bool cancel(TaskId id);

    // Runs every task due at or before now_ms, in due order. Tasks scheduled
    // while running see the clock at their parent's due time.
    std::size_t advance_to(std::uint64_t now_ms);
    std::size_t advance_by(std::uint64_t delta_ms) { return advance_to(now_ + delta_ms); }

    std::uint64_t now() const { return now_; }
    std::size_t pending() const { return tasks_.size(); }

private:
    using Key = std::pair<std::uint64_t, TaskId>;

    std::map<Key, Task> tasks_;
    std::unordered_map<TaskId, std::uint64_t> due_by_id_;
    std::uint64_t now_ = 0;
    TaskId next_id_ = 1;
};

} // namespace canvas
