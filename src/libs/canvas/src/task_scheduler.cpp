#include <canvas/task_scheduler.hpp>

namespace canvas {

TaskScheduler::TaskId TaskScheduler::schedule(std::uint64_t delay_ms, Task task) {
    const TaskId id = next_id_++;
    const std::uint64_t due = now_ + delay_ms;
    tasks_.emplace(Key(due, id), std::move(task));
    due_by_id_.emplace(id, due);
    return id;
}

bool TaskScheduler::cancel(TaskId id) {
    auto it = due_by_id_.find(id);
    if (it == due_by_id_.end()) return false;
    tasks_.erase(Key(it->second, id));
    due_by_id_.erase(it);
    return true;
}

std::size_t TaskScheduler::advance_to(std::uint64_t now_ms) {
    std::size_t ran = 0;
    while (!tasks_.empty()) {
        auto it = tasks_.begin();
        const std::uint64_t due = it->first.first;
        if (due > now_ms) break;

        Task task = std::move(it->second);
        due_by_id_.erase(it->first.second);
        tasks_.erase(it);

        if (due > now_) now_ = due;
        if (task) task();
        ++ran;
    }
    if (now_ms > now_) now_ = now_ms;
    return ran;
}

} // namespace canvas
