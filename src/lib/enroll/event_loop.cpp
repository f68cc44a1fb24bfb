#include "event_loop.h"

#include <utility>

namespace enroll {

void EventLoop::post(Task task) {
    if (task) tasks_.push_back(std::move(task));
}

bool EventLoop::run_one() {
    if (tasks_.empty()) return false;
    // Pop before running: the task may post more work.
    Task t = std::move(tasks_.front());
    tasks_.pop_front();
    t();
    return true;
}

std::size_t EventLoop::run_until_idle() {
    std::size_t n = 0;
    while (run_one())
        ++n;
    return n;
}

} // namespace enroll
