/**
 * @file event_loop.h
 * @brief Single-threaded cooperative task queue driving the intake pipeline.
 */

#pragma once

#include "export.h"

#include <cstddef>
#include <deque>
#include <functional>

namespace enroll {

/**
 * @brief FIFO of deferred tasks executed on the calling thread.
 *
 * Adapters complete their callbacks by posting here instead of calling back re-entrantly, so
 * every pipeline transition runs from the top of the loop. Tasks may post further tasks; they
 * run after everything already queued.
 *
 * @note Not thread-safe. Post and run from the same thread.
 */
class ENROLL_API EventLoop final {
  public:
    using Task = std::function<void()>;

    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);

    /** @brief Runs the oldest queued task. @return false if the queue was empty. */
    bool run_one();

    /** @brief Runs tasks until the queue is empty. @return Number of tasks executed. */
    std::size_t run_until_idle();

    [[nodiscard]] std::size_t pending() const noexcept {
        return tasks_.size();
    }

  private:
    std::deque<Task> tasks_;
};

} // namespace enroll
