#ifndef ASYNCLAZY_JOINABLE_SCHEDULER_HPP
#define ASYNCLAZY_JOINABLE_SCHEDULER_HPP

#include <memory>
#include <utility>

#include <function2/function2.hpp>

#include <asynclazy/future.hpp>
#include <asynclazy/packaged_task.hpp>

namespace asynclazy
{
/// Handle on a unit of work started by a joinable_scheduler
class joinable_task
{
public:
  virtual ~joinable_task() = default;

  /** Declare that the current call chain waits for this task
   *
   * If the call chain is blocking a thread owned by the scheduler, the work
   * this task queues for that thread will be run inline by the blocked
   * thread.
   *
   * \return a future that finishes with the task
   */
  virtual future<void> join() = 0;
};

using joinable_task_ptr = std::shared_ptr<joinable_task>;

template <typename T>
struct joinable_result
{
  joinable_task_ptr task;
  shared_future<T> value;
};

/** A scheduler able to run work that blocked callers can join
 *
 * Implementations decide where and when the work starts, and what joining
 * means. The work must be run exactly once, or dropped, in which case its
 * result is a broken_promise.
 */
class joinable_scheduler
{
public:
  joinable_scheduler(joinable_scheduler const&) = delete;
  joinable_scheduler(joinable_scheduler&&) = delete;
  joinable_scheduler& operator=(joinable_scheduler const&) = delete;
  joinable_scheduler& operator=(joinable_scheduler&&) = delete;

  joinable_scheduler() = default;
  virtual ~joinable_scheduler() = default;

  /// Start \p work as a joinable task
  template <typename T>
  joinable_result<T> run_async(fu2::unique_function<future<T>()> work)
  {
    auto pack = package<future<T>()>(std::move(work));
    auto value = pack.second.unwrap().to_shared();
    auto handle =
        start([task = std::move(pack.first), value]() mutable -> future<void> {
          task();
          return value.to_void();
        });
    return {std::move(handle), std::move(value)};
  }

protected:
  virtual joinable_task_ptr start(fu2::unique_function<future<void>()> work) = 0;
};
}

#endif
