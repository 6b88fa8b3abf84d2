#ifndef ASYNCLAZY_THREAD_POOL_HPP
#define ASYNCLAZY_THREAD_POOL_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>

#include <function2/function2.hpp>

#include <asynclazy/detail/export.hpp>

namespace asynclazy
{
namespace detail
{
/// Print the error on std::cerr
ASYNCLAZY_EXPORT
void default_error_cb(std::exception_ptr const&);
}

/** Threads running posted work in FIFO order
 *
 * Work runs in the execution context that was current when it was posted.
 * What it throws goes to the error handler, and the thread moves on to the
 * next work.
 */
class ASYNCLAZY_EXPORT thread_pool
{
public:
  using error_handler_cb = std::function<void(std::exception_ptr const&)>;
  using task_trace_handler_cb = std::function<void(
      std::string const& name, std::chrono::steady_clock::duration duration)>;

  thread_pool(thread_pool const&) = delete;
  thread_pool(thread_pool&&) = delete;
  thread_pool& operator=(thread_pool const&) = delete;
  thread_pool& operator=(thread_pool&&) = delete;

  thread_pool();
  /// Drops the work not run yet
  ~thread_pool();

  /// \throws std::logic_error if already running
  void start(unsigned int thread_count);

  /** Join the threads
   *
   * They run the work already posted first, unless \p cancel_work is true.
   */
  void stop(bool cancel_work = false);

  bool is_running() const;
  /// Return true if called from one of the pool's threads
  bool is_in_this_context() const;

  void post(fu2::unique_function<void()> work, std::string name = {});

  void set_error_handler(error_handler_cb cb);
  /// \p cb is called after each work with its name and how long it ran
  void set_task_trace_handler(task_trace_handler_cb cb);

private:
  struct impl;
  std::unique_ptr<impl> _p;
};
}

#endif
