#ifndef ASYNCLAZY_AFFINE_SCHEDULER_HPP
#define ASYNCLAZY_AFFINE_SCHEDULER_HPP

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <function2/function2.hpp>

#include <asynclazy/detail/export.hpp>
#include <asynclazy/future.hpp>
#include <asynclazy/joinable_scheduler.hpp>

namespace asynclazy
{
/** A joinable scheduler bound to a single thread, typically the main thread
 *
 * Work posted to it only runs on its thread, either when that thread runs
 * its event loop with run_pending(), or when it blocks in run() or run_for()
 * on a future whose completion depends on that work.
 *
 * Posted work is tagged with the joinable task of the call chain that posts
 * it. A blocking call only runs the work of the tasks it depends on: the ones
 * started within its extent, and the ones joined within its extent, with
 * their own child tasks. Anything else waits for run_pending(), which is why
 * a thread blocking on work it did not join can deadlock.
 */
class ASYNCLAZY_EXPORT affine_scheduler : public joinable_scheduler
{
public:
  using error_handler_cb = std::function<void(std::exception_ptr const&)>;

  /// Bind the scheduler to the calling thread
  affine_scheduler();
  ~affine_scheduler() override;

  /// Return true if called from the thread the scheduler is bound to
  bool is_in_this_context() const;

  void post(fu2::unique_function<void()> work, std::string name = {});

  /** Run all the work queued so far, whatever task it belongs to
   *
   * Must be called from the scheduler's thread.
   *
   * \return the number of work items run
   */
  std::size_t run_pending();

  /** Block until the future returned by \p f gets ready
   *
   * \p f is called right away, its signature must be `future<T> f();` or
   * `shared_future<T> f();`. When called from the scheduler's thread, the
   * queued work the future depends on runs inline in the meantime.
   *
   * \return the value of the future
   * \throws the exception of the future, or the one thrown by \p f
   */
  template <typename F>
  auto run(F&& f)
  {
    return run_in_frame(std::nullopt, f).get();
  }

  /** Same as run(), but give up waiting after \p timeout
   *
   * \return the future returned by \p f, which may not be ready
   */
  template <typename F, typename Rep, typename Period>
  auto run_for(std::chrono::duration<Rep, Period> const& timeout, F&& f)
  {
    return run_in_frame(
        std::chrono::steady_clock::now() +
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                timeout),
        f);
  }

  /// \p cb receives what posted work throws, by default printed on std::cerr
  void set_error_handler(error_handler_cb cb);

protected:
  joinable_task_ptr start(fu2::unique_function<future<void>()> work) override;

private:
  struct impl;
  std::shared_ptr<impl> _p;

  using deadline_type = std::optional<std::chrono::steady_clock::time_point>;

  template <typename F>
  auto run_in_frame(deadline_type deadline, F& f)
  {
    std::optional<std::decay_t<decltype(f())>> fut;
    block_on(deadline, [&]() -> future<void> {
      fut.emplace(f());
      return fut->then(get_synchronous_executor(), [](auto const&) {});
    });
    return std::move(*fut);
  }

  void block_on(deadline_type deadline,
                fu2::unique_function<future<void>()> start_work);
};
}

#endif
