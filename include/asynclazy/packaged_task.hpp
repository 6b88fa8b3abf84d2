#ifndef ASYNCLAZY_PACKAGED_TASK_HPP
#define ASYNCLAZY_PACKAGED_TASK_HPP

#include <memory>
#include <utility>

#include <asynclazy/detail/shared_state.hpp>
#include <asynclazy/detail/util.hpp>
#include <asynclazy/future.hpp>

namespace asynclazy
{
template <typename>
class packaged_task;

/** Runs a function once and completes a future with its outcome
 *
 * Copies share the function and only the first call runs it. When all the
 * copies go away uncalled, the future finishes with broken_promise.
 */
template <typename R>
class packaged_task<R()>
{
public:
  explicit packaged_task(detail::producer<detail::task_state<R>> task)
    : _task(std::move(task))
  {
  }

  void operator()() const
  {
    _task->run();
  }

private:
  detail::producer<detail::task_state<R>> _task;
};

/** Wrap \p f in a task of signature \p S, and get the future of its result
 *
 * The future uses \p token for its cancelation requests.
 */
template <typename S, typename F>
auto package(F&& f, cancelation_token_ptr token)
{
  using result_type = detail::result_of_t_<S>;

  detail::producer<detail::task_state<result_type>> task{
      std::make_shared<detail::task_state<result_type>>(token,
                                                        std::forward<F>(f))};
  auto fut = detail::future_access::make<future<result_type>>(task.state(),
                                                              std::move(token));
  return std::make_pair(packaged_task<S>(std::move(task)), std::move(fut));
}

template <typename S, typename F>
auto package(F&& f)
{
  return package<S>(std::forward<F>(f), std::make_shared<cancelation_token>());
}
}

#endif
