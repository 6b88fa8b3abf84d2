#ifndef ASYNCLAZY_WITH_CANCELATION_HPP
#define ASYNCLAZY_WITH_CANCELATION_HPP

#include <atomic>
#include <exception>
#include <memory>

#include <asynclazy/future.hpp>
#include <asynclazy/operation_canceled.hpp>
#include <asynclazy/promise.hpp>

namespace asynclazy
{
namespace detail
{
template <typename R>
struct cancelable_view
{
  promise<R> prom;
  std::atomic<bool> done{false};

  template <typename Future>
  void forward(Future& fut)
  {
    if (done.exchange(true))
      return;
    if (fut.has_exception())
      prom.set_exception(fut.get_exception());
    else
      prom.set_value(fut.get());
  }

  void cancel()
  {
    if (done.exchange(true))
      return;
    prom.set_exception(std::make_exception_ptr(operation_canceled{}));
  }
};

template <typename Future>
auto make_cancelable_view(Future& source)
{
  using view_type = cancelable_view<typename Future::result_type>;

  auto const view = std::make_shared<view_type>();
  // weak, so that a view nobody can complete anymore does not keep itself
  // alive through its own token
  view->prom.get_cancelation_token().push_cancelation_callback(
      [w = std::weak_ptr<view_type>(view)] {
        if (auto const v = w.lock())
          v->cancel();
      });
  source.then(get_synchronous_executor(),
              [view](Future fut) { view->forward(fut); });
  return view;
}
}

/** Get a future that mirrors \p source without sharing its cancelation
 *
 * The result finishes with the value or exception of \p source. A
 * cancelation requested on the result finishes it with operation_canceled
 * right away, and never reaches \p source.
 *
 * \p source may be a future or a shared_future.
 */
template <typename Future>
auto non_cancelation_propagating(Future source)
    -> future<typename Future::result_type>
{
  return detail::make_cancelable_view(source)->prom.get_future();
}

/** Same as non_cancelation_propagating(), and cancel the result when
 * \p trigger gets ready
 *
 * Whether \p trigger finishes with a value or an exception, the result is
 * canceled if \p source is not ready yet. \p source is never canceled. If
 * both are already ready, \p source wins.
 */
template <typename Future, typename Trigger>
auto with_cancelation(Future source, Trigger trigger)
    -> future<typename Future::result_type>
{
  using view_type = detail::cancelable_view<typename Future::result_type>;

  auto const view = detail::make_cancelable_view(source);
  if (trigger.is_valid())
    trigger.then(get_synchronous_executor(),
                 [w = std::weak_ptr<view_type>(view)](Trigger const&) {
                   if (auto const v = w.lock())
                     v->cancel();
                 });
  return view->prom.get_future();
}
}

#endif
