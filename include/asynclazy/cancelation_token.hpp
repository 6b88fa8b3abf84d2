#ifndef ASYNCLAZY_CANCELATION_TOKEN_HPP
#define ASYNCLAZY_CANCELATION_TOKEN_HPP

#include <memory>
#include <mutex>

#include <function2/function2.hpp>

#include <asynclazy/operation_canceled.hpp>

namespace asynclazy
{
/** Flag through which the holder of a future asks its producer to give up
 *
 * All the steps of a continuation chain share one token. The step currently
 * producing the result installs a handler with push_cancelation_callback(),
 * replacing the handler of the step before it.
 */
class cancelation_token
{
public:
  using cancelation_callback = fu2::function<void()>;

  /// Mark the token as canceled and call the installed handler, if any
  void request_cancel()
  {
    cancelation_callback handler;
    {
      std::lock_guard<std::mutex> lock{_mutex};
      _requested = true;
      handler = _handler;
    }
    if (handler)
      handler();
  }

  bool is_cancel_requested() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _requested;
  }

  /** Install \p cb as the handler of cancelation requests
   *
   * When a request was already made, \p cb is called right away.
   */
  void push_cancelation_callback(cancelation_callback cb)
  {
    bool requested;
    {
      std::lock_guard<std::mutex> lock{_mutex};
      _handler = cb;
      requested = _requested;
    }
    if (requested && cb)
      cb();
  }

private:
  mutable std::mutex _mutex;
  bool _requested{false};
  cancelation_callback _handler;
};

using cancelation_token_ptr = std::shared_ptr<cancelation_token>;
}

#endif
