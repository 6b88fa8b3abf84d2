#ifndef ASYNCLAZY_PROMISE_HPP
#define ASYNCLAZY_PROMISE_HPP

#include <exception>
#include <memory>
#include <utility>

#include <asynclazy/cancelation_token.hpp>
#include <asynclazy/future.hpp>

namespace asynclazy
{
/** The producing side of a future
 *
 * Copies complete the same future. When the last copy goes away first, the
 * future finishes with broken_promise.
 */
template <typename T>
class promise
{
public:
  using value_type = detail::void_to_tvoid_t<T>;

  promise()
    : _token(std::make_shared<cancelation_token>()),
      _state(std::make_shared<detail::state_type<T>>(_token))
  {
  }

  future<T> get_future() const
  {
    return detail::future_access::make<future<T>>(_state.state(), _token);
  }

  /// \throws std::logic_error if the future is already complete
  void set_value(value_type value)
  {
    _state->set_value(std::move(value));
  }

  /// \throws std::logic_error if the future is already complete
  void set_exception(std::exception_ptr e)
  {
    _state->set_exception(std::move(e));
  }

  /// Where the holders of the future request a cancelation
  cancelation_token& get_cancelation_token() const
  {
    return *_token;
  }

private:
  cancelation_token_ptr _token;
  detail::producer<detail::state_type<T>> _state;
};
}

#endif
