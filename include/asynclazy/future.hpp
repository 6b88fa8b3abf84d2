#ifndef ASYNCLAZY_FUTURE_HPP
#define ASYNCLAZY_FUTURE_HPP

#include <chrono>
#include <exception>
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <asynclazy/cancelation_token.hpp>
#include <asynclazy/detail/shared_state.hpp>
#include <asynclazy/detail/tvoid.hpp>
#include <asynclazy/detail/util.hpp>
#include <asynclazy/execution_context.hpp>
#include <asynclazy/executor.hpp>
#include <asynclazy/operation_canceled.hpp>

namespace asynclazy
{
template <typename R>
class future;

template <typename R>
class shared_future;

namespace detail
{
template <typename T>
struct is_future : std::false_type
{
};

template <typename R>
struct is_future<future<R>> : std::true_type
{
};

template <typename R>
using state_type = shared_state<void_to_tvoid_t<R>>;

/// Lets promises and tasks build futures on their states
struct future_access
{
  template <typename Future, typename State>
  static Future make(std::shared_ptr<State> state, cancelation_token_ptr token)
  {
    return Future(std::move(state), std::move(token));
  }

  template <typename Future>
  static auto const& state(Future const& f)
  {
    return f._state;
  }

  template <typename Future>
  static cancelation_token_ptr const& token(Future const& f)
  {
    return f._token;
  }
};

template <typename Derived, typename R, bool Shared>
class future_base
{
public:
  using result_type = R;
  using value_type = void_to_tvoid_t<R>;
  using get_type =
      std::conditional_t<Shared, value_type const&, value_type>;

  template <typename F>
  auto then(F&& f)
  {
    return then(get_default_executor(), std::forward<F>(f));
  }

  /** Call \p f on \p e with this future once it is ready
   *
   * \p f runs in the execution context current at the time of this call, not
   * in the one of whoever completes the future.
   *
   * \return a future of the result of `f(Derived)`
   */
  template <typename E, typename F>
  auto then(E&& e, F&& f)
      -> future<std::decay_t<std::result_of_t<F(Derived&&)>>>
  {
    return schedule(
        std::forward<E>(e),
        [state = _state, token = _token, f = std::forward<F>(f)]() mutable {
          return f(future_access::make<Derived>(std::move(state),
                                                std::move(token)));
        });
  }

  template <typename F>
  auto and_then(F&& f)
  {
    return and_then(get_default_executor(), std::forward<F>(f));
  }

  /** Call \p f on \p e with the value once this future has one
   *
   * An exception skips \p f and reaches the result as is. When a cancelation
   * was requested in the meantime, \p f is skipped too and the result
   * finishes with operation_canceled. Like then(), \p f runs in the
   * execution context of this call.
   */
  template <typename E, typename F>
  auto and_then(E&& e, F&& f)
      -> future<std::decay_t<std::result_of_t<F(get_type)>>>
  {
    return schedule(
        std::forward<E>(e),
        [state = _state, token = _token, f = std::forward<F>(f)]() mutable {
          if (state->index() == 2)
            std::rethrow_exception(state->exception());
          if (token && token->is_cancel_requested())
            throw operation_canceled{};
          return f(extract(*state));
        });
  }

  future<void> to_void()
  {
    return and_then(get_synchronous_executor(), [](auto const&) {});
  }

  /** Ask the producer to give up
   *
   * A producer that complies finishes the future with operation_canceled.
   * Does nothing on a ready future.
   */
  void request_cancel()
  {
    if (auto const token = _state->token())
      token->request_cancel();
  }

  void wait() const
  {
    _state->wait();
  }

  template <typename Rep, typename Period>
  void wait_for(std::chrono::duration<Rep, Period> const& timeout) const
  {
    _state->wait_for(timeout);
  }

  bool is_valid() const noexcept
  {
    return _state != nullptr;
  }

  bool is_ready() const
  {
    return _state && _state->index() != 0;
  }

  bool has_value() const
  {
    return _state && _state->index() == 1;
  }

  bool has_exception() const
  {
    return _state && _state->index() == 2;
  }

  /// Block until ready, then return the value or rethrow the exception
  get_type get()
  {
    return extract(*_state);
  }

  /// Block until ready, then return the exception
  /// \throws std::logic_error if the future has a value
  std::exception_ptr const& get_exception() const
  {
    return _state->exception();
  }

protected:
  std::shared_ptr<state_type<R>> _state;
  // the state drops its token on completion, continuations still need it
  cancelation_token_ptr _token;

  future_base() = default;

  future_base(std::shared_ptr<state_type<R>> state, cancelation_token_ptr token)
    : _state(std::move(state)), _token(std::move(token))
  {
  }

private:
  static get_type extract(state_type<R>& state)
  {
    if constexpr (Shared)
      return state.value();
    else
      return std::move(state.value());
  }

  // run f on e once ready, the returned future shares this future's token
  template <typename E, typename F>
  auto schedule(E&& e, F&& f) -> future<std::decay_t<decltype(f())>>
  {
    using task_type = task_state<std::decay_t<decltype(f())>>;

    producer<task_type> task{
        std::make_shared<task_type>(_token, std::forward<F>(f))};
    auto ret = future_access::make<future<std::decay_t<decltype(f())>>>(
        task.state(), _token);
    _state->on_complete([ctx = execution_context::capture(),
                         e = std::forward<E>(e),
                         task = std::move(task)]() mutable {
      execution_context::scope const _(std::move(ctx));
      e.post([task = std::move(task)] { task->run(); },
             typeid(F).name());
    });
    return ret;
  }
};

template <typename U>
future<U> flatten(future<future<U>> outer);
}

/// A future whose value can be taken once
template <typename R>
class future : public detail::future_base<future<R>, R, false>
{
public:
  future() = default;
  future(future const&) = delete;
  future(future&&) = default;
  future& operator=(future const&) = delete;
  future& operator=(future&&) = default;

  /// Leaves this future invalid
  shared_future<R> to_shared()
  {
    return detail::future_access::make<shared_future<R>>(
        std::move(this->_state), std::move(this->_token));
  }

  /** Turn a future<future<U>> into a future<U>
   *
   * Leaves this future invalid. A cancelation requested on the result is
   * passed on to the inner future as soon as it is known.
   */
  auto unwrap()
  {
    static_assert(detail::is_future<R>::value,
                  "unwrap() needs a future of a future");
    return detail::flatten(std::move(*this));
  }

private:
  friend struct detail::future_access;

  future(std::shared_ptr<detail::state_type<R>> state,
         cancelation_token_ptr token)
    : detail::future_base<future<R>, R, false>(std::move(state),
                                               std::move(token))
  {
  }
};

/** A future that can be copied, whose value can be read many times
 *
 * get() returns a reference to the value all the copies share.
 */
template <typename R>
class shared_future : public detail::future_base<shared_future<R>, R, true>
{
public:
  shared_future() = default;

private:
  friend struct detail::future_access;

  shared_future(std::shared_ptr<detail::state_type<R>> state,
                cancelation_token_ptr token)
    : detail::future_base<shared_future<R>, R, true>(std::move(state),
                                                     std::move(token))
  {
  }
};

template <typename U>
future<U> detail::flatten(future<future<U>> outer)
{
  auto const token = future_access::token(outer);
  auto const flat = std::make_shared<state_type<U>>(token);

  outer.then(get_synchronous_executor(), [flat](future<future<U>> ready) {
    if (ready.has_exception())
    {
      flat->set_exception(ready.get_exception());
      return;
    }
    auto inner = ready.get();
    if (!inner.is_valid())
    {
      flat->set_exception(std::make_exception_ptr(broken_promise{}));
      return;
    }
    auto const outer_token = flat->token();
    if (outer_token && outer_token != future_access::token(inner))
      outer_token->push_cancelation_callback(
          [inner_state = future_access::state(inner)] {
            if (auto const t = inner_state->token())
              t->request_cancel();
          });
    inner.then(get_synchronous_executor(), [flat](future<U> done) {
      if (done.has_exception())
        flat->set_exception(done.get_exception());
      else
        flat->set_value(done.get());
    });
  });
  return future_access::make<future<U>>(flat, token);
}

template <typename T>
future<std::decay_t<T>> make_ready_future(T&& value)
{
  auto state = std::make_shared<detail::state_type<std::decay_t<T>>>(nullptr);
  state->set_value(std::forward<T>(value));
  return detail::future_access::make<future<std::decay_t<T>>>(
      std::move(state), std::make_shared<cancelation_token>());
}

inline future<void> make_ready_future()
{
  auto state = std::make_shared<detail::state_type<void>>(nullptr);
  state->set_value({});
  return detail::future_access::make<future<void>>(
      std::move(state), std::make_shared<cancelation_token>());
}

template <typename T, typename E>
future<T> make_exceptional_future(E&& err)
{
  auto state = std::make_shared<detail::state_type<T>>(nullptr);
  state->set_exception(std::make_exception_ptr(std::forward<E>(err)));
  return detail::future_access::make<future<T>>(
      std::move(state), std::make_shared<cancelation_token>());
}
}

#endif
