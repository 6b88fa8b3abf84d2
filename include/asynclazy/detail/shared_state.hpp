#ifndef ASYNCLAZY_DETAIL_SHARED_STATE_HPP
#define ASYNCLAZY_DETAIL_SHARED_STATE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/variant2/variant.hpp>
#include <function2/function2.hpp>

#include <asynclazy/cancelation_token.hpp>
#include <asynclazy/detail/tvoid.hpp>

namespace asynclazy
{
/// Outcome of a future whose producers all went away without completing it
struct broken_promise : std::runtime_error
{
  broken_promise() : std::runtime_error("promise is broken")
  {
  }
};

namespace detail
{
/** What a future and its producers share
 *
 * The state completes once, with a value or an exception. Callbacks given to
 * on_complete() before that are called by whoever completes it, later ones
 * are called in place.
 *
 * The producer's cancelation token is dropped on completion, a cancelation
 * request has nothing left to reach then.
 */
template <typename V>
class shared_state
{
public:
  using callback = fu2::unique_function<void()>;

  shared_state(shared_state const&) = delete;
  shared_state(shared_state&&) = delete;
  shared_state& operator=(shared_state const&) = delete;
  shared_state& operator=(shared_state&&) = delete;

  explicit shared_state(cancelation_token_ptr token) : _token(std::move(token))
  {
  }

  virtual ~shared_state() = default;

  /// \throws std::logic_error if the state is already complete
  void set_value(V value)
  {
    if (!try_complete([&] { _result.template emplace<1>(std::move(value)); }))
      throw std::logic_error("future already completed");
  }

  /// \throws std::logic_error if the state is already complete
  void set_exception(std::exception_ptr e)
  {
    if (!try_complete([&] { _result.template emplace<2>(std::move(e)); }))
      throw std::logic_error("future already completed");
  }

  void on_complete(callback cb)
  {
    {
      std::lock_guard<std::mutex> lock{_mutex};
      if (_result.index() == 0)
      {
        _callbacks.push_back(std::move(cb));
        return;
      }
    }
    cb();
  }

  /// 0 while pending, 1 with a value, 2 with an exception
  std::size_t index() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _result.index();
  }

  void wait() const
  {
    std::unique_lock<std::mutex> lock{_mutex};
    _completed.wait(lock, [this] { return _result.index() != 0; });
  }

  template <typename Rep, typename Period>
  void wait_for(std::chrono::duration<Rep, Period> const& timeout) const
  {
    std::unique_lock<std::mutex> lock{_mutex};
    _completed.wait_for(lock, timeout, [this] { return _result.index() != 0; });
  }

  /// Block until complete, then return the value or rethrow the exception
  V& value()
  {
    wait();
    if (_result.index() == 2)
      std::rethrow_exception(boost::variant2::get<2>(_result));
    return boost::variant2::get<1>(_result);
  }

  /// Block until complete, then return the exception
  std::exception_ptr const& exception() const
  {
    wait();
    if (_result.index() != 2)
      throw std::logic_error("future has no exception");
    return boost::variant2::get<2>(_result);
  }

  /// Null once the state is complete
  cancelation_token_ptr token() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _token;
  }

  void add_producer()
  {
    ++_producers;
  }

  void remove_producer()
  {
    if (--_producers != 0)
      return;
    try_complete([&] {
      _result.template emplace<2>(std::make_exception_ptr(broken_promise{}));
    });
  }

private:
  mutable std::mutex _mutex;
  mutable std::condition_variable _completed;
  boost::variant2::variant<boost::variant2::monostate, V, std::exception_ptr>
      _result;
  std::vector<callback> _callbacks;
  cancelation_token_ptr _token;
  std::atomic<unsigned int> _producers{0};

  template <typename Store>
  bool try_complete(Store&& store)
  {
    std::vector<callback> callbacks;
    cancelation_token_ptr token;
    {
      std::lock_guard<std::mutex> lock{_mutex};
      if (_result.index() != 0)
        return false;
      store();
      callbacks.swap(_callbacks);
      token.swap(_token);
    }
    _completed.notify_all();
    for (auto& cb : callbacks)
      cb();
    return true;
  }
};

/** Handle held by whatever is expected to complete a state
 *
 * When the last handle on a pending state goes away, the state completes with
 * broken_promise.
 */
template <typename S>
class producer
{
public:
  producer() = default;

  explicit producer(std::shared_ptr<S> state) : _state(std::move(state))
  {
    if (_state)
      _state->add_producer();
  }

  producer(producer const& other) : producer(other._state)
  {
  }

  producer(producer&& other) noexcept : _state(std::move(other._state))
  {
  }

  producer& operator=(producer other) noexcept
  {
    _state.swap(other._state);
    return *this;
  }

  ~producer()
  {
    if (_state)
      _state->remove_producer();
  }

  S* operator->() const
  {
    return _state.get();
  }

  std::shared_ptr<S> const& state() const
  {
    return _state;
  }

private:
  std::shared_ptr<S> _state;
};

/// A state completed by running a function once
template <typename R>
class task_state : public shared_state<void_to_tvoid_t<R>>
{
public:
  template <typename F>
  task_state(cancelation_token_ptr token, F&& body)
    : shared_state<void_to_tvoid_t<R>>(std::move(token)),
      _body(std::forward<F>(body))
  {
  }

  /// Run the function unless it already ran, and store its outcome
  void run()
  {
    if (_started.exchange(true))
      return;
    try
    {
      if constexpr (std::is_void<R>::value)
      {
        _body();
        this->set_value({});
      }
      else
        this->set_value(_body());
    }
    catch (...)
    {
      this->set_exception(std::current_exception());
    }
    // the captures may keep other states alive
    _body = nullptr;
  }

private:
  std::atomic<bool> _started{false};
  fu2::unique_function<R()> _body;
};
}
}

#endif
