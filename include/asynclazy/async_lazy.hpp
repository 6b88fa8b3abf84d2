#ifndef ASYNCLAZY_ASYNC_LAZY_HPP
#define ASYNCLAZY_ASYNC_LAZY_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <function2/function2.hpp>

#include <asynclazy/detail/owned_mutex.hpp>
#include <asynclazy/detail/tvoid.hpp>
#include <asynclazy/execution_context.hpp>
#include <asynclazy/future.hpp>
#include <asynclazy/joinable_scheduler.hpp>
#include <asynclazy/promise.hpp>
#include <asynclazy/with_cancelation.hpp>

namespace asynclazy
{
/// Thrown by async_lazy::get_value() when called from its own value factory
class value_factory_reentrancy : public std::logic_error
{
public:
  value_factory_reentrancy()
    : std::logic_error(
          "the value factory of an async_lazy requested its own value")
  {
  }
};

namespace detail
{
template <typename V>
void render_lazy_value(std::ostream& os, V const& value)
{
  os << value;
}

inline void render_lazy_value(std::ostream&, tvoid const&)
{
}
}

/** A value computed asynchronously on first request, then cached
 *
 * The factory runs at most once, the first time get_value() is called. Every
 * caller, concurrent or later, gets the same result, value or exception. A
 * failed factory is never retried.
 *
 * The factory must not request the value it is computing. Doing so, directly
 * or from any continuation it schedules, throws value_factory_reentrancy
 * instead of deadlocking.
 *
 * When given a joinable_scheduler, the factory runs as a task of that
 * scheduler and each caller waiting for the value joins it, so that a caller
 * blocking the scheduler's thread lets the factory use that thread.
 *
 * Destroying an async_lazy does not cancel a computation in progress.
 */
template <typename T>
class async_lazy
{
public:
  using factory_type = fu2::unique_function<future<T>()>;

  async_lazy(async_lazy const&) = delete;
  async_lazy(async_lazy&&) = delete;
  async_lazy& operator=(async_lazy const&) = delete;
  async_lazy& operator=(async_lazy&&) = delete;

  /// \throws std::invalid_argument if \p factory is empty
  explicit async_lazy(factory_type factory)
    : async_lazy(std::move(factory), nullptr)
  {
  }

  /** Construct a lazy value whose factory runs through \p scheduler
   *
   * \p scheduler must outlive the computation.
   *
   * \throws std::invalid_argument if \p factory is empty
   */
  async_lazy(factory_type factory, joinable_scheduler& scheduler)
    : async_lazy(std::move(factory), &scheduler)
  {
  }

  /** Get the value, starting its computation if needed
   *
   * Requesting a cancelation on the returned future cancels only that
   * future, never the computation that other callers share.
   *
   * \throws value_factory_reentrancy if called from within the value factory
   * before it completes
   * \throws whatever the joinable_scheduler throws when starting the factory.
   * Only the caller that starts it gets the exception, the value holds it for
   * the others.
   */
  future<T> get_value()
  {
    auto const s = _p;

    if (s->has_value.load(std::memory_order_acquire) && s->value.is_ready())
      return non_cancelation_propagating(s->value);

    if (s->recursive_factory_check.get().value_or(false))
      throw value_factory_reentrancy();
    if (s->mutex.is_held_by_current_thread())
      throw value_factory_reentrancy();

    promise<void> resume;
    bool starter = false;
    {
      std::lock_guard<detail::owned_mutex> lock{s->mutex};
      if (!s->has_value.load(std::memory_order_relaxed))
      {
        starter = true;
        try
        {
          start(*s, resume.get_future());
        }
        catch (...)
        {
          promise<T> failed;
          failed.set_exception(std::current_exception());
          s->value = failed.get_future().to_shared();
          s->has_value.store(true, std::memory_order_release);
          throw;
        }
        s->has_value.store(true, std::memory_order_release);
      }
    }
    // the factory must not run under the lock
    if (starter)
      resume.set_value({});

    if (!s->value.is_ready())
    {
      joinable_task_ptr joinable;
      {
        std::lock_guard<std::mutex> lock{s->joinable_mutex};
        joinable = s->joinable;
      }
      if (joinable)
        joinable->join();
    }

    return non_cancelation_propagating(s->value);
  }

  /** Same as get_value(), and cancel the returned future when \p trigger
   * gets ready first
   */
  template <typename Trigger>
  future<T> get_value(Trigger trigger)
  {
    return with_cancelation(get_value(), std::move(trigger));
  }

  /// Return true once the factory has been started
  bool is_value_created() const
  {
    return _p->created.load(std::memory_order_acquire);
  }

  /// Return true once the factory has finished, with a value or an exception
  bool is_value_factory_completed() const
  {
    return _p->has_value.load(std::memory_order_acquire) &&
           _p->value.is_ready();
  }

  std::string to_string() const
  {
    auto const s = _p;
    if (!s->created.load(std::memory_order_acquire))
      return "LazyValueNotCreated";
    if (!s->has_value.load(std::memory_order_acquire) || !s->value.is_ready())
      return "LazyValuePending";
    if (s->value.has_exception())
      return "LazyValueFaulted";
    std::ostringstream ss;
    detail::render_lazy_value(ss, s->value.get());
    return ss.str();
  }

private:
  struct state
  {
    detail::owned_mutex mutex;
    // guarded by mutex, empty once the factory has been started
    std::optional<factory_type> factory;
    std::atomic<bool> created{false};
    std::atomic<bool> has_value{false};
    // written once under mutex, before has_value is set
    shared_future<T> value;

    std::mutex joinable_mutex;
    joinable_scheduler* scheduler;
    joinable_task_ptr joinable;

    async_local<bool> recursive_factory_check;

    state(factory_type f, joinable_scheduler* sched)
      : factory(std::move(f)), scheduler(sched)
    {
    }
  };

  std::shared_ptr<state> _p;

  async_lazy(factory_type factory, joinable_scheduler* scheduler)
  {
    if (!factory)
      throw std::invalid_argument("async_lazy: empty value factory");
    _p = std::make_shared<state>(std::move(factory), scheduler);
  }

  // called under s.mutex
  void start(state& s, future<void> resumed)
  {
    auto gated = [resumed = std::move(resumed),
                  factory = std::move(*s.factory)]() mutable {
      return resumed
          .and_then(get_synchronous_executor(),
                    [factory = std::move(factory)](tvoid) mutable {
                      return factory();
                    })
          .unwrap();
    };
    s.factory.reset();
    s.created.store(true, std::memory_order_release);

    async_local<bool>::scope const _(s.recursive_factory_check, true);

    joinable_scheduler* scheduler;
    {
      std::lock_guard<std::mutex> lock{s.joinable_mutex};
      scheduler = s.scheduler;
    }
    if (!scheduler)
    {
      s.value = gated().to_shared();
      return;
    }

    auto result = scheduler->template run_async<T>(std::move(gated));
    s.value = std::move(result.value);
    {
      std::lock_guard<std::mutex> lock{s.joinable_mutex};
      s.joinable = std::move(result.task);
    }
    s.value.then(get_synchronous_executor(),
                 [w = std::weak_ptr<state>(_p)](shared_future<T> const&) {
                   auto const st = w.lock();
                   if (!st)
                     return;
                   std::lock_guard<std::mutex> lock{st->joinable_mutex};
                   st->scheduler = nullptr;
                   st->joinable = nullptr;
                 });
  }
};

template <typename T>
std::ostream& operator<<(std::ostream& os, async_lazy<T> const& lazy)
{
  return os << lazy.to_string();
}
}

#endif
