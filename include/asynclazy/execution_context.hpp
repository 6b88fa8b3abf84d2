#ifndef ASYNCLAZY_EXECUTION_CONTEXT_HPP
#define ASYNCLAZY_EXECUTION_CONTEXT_HPP

#include <asynclazy/detail/export.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <utility>

namespace asynclazy
{
template <typename T>
class async_local;

/** Snapshot of the async_local values of a call chain
 *
 * Each thread has a current context. Executors capture it when work is posted
 * and continuations capture it when they are registered, then the captured
 * context becomes current while the work runs. This is how a value set by an
 * async_local flows to everything scheduled within its extent, but not to the
 * code that scheduled the extent.
 *
 * A context is immutable, copying it is cheap.
 */
class ASYNCLAZY_EXPORT execution_context
{
public:
  /// Set a context as current for the lifetime of the scope
  class scope;

  /// Construct an empty context
  execution_context() = default;

  /// Get a copy of the current thread's context
  static execution_context capture();

  bool empty() const noexcept
  {
    return !_values || _values->empty();
  }

private:
  using storage = std::map<std::uint64_t, std::shared_ptr<void const>>;

  std::shared_ptr<storage const> _values;

  template <typename T>
  friend class async_local;

  static execution_context& current();
  static std::uint64_t make_key();

  std::shared_ptr<void const> find(std::uint64_t key) const;
  execution_context with(std::uint64_t key,
                         std::shared_ptr<void const> value) const;
};

/// Set a context as current for the lifetime of the scope
class ASYNCLAZY_EXPORT execution_context::scope
{
public:
  scope(scope const&) = delete;
  scope(scope&&) = delete;
  scope& operator=(scope const&) = delete;
  scope& operator=(scope&&) = delete;

  explicit scope(execution_context ctx);
  ~scope();

private:
  execution_context _previous;
};

/** Wrap a callable so that it runs in the context current at the time of
 * this call
 */
template <typename F>
auto capture_context(F&& f)
{
  return [ctx = execution_context::capture(),
          f = std::forward<F>(f)]() mutable -> decltype(auto) {
    execution_context::scope const _(ctx);
    return f();
  };
}

/** A value attached to the current call chain
 *
 * The value set through an async_local is visible to the code that set it and
 * to the work and continuations it schedules afterwards, on any thread.
 * Concurrent call chains each see their own value.
 */
template <typename T>
class async_local
{
public:
  /** Set a value for the lifetime of the scope
   *
   * The whole context current before the scope is restored on exit, including
   * the values other async_locals got in the meantime without a scope.
   */
  class scope
  {
  public:
    scope(scope const&) = delete;
    scope(scope&&) = delete;
    scope& operator=(scope const&) = delete;
    scope& operator=(scope&&) = delete;

    scope(async_local& local, T value)
      : _restore(execution_context::capture())
    {
      local.set(std::move(value));
    }

  private:
    execution_context::scope _restore;
  };

  async_local(async_local const&) = delete;
  async_local(async_local&&) = delete;
  async_local& operator=(async_local const&) = delete;
  async_local& operator=(async_local&&) = delete;

  async_local() : _key(execution_context::make_key())
  {
  }

  std::optional<T> get() const
  {
    auto const value = execution_context::current().find(_key);
    if (!value)
      return std::nullopt;
    return *static_cast<T const*>(value.get());
  }

  /// Set the value in the current context, or remove it with std::nullopt
  void set(std::optional<T> value)
  {
    auto& ctx = execution_context::current();
    if (value)
      ctx = ctx.with(_key, std::make_shared<T const>(std::move(*value)));
    else
      ctx = ctx.with(_key, nullptr);
  }

private:
  std::uint64_t const _key;
};
}

#endif
