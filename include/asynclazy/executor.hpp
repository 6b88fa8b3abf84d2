#ifndef ASYNCLAZY_EXECUTOR_HPP
#define ASYNCLAZY_EXECUTOR_HPP

#include <asynclazy/detail/export.hpp>

#include <function2/function2.hpp>

#include <string>
#include <type_traits>
#include <utility>

namespace asynclazy
{
/** A copyable reference to something work can be posted to
 *
 * Wraps any type with `post(work, name)` and `is_in_this_context()`, such as
 * thread_pool or affine_scheduler. The wrapped object must outlive every copy.
 */
class executor
{
public:
  using work_type = fu2::unique_function<void()>;

  template <typename Context,
            typename = std::enable_if_t<
                !std::is_same<std::decay_t<Context>, executor>::value>>
  executor(Context& context)
    : _post([&context](work_type work, std::string name) {
        context.post(std::move(work), std::move(name));
      }),
      _is_in_this_context([&context] { return context.is_in_this_context(); })
  {
  }

  void post(work_type work, std::string name = {}) const
  {
    _post(std::move(work), std::move(name));
  }

  bool is_in_this_context() const
  {
    return _is_in_this_context();
  }

private:
  fu2::function<void(work_type, std::string) const> _post;
  fu2::function<bool() const> _is_in_this_context;
};

/// A single thread, started on first use
ASYNCLAZY_EXPORT executor get_default_executor();
/// One thread per core, at least two, started on first use
ASYNCLAZY_EXPORT executor get_background_executor();

/** Stop the threads of the default and background executors
 *
 * Must be called before main() returns, so that no task outlives what it
 * refers to.
 */
ASYNCLAZY_EXPORT void shutdown();

/// Runs posted work in place, on the posting thread
class synchronous_executor
{
public:
  template <typename F>
  void post(F&& work, std::string const& = {}) const
  {
    work();
  }

  bool is_in_this_context() const
  {
    return true;
  }
};

inline synchronous_executor get_synchronous_executor()
{
  return {};
}
}

#endif
