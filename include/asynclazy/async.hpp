#ifndef ASYNCLAZY_ASYNC_HPP
#define ASYNCLAZY_ASYNC_HPP

#include <string>
#include <type_traits>
#include <typeinfo>

#include <asynclazy/executor.hpp>
#include <asynclazy/packaged_task.hpp>

namespace asynclazy
{
/** Post \p f to \p executor and get a future of what it returns
 *
 * \p name is what the executor's task trace handler reports, the type of \p f
 * when empty.
 */
template <typename E, typename F>
auto async(std::string const& name, E&& executor, F&& f)
{
  using result_type = std::decay_t<std::result_of_t<std::decay_t<F>&()>>;

  auto task = package<result_type()>(std::forward<F>(f));
  executor.post(std::move(task.first),
                name.empty() ? std::string(typeid(F).name()) : name);
  return std::move(task.second);
}

template <typename E,
          typename F,
          typename = std::enable_if_t<
              !std::is_convertible<std::decay_t<E>, std::string>::value>>
auto async(E&& executor, F&& f)
{
  return async(std::string{}, std::forward<E>(executor), std::forward<F>(f));
}

/// Post \p f to the default executor
template <typename F>
auto async(F&& f)
{
  return async(get_default_executor(), std::forward<F>(f));
}

/// Run \p f right away, what it throws ends up in the future
template <typename F>
auto sync(F&& f)
{
  return async(get_synchronous_executor(), std::forward<F>(f));
}
}

#endif
