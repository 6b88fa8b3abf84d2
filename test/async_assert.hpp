#ifndef ASYNCLAZY_TEST_ASYNC_ASSERT_HPP
#define ASYNCLAZY_TEST_ASYNC_ASSERT_HPP

#include <asynclazy/future.hpp>
#include <asynclazy/operation_canceled.hpp>

#include <doctest/doctest.h>

#include <exception>
#include <functional>
#include <utility>

namespace
{
/** Check that the future returned by \p f finishes with operation_canceled
 *
 * \p f must not throw, the failure is expected in the future.
 *
 * \return a future that finishes once the check is done
 */
template <typename F>
asynclazy::future<void> check_cancels(F&& f)
{
  auto fut = f();
  return fut.then(asynclazy::get_synchronous_executor(), [](auto fut) {
    CHECK_MESSAGE(fut.has_exception(), "operation should have failed");
    CHECK_THROWS_AS(fut.get(), asynclazy::operation_canceled);
  });
}

/** Check that the future returned by \p f finishes with an exception of type
 * \p E, and that \p matches accepts it when given
 *
 * A cancelation does not count as a match.
 */
template <typename E, typename F>
asynclazy::future<void> check_throws(
    F&& f, std::function<bool(E const&)> matches = nullptr)
{
  auto fut = f();
  return fut.then(asynclazy::get_synchronous_executor(),
                  [matches = std::move(matches)](auto fut) {
                    CHECK_MESSAGE(fut.has_exception(),
                                  "operation should have failed");
                    if (!fut.has_exception())
                      return;
                    try
                    {
                      std::rethrow_exception(fut.get_exception());
                    }
                    catch (asynclazy::operation_canceled const&)
                    {
                      FAIL_CHECK("operation should not be canceled");
                    }
                    catch (E const& e)
                    {
                      if (matches)
                        CHECK(matches(e));
                    }
                    catch (...)
                    {
                      FAIL_CHECK("operation failed with the wrong exception");
                    }
                  });
}
}

#endif
