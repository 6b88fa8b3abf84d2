#include <asynclazy/async.hpp>
#include <asynclazy/execution_context.hpp>
#include <asynclazy/promise.hpp>
#include <asynclazy/thread_pool.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace asynclazy;

TEST_CASE("thread_pool should run posted work before stopping")
{
  std::vector<int> order;
  thread_pool tp;
  CHECK(!tp.is_running());
  tp.start(1);
  CHECK(tp.is_running());
  for (int i = 0; i < 3; ++i)
    tp.post([&, i] { order.push_back(i); });
  tp.stop();
  CHECK(!tp.is_running());
  CHECK((order == std::vector<int>{0, 1, 2}));
}

TEST_CASE("thread_pool should refuse to start twice")
{
  thread_pool tp;
  tp.start(1);
  CHECK_THROWS_AS(tp.start(1), std::logic_error);
  tp.stop();
}

TEST_CASE("thread_pool should run work again after a restart")
{
  thread_pool tp;
  tp.start(1);
  tp.stop();
  tp.start(2);
  CHECK(42 == async(tp, [] { return 42; }).get());
  tp.stop();
}

TEST_CASE("thread_pool should break the futures of the work it never ran")
{
  future<int> dropped;
  {
    thread_pool tp;
    dropped = async(tp, [] { return 42; });
    CHECK(!dropped.is_ready());
  }
  REQUIRE(dropped.is_ready());
  CHECK_THROWS_AS(dropped.get(), broken_promise);
}

TEST_CASE("thread_pool should keep running after work throws")
{
  std::atomic<int> errors{0};
  thread_pool tp;
  tp.set_error_handler([&](std::exception_ptr const& e) {
    CHECK_THROWS_AS(std::rethrow_exception(e), std::runtime_error);
    ++errors;
  });
  tp.start(1);
  tp.post([] { throw std::runtime_error("kaboom"); });
  CHECK(42 == async(tp, [] { return 42; }).get());
  tp.stop();
  CHECK(1 == errors.load());
}

TEST_CASE("thread_pool should refuse an empty error handler")
{
  thread_pool tp;
  CHECK_THROWS_AS(tp.set_error_handler(nullptr), std::invalid_argument);
}

TEST_CASE("thread_pool should trace work by name [waiting]")
{
  std::vector<std::string> names;
  std::chrono::steady_clock::duration longest{};
  thread_pool tp;
  tp.set_task_trace_handler(
      [&](std::string const& name, std::chrono::steady_clock::duration dur) {
        names.push_back(name);
        longest = std::max(longest, dur);
      });

  tp.start(1);
  async("sleeper", tp, [] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  });
  tp.post([] {}, "noop");
  tp.stop();

  CHECK((names == std::vector<std::string>{"sleeper", "noop"}));
  CHECK(std::chrono::milliseconds(50) <= longest);
}

TEST_CASE("thread_pool should know its own threads")
{
  thread_pool tp;
  CHECK(!tp.is_in_this_context());
  tp.start(2);
  CHECK(async(tp, [&] { return tp.is_in_this_context(); }).get());
  CHECK(!tp.is_in_this_context());
  tp.stop();
}

TEST_CASE("thread_pool should run work in the context it was posted from")
{
  async_local<int> local;
  std::optional<int> inside;
  std::optional<int> outside{0};
  thread_pool tp;
  tp.start(2);
  {
    async_local<int>::scope const _(local, 42);
    tp.post([&] { inside = local.get(); });
  }
  tp.post([&] { outside = local.get(); });
  tp.stop();
  CHECK(42 == inside);
  CHECK(!outside);
}

TEST_CASE("sync should run the function in place and keep its exception")
{
  auto const caller = std::this_thread::get_id();
  auto fut = sync([&] { return std::this_thread::get_id() == caller; });
  REQUIRE(fut.is_ready());
  CHECK(fut.get());

  auto failed = sync([]() -> int { throw std::runtime_error("kaboom"); });
  REQUIRE(failed.is_ready());
  CHECK_THROWS_AS(failed.get(), std::runtime_error);
}

TEST_CASE("async should run on the default executor")
{
  auto fut = async([] { return std::this_thread::get_id(); });
  CHECK(std::this_thread::get_id() != fut.get());
}
