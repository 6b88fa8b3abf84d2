#include <asynclazy/async.hpp>
#include <asynclazy/execution_context.hpp>
#include <asynclazy/future.hpp>
#include <asynclazy/promise.hpp>

#include <doctest/doctest.h>

#include <chrono>
#include <optional>
#include <string>
#include <thread>

using namespace asynclazy;

TEST_CASE("async_local should be empty by default")
{
  async_local<int> local;
  CHECK(!local.get());
  CHECK(execution_context::capture().empty());
}

TEST_CASE("async_local scope should restore the previous value")
{
  async_local<std::string> local;
  local.set(std::string("outer"));
  {
    async_local<std::string>::scope const _(local, "inner");
    CHECK("inner" == *local.get());
  }
  CHECK("outer" == *local.get());
  local.set(std::nullopt);
  CHECK(!local.get());
}

TEST_CASE("async_local scope should restore the whole context it replaced")
{
  async_local<int> scoped;
  async_local<int> other;
  other.set(1);
  {
    async_local<int>::scope const _(scoped, 42);
    other.set(2);
    CHECK(2 == *other.get());
  }
  CHECK(!scoped.get());
  CHECK(1 == *other.get());
  other.set(std::nullopt);
}

TEST_CASE("async_locals should not see each other's values")
{
  async_local<int> a;
  async_local<int> b;
  async_local<int>::scope const _(a, 1);
  CHECK(1 == *a.get());
  CHECK(!b.get());
}

TEST_CASE("async_local should flow to async tasks")
{
  async_local<int> local;
  future<std::optional<int>> fut;
  {
    async_local<int>::scope const _(local, 42);
    fut = async(get_background_executor(), [&] { return local.get(); });
  }
  CHECK(42 == *fut.get());
}

TEST_CASE("async_local should flow to continuations registered in its scope")
{
  async_local<int> local;
  promise<void> prom;
  future<std::optional<int>> fut;
  {
    async_local<int>::scope const _(local, 42);
    fut = prom.get_future().then(
        get_synchronous_executor(),
        [&](future<void> const&) { return local.get(); });
  }

  // the promise is set from outside of the scope
  CHECK(!local.get());
  prom.set_value({});
  CHECK(42 == *fut.get());
}

TEST_CASE("async_local set in a continuation should not leak to its caller")
{
  async_local<int> local;
  promise<void> prom;
  auto fut = prom.get_future().then(get_synchronous_executor(),
                                    [&](future<void> const&) {
                                      local.set(7);
                                      return local.get();
                                    });
  prom.set_value({});
  CHECK(7 == *fut.get());
  CHECK(!local.get());
}

TEST_CASE("concurrent call chains should each see their own value")
{
  async_local<int> local;
  promise<void> go;
  auto const started = go.get_future().to_shared();

  auto const run = [&](int value) {
    async_local<int>::scope const _(local, value);
    return async(get_background_executor(), [&, started]() mutable {
      started.wait();
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      return *local.get();
    });
  };

  auto fut1 = run(1);
  auto fut2 = run(2);
  go.set_value({});
  CHECK(1 == fut1.get());
  CHECK(2 == fut2.get());
}

TEST_CASE("capture_context should run the callable in the captured context")
{
  async_local<int> local;
  auto f = [&] {
    async_local<int>::scope const _(local, 42);
    return capture_context([&] { return local.get(); });
  }();

  CHECK(!local.get());
  CHECK(42 == *f());
  CHECK(!local.get());
}
