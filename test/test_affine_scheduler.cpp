#include <asynclazy/affine_scheduler.hpp>
#include <asynclazy/async.hpp>
#include <asynclazy/promise.hpp>

#include <doctest/doctest.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace asynclazy;

TEST_CASE("affine_scheduler should be bound to the constructing thread")
{
  affine_scheduler sched;
  CHECK(sched.is_in_this_context());
  std::thread([&] { CHECK(!sched.is_in_this_context()); }).join();
}

TEST_CASE("run_pending should run posted work in order")
{
  affine_scheduler sched;
  std::vector<int> order;
  sched.post([&] { order.push_back(1); });
  sched.post([&] { order.push_back(2); });

  CHECK(order.empty());
  CHECK(2 == sched.run_pending());
  CHECK((order == std::vector<int>{1, 2}));
  CHECK(0 == sched.run_pending());
}

TEST_CASE("run_pending should refuse to run on a foreign thread")
{
  affine_scheduler sched;
  std::thread([&] {
    CHECK_THROWS_AS(sched.run_pending(), std::logic_error);
  }).join();
}

TEST_CASE("work posted from another thread should run on the affine thread")
{
  affine_scheduler sched;
  auto fut = async(get_background_executor(), [&] {
    return async(sched, [&] { return sched.is_in_this_context(); });
  }).unwrap();

  while (!fut.is_ready())
  {
    sched.run_pending();
    std::this_thread::yield();
  }
  CHECK(fut.get());
}

TEST_CASE("affine_scheduler should route errors to its error handler")
{
  affine_scheduler sched;
  bool called = false;
  sched.set_error_handler([&](std::exception_ptr const& e) {
    called = true;
    CHECK_THROWS_AS(std::rethrow_exception(e), int);
  });

  sched.post([] { throw 18; });
  sched.run_pending();
  CHECK(called);
}

TEST_CASE("run should return the value of a ready future")
{
  affine_scheduler sched;
  CHECK(42 == sched.run([] { return make_ready_future(42); }));
}

TEST_CASE("run should rethrow the exception of the future")
{
  affine_scheduler sched;
  CHECK_THROWS_AS(
      sched.run([] { return make_exceptional_future<int>(18); }), int);
}

TEST_CASE("run should run the work posted within its extent")
{
  affine_scheduler sched;
  CHECK(42 == sched.run([&] { return async(sched, [] { return 42; }); }));
}

TEST_CASE("run should wait for work done on another thread")
{
  affine_scheduler sched;
  CHECK(42 == sched.run([] {
          return async(get_background_executor(), [] { return 42; });
        }));
}

TEST_CASE("run should not run work it does not depend on [waiting]")
{
  affine_scheduler sched;
  bool ran = false;
  promise<int> prom;
  sched.post([&] { ran = true; });

  auto fut = sched.run_for(std::chrono::milliseconds(50),
                           [&] { return prom.get_future(); });

  CHECK(!fut.is_ready());
  CHECK(!ran);
  CHECK(1 == sched.run_pending());
  CHECK(ran);
}

TEST_CASE("run should run the work of the tasks it joins")
{
  affine_scheduler sched;
  auto result = sched.run_async<int>(
      [&] { return async(sched, [] { return 42; }); });
  CHECK(!result.value.is_ready());

  CHECK(42 == sched.run([&] {
          result.task->join();
          return result.value;
        }));
}

TEST_CASE("run should run the work of the children of the tasks it joins")
{
  affine_scheduler sched;
  auto result = sched.run_async<int>([&] {
    auto inner = sched.run_async<int>(
        [&] { return async(sched, [] { return 21; }); });
    return inner.value.then(
        get_synchronous_executor(),
        [](shared_future<int> fut) { return fut.get() * 2; });
  });

  CHECK(42 == sched.run([&] {
          result.task->join();
          return result.value;
        }));
}

TEST_CASE("joining a task outside of run should not run anything")
{
  affine_scheduler sched;
  auto result = sched.run_async<int>(
      [&] { return async(sched, [] { return 42; }); });

  auto joined = result.task->join();
  CHECK(!joined.is_ready());
  sched.run_pending();
  CHECK(joined.is_ready());
  CHECK(42 == result.value.get());
}

TEST_CASE(
    "destroying an affine_scheduler should drop the work posted by the work "
    "it drops")
{
  future<void> chained;
  {
    affine_scheduler sched;
    chained = async(sched, [] {}).then(executor(sched),
                                       [](future<void> fut) { fut.get(); });
  }
  REQUIRE(chained.is_ready());
  CHECK_THROWS_AS(chained.get(), broken_promise);
}
