#include <asynclazy/detail/owned_mutex.hpp>
#include <asynclazy/promise.hpp>

#include <doctest/doctest.h>

#include <mutex>
#include <thread>

using namespace asynclazy;

TEST_CASE("owned_mutex should be held only by the thread that locked it")
{
  detail::owned_mutex mutex;
  CHECK(!mutex.is_held_by_current_thread());

  {
    std::lock_guard<detail::owned_mutex> lock{mutex};
    CHECK(mutex.is_held_by_current_thread());

    bool held_elsewhere = true;
    std::thread([&] {
      held_elsewhere = mutex.is_held_by_current_thread();
    }).join();
    CHECK(!held_elsewhere);
  }

  CHECK(!mutex.is_held_by_current_thread());
}

TEST_CASE("owned_mutex locked by another thread should not be held here")
{
  detail::owned_mutex mutex;
  promise<void> locked;
  promise<void> release;

  std::thread holder([&, released = release.get_future()]() mutable {
    std::lock_guard<detail::owned_mutex> lock{mutex};
    locked.set_value({});
    released.wait();
  });

  locked.get_future().wait();
  CHECK(!mutex.is_held_by_current_thread());
  release.set_value({});
  holder.join();

  std::lock_guard<detail::owned_mutex> lock{mutex};
  CHECK(mutex.is_held_by_current_thread());
}
