#ifndef ASYNCLAZY_DETAIL_OWNED_MUTEX_HPP
#define ASYNCLAZY_DETAIL_OWNED_MUTEX_HPP

#include <atomic>
#include <mutex>
#include <thread>

namespace asynclazy
{
namespace detail
{
/** A std::mutex that remembers which thread holds it
 *
 * It is still not recursive: a thread that needs to lock it again must check
 * is_held_by_current_thread() first instead of blocking on itself.
 */
class owned_mutex
{
public:
  owned_mutex(owned_mutex const&) = delete;
  owned_mutex(owned_mutex&&) = delete;
  owned_mutex& operator=(owned_mutex const&) = delete;
  owned_mutex& operator=(owned_mutex&&) = delete;

  owned_mutex() = default;

  void lock()
  {
    _mutex.lock();
    _owner.store(std::this_thread::get_id());
  }

  void unlock()
  {
    _owner.store(std::thread::id{});
    _mutex.unlock();
  }

  bool is_held_by_current_thread() const
  {
    return _owner.load() == std::this_thread::get_id();
  }

private:
  std::mutex _mutex;
  std::atomic<std::thread::id> _owner{};
};
}
}

#endif
