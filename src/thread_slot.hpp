#ifndef ASYNCLAZY_SRC_THREAD_SLOT_HPP
#define ASYNCLAZY_SRC_THREAD_SLOT_HPP

#if !ASYNCLAZY_USE_THREAD_LOCAL
#include <boost/thread/tss.hpp>
#endif

namespace asynclazy
{
namespace detail
{
/// The calling thread's instance of T, value-initialized on first access
template <typename T, typename Tag>
T& thread_slot()
{
#if ASYNCLAZY_USE_THREAD_LOCAL
  thread_local T value{};
  return value;
#else
  static boost::thread_specific_ptr<T> slot;
  auto p = slot.get();
  if (!p)
    slot.reset(p = new T{});
  return *p;
#endif
}
}
}

#endif
