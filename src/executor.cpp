#include <asynclazy/executor.hpp>

#include <asynclazy/thread_pool.hpp>

#include <algorithm>
#include <thread>

namespace asynclazy
{
namespace
{
enum class global_pool
{
  single,
  background,
};

thread_pool& pool(global_pool which)
{
  static thread_pool single;
  static thread_pool background;
  return which == global_pool::single ? single : background;
}

thread_pool& started(global_pool which, unsigned int thread_count)
{
  auto& tp = pool(which);
  if (!tp.is_running())
    tp.start(thread_count);
  return tp;
}
}

executor get_default_executor()
{
  static auto& tp = started(global_pool::single, 1);
  return tp;
}

executor get_background_executor()
{
  // hardware_concurrency() is 0 when unknown
  static auto& tp = started(global_pool::background,
                            std::max(2u, std::thread::hardware_concurrency()));
  return tp;
}

void shutdown()
{
  pool(global_pool::background).stop();
  pool(global_pool::single).stop();
}
}
