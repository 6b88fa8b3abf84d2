#include <asynclazy/affine_scheduler.hpp>

#include <asynclazy/async.hpp>
#include <asynclazy/execution_context.hpp>
#include <asynclazy/thread_pool.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace asynclazy
{
struct affine_scheduler::impl
{
  class task;
  struct frame;

  struct work_item
  {
    std::shared_ptr<task> owner;
    fu2::unique_function<void()> work;
    std::string name;
  };

  std::thread::id const thread_id{std::this_thread::get_id()};

  std::mutex mutex;
  std::condition_variable cond;
  std::deque<work_item> queue;

  error_handler_cb error_cb{detail::default_error_cb};

  async_local<std::shared_ptr<task>> current_task;
  async_local<std::shared_ptr<frame>> current_frame;

  void notify()
  {
    // taking the lock makes sure a waiter is either before its check or
    // already waiting
    {
      std::lock_guard<std::mutex> lock{mutex};
    }
    cond.notify_all();
  }

  void adopt(std::shared_ptr<task> const& child);
  void join(std::shared_ptr<task> const& t);
  void execute(work_item& item);

  static bool depends_on(std::vector<std::shared_ptr<task>> const& tasks,
                         task const* t);
};

class affine_scheduler::impl::task
  : public joinable_task,
    public std::enable_shared_from_this<task>
{
public:
  explicit task(std::weak_ptr<impl> scheduler)
    : _scheduler(std::move(scheduler))
  {
  }

  future<void> join() override
  {
    if (auto const s = _scheduler.lock())
      s->join(shared_from_this());
    if (!done.is_valid())
      return make_ready_future();
    return done.to_void();
  }

  // set once by start(), before the task is handed out
  shared_future<void> done;
  // guarded by impl::mutex
  std::vector<std::shared_ptr<task>> children;

private:
  std::weak_ptr<impl> _scheduler;
};

struct affine_scheduler::impl::frame
{
  // guarded by impl::mutex
  std::vector<std::shared_ptr<task>> joined;
  bool finished{false};
};

void affine_scheduler::impl::adopt(std::shared_ptr<task> const& child)
{
  auto const parent = current_task.get();
  if (!parent)
    return;
  std::lock_guard<std::mutex> lock{mutex};
  (*parent)->children.push_back(child);
}

void affine_scheduler::impl::join(std::shared_ptr<task> const& t)
{
  auto const f = current_frame.get();
  if (!f)
    return;
  {
    std::lock_guard<std::mutex> lock{mutex};
    (*f)->joined.push_back(t);
  }
  cond.notify_all();
}

void affine_scheduler::impl::execute(work_item& item)
{
  try
  {
    item.work();
  }
  catch (...)
  {
    try
    {
      error_cb(std::current_exception());
    }
    catch (...)
    {
      std::cerr << "asynclazy: exception thrown in error handler" << std::endl;
    }
  }
}

bool affine_scheduler::impl::depends_on(
    std::vector<std::shared_ptr<task>> const& tasks, task const* t)
{
  return std::any_of(tasks.begin(), tasks.end(), [&](auto const& candidate) {
    return candidate.get() == t || depends_on(candidate->children, t);
  });
}

affine_scheduler::affine_scheduler() : _p(std::make_shared<impl>())
{
}

affine_scheduler::~affine_scheduler()
{
  // dropping the work breaks its promises, whose continuations may post more
  // work, so drop until nothing comes back
  while (true)
  {
    std::deque<impl::work_item> dropped;
    {
      std::lock_guard<std::mutex> lock{_p->mutex};
      if (_p->queue.empty())
        break;
      dropped.swap(_p->queue);
    }
  }
}

bool affine_scheduler::is_in_this_context() const
{
  return std::this_thread::get_id() == _p->thread_id;
}

void affine_scheduler::post(fu2::unique_function<void()> work,
                            std::string name)
{
  auto owner = _p->current_task.get();
  {
    std::lock_guard<std::mutex> lock{_p->mutex};
    _p->queue.push_back(
        impl::work_item{owner ? std::move(*owner) : nullptr,
                        capture_context(std::move(work)),
                        std::move(name)});
  }
  _p->cond.notify_all();
}

std::size_t affine_scheduler::run_pending()
{
  if (!is_in_this_context())
    throw std::logic_error(
        "affine_scheduler::run_pending called from a foreign thread");

  std::size_t count = 0;
  while (true)
  {
    impl::work_item item;
    {
      std::lock_guard<std::mutex> lock{_p->mutex};
      if (_p->queue.empty())
        break;
      item = std::move(_p->queue.front());
      _p->queue.pop_front();
    }
    _p->execute(item);
    ++count;
  }
  return count;
}

void affine_scheduler::set_error_handler(error_handler_cb cb)
{
  if (!cb)
    throw std::invalid_argument("affine_scheduler: empty error handler");
  _p->error_cb = std::move(cb);
}

joinable_task_ptr affine_scheduler::start(
    fu2::unique_function<future<void>()> work)
{
  auto const t = std::make_shared<impl::task>(_p);
  _p->adopt(t);

  auto fut = [&] {
    async_local<std::shared_ptr<impl::task>>::scope const _(_p->current_task,
                                                            t);
    return sync(std::move(work)).unwrap();
  }();
  t->done = fut.to_shared();
  t->done.then(get_synchronous_executor(),
               [w = std::weak_ptr<impl>(_p)](auto const&) {
                 if (auto const p = w.lock())
                   p->notify();
               });
  return t;
}

void affine_scheduler::block_on(deadline_type deadline,
                                fu2::unique_function<future<void>()> start_work)
{
  auto const owner = std::make_shared<impl::task>(_p);
  _p->adopt(owner);
  auto const f = std::make_shared<impl::frame>();
  f->joined.push_back(owner);

  auto ready = [&] {
    async_local<std::shared_ptr<impl::frame>>::scope const _frame(
        _p->current_frame, f);
    async_local<std::shared_ptr<impl::task>>::scope const _task(
        _p->current_task, owner);
    return start_work();
  }();
  ready.then(get_synchronous_executor(),
             [w = std::weak_ptr<impl>(_p), f](auto const&) {
               auto const p = w.lock();
               if (!p)
                 return;
               {
                 std::lock_guard<std::mutex> lock{p->mutex};
                 f->finished = true;
               }
               p->cond.notify_all();
             });

  // only the scheduler's thread may run its work, other threads just wait
  bool const pump = is_in_this_context();

  std::unique_lock<std::mutex> lock{_p->mutex};
  while (!f->finished)
  {
    if (pump)
    {
      auto const it = std::find_if(
          _p->queue.begin(), _p->queue.end(), [&](auto const& item) {
            return item.owner && impl::depends_on(f->joined, item.owner.get());
          });
      if (it != _p->queue.end())
      {
        auto item = std::move(*it);
        _p->queue.erase(it);
        lock.unlock();
        _p->execute(item);
        lock.lock();
        continue;
      }
    }

    if (!deadline)
      _p->cond.wait(lock);
    else if (_p->cond.wait_until(lock, *deadline) == std::cv_status::timeout)
      break;
  }
}
}
