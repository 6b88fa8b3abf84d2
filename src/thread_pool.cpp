#include <asynclazy/thread_pool.hpp>

#include <asynclazy/execution_context.hpp>

#include "thread_slot.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

namespace asynclazy
{
namespace
{
struct worker_of_tag;

thread_pool const*& worker_of()
{
  return detail::thread_slot<thread_pool const*, worker_of_tag>();
}
}

namespace detail
{
void default_error_cb(std::exception_ptr const& e)
{
  try
  {
    std::rethrow_exception(e);
  }
  catch (std::exception const& ex)
  {
    std::cerr << "asynclazy: posted work failed: " << ex.what() << std::endl;
  }
  catch (...)
  {
    std::cerr << "asynclazy: posted work failed with an unknown error"
              << std::endl;
  }
}
}

struct thread_pool::impl
{
  boost::asio::io_context io;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      keep_running;
  std::vector<std::thread> workers;

  error_handler_cb on_error{detail::default_error_cb};
  task_trace_handler_cb on_trace;

  void run_work(fu2::unique_function<void()>& work, std::string const& name)
  {
    auto const begin = std::chrono::steady_clock::now();
    try
    {
      work();
    }
    catch (...)
    {
      report(std::current_exception());
    }
    if (on_trace)
      on_trace(name, std::chrono::steady_clock::now() - begin);
  }

  void report(std::exception_ptr const& e)
  {
    try
    {
      on_error(e);
    }
    catch (...)
    {
      std::cerr << "asynclazy: the error handler of a thread_pool threw"
                << std::endl;
    }
  }
};

thread_pool::thread_pool() : _p(std::make_unique<impl>())
{
}

thread_pool::~thread_pool()
{
  stop(true);
}

void thread_pool::start(unsigned int thread_count)
{
  if (is_running())
    throw std::logic_error("thread_pool already running");

  _p->io.restart();
  _p->keep_running.emplace(_p->io.get_executor());
  for (unsigned int i = 0; i < thread_count; ++i)
    _p->workers.emplace_back([this] {
      worker_of() = this;
      _p->io.run();
      worker_of() = nullptr;
    });
}

void thread_pool::stop(bool cancel_work)
{
  _p->keep_running.reset();
  if (cancel_work)
    _p->io.stop();
  for (auto& worker : _p->workers)
    worker.join();
  _p->workers.clear();
}

bool thread_pool::is_running() const
{
  return _p->keep_running.has_value();
}

bool thread_pool::is_in_this_context() const
{
  return worker_of() == this;
}

void thread_pool::post(fu2::unique_function<void()> work, std::string name)
{
  boost::asio::post(_p->io,
                    [p = _p.get(),
                     ctx = execution_context::capture(),
                     work = std::move(work),
                     name = std::move(name)]() mutable {
                      execution_context::scope const _(std::move(ctx));
                      p->run_work(work, name);
                    });
}

void thread_pool::set_error_handler(error_handler_cb cb)
{
  if (!cb)
    throw std::invalid_argument("thread_pool: empty error handler");
  _p->on_error = std::move(cb);
}

void thread_pool::set_task_trace_handler(task_trace_handler_cb cb)
{
  _p->on_trace = std::move(cb);
}
}
