#include <asynclazy/execution_context.hpp>

#include "thread_slot.hpp"

#include <atomic>

namespace asynclazy
{
namespace
{
struct current_context_tag;

std::atomic<std::uint64_t> next_key{0};
}

execution_context::scope::scope(execution_context ctx)
  : _previous(std::move(current()))
{
  current() = std::move(ctx);
}

execution_context::scope::~scope()
{
  current() = std::move(_previous);
}

execution_context execution_context::capture()
{
  return current();
}

execution_context& execution_context::current()
{
  return detail::thread_slot<execution_context, current_context_tag>();
}

std::uint64_t execution_context::make_key()
{
  return ++next_key;
}

std::shared_ptr<void const> execution_context::find(std::uint64_t key) const
{
  if (!_values)
    return nullptr;
  auto const it = _values->find(key);
  if (it == _values->end())
    return nullptr;
  return it->second;
}

execution_context execution_context::with(
    std::uint64_t key, std::shared_ptr<void const> value) const
{
  auto values = _values ? std::make_shared<storage>(*_values)
                        : std::make_shared<storage>();
  if (value)
    (*values)[key] = std::move(value);
  else
    values->erase(key);

  execution_context ret;
  if (!values->empty())
    ret._values = std::move(values);
  return ret;
}
}
