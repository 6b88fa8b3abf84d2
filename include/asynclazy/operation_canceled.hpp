#ifndef ASYNCLAZY_OPERATION_CANCELED_HPP
#define ASYNCLAZY_OPERATION_CANCELED_HPP

#include <exception>

namespace asynclazy
{
struct operation_canceled : std::exception
{
  char const* what() const noexcept override
  {
    return "operation was canceled";
  }
};
}

#endif
