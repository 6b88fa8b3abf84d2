#ifndef ASYNCLAZY_DETAIL_TVOID_HPP
#define ASYNCLAZY_DETAIL_TVOID_HPP

#include <type_traits>

namespace asynclazy
{
/// Value type of a future<void>
struct tvoid
{
};

namespace detail
{
template <typename T>
using void_to_tvoid_t = std::conditional_t<std::is_same_v<T, void>, tvoid, T>;
}
}

#endif
