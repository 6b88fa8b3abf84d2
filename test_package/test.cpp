#include <iostream>
#include <string>

#include <asynclazy/async.hpp>
#include <asynclazy/async_lazy.hpp>

int main()
{
  al::async_lazy<std::string> lazy(
      [] { return al::async([] { return std::string("Hello, World!"); }); });
  std::cout << lazy.get_value().get() << std::endl;
  std::cout << lazy << std::endl;
  al::shutdown();
}
