#include "stop_watch.hpp"

#include <fmt/core.h>

#include <iostream>

namespace nerf_rays
{

ScopeWatch::ScopeWatch(const std::string & scope_name) : scope_name_(scope_name)
{
  std::cout << fmt::format("---- {} start ----", scope_name_) << std::endl;
}

ScopeWatch::~ScopeWatch()
{
  std::cout << fmt::format(
                 "---- {} end: {:.3f} seconds ----", scope_name_, timer_.elapsed_seconds())
            << std::endl;
}

}  // namespace nerf_rays
