#ifndef NERF_RAYS__STOP_WATCH_HPP_
#define NERF_RAYS__STOP_WATCH_HPP_

#include <chrono>
#include <string>

namespace nerf_rays
{

// Measures wall time from the last start(). Construction starts it.
class Timer
{
public:
  Timer() { start(); }

  void start() { start_time_ = std::chrono::steady_clock::now(); }
  double elapsed_seconds() const
  {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
  }

private:
  std::chrono::steady_clock::time_point start_time_;
};

// Prints the time spent in the enclosing scope when destroyed.
class ScopeWatch
{
public:
  explicit ScopeWatch(const std::string & scope_name);
  ~ScopeWatch();

private:
  Timer timer_;
  std::string scope_name_;
};

}  // namespace nerf_rays

#endif  // NERF_RAYS__STOP_WATCH_HPP_
