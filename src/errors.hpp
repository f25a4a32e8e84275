#ifndef NERF_RAYS__ERRORS_HPP_
#define NERF_RAYS__ERRORS_HPP_

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace nerf_rays
{

// Raised when a tensor argument or a requested size does not satisfy the
// shape contract of an operation.
class ShapeError : public std::runtime_error
{
public:
  explicit ShapeError(const std::string & what) : std::runtime_error(what) {}
};

// Raised when an operation needs an optional field that is absent.
class MissingFieldError : public std::runtime_error
{
public:
  explicit MissingFieldError(const std::string & field)
  : std::runtime_error(fmt::format("required field '{}' is absent", field)), field_(field)
  {
  }

  const std::string & field() const { return field_; }

private:
  std::string field_;
};

template <typename... Args>
inline void check_shape(bool condition, fmt::format_string<Args...> format, Args &&... args)
{
  if (!condition) {
    throw ShapeError(fmt::format(format, std::forward<Args>(args)...));
  }
}

}  // namespace nerf_rays

#endif  // NERF_RAYS__ERRORS_HPP_
