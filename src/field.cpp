#include "field.hpp"

#include "common.hpp"
#include "errors.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace nerf_rays
{
using Tensor = torch::Tensor;

SphereField::SphereField(
  const std::vector<float> & center, float radius, float density, const std::vector<float> & color)
: radius_(radius), density_(density)
{
  check_shape(center.size() == 3, "sphere center needs 3 coordinates, got {}", center.size());
  check_shape(color.size() == 3, "sphere color needs 3 channels, got {}", color.size());
  if (radius <= 0.f || density < 0.f) {
    throw std::runtime_error(
      fmt::format("invalid sphere: radius = {}, density = {}", radius, density));
  }

  center_ = register_buffer("center", torch::tensor(center, CPUFloat));
  color_ = register_buffer("color", torch::tensor(color, CPUFloat));
}

FieldOutput SphereField::query(const PointSamples & samples)
{
  if (!samples.positions) {
    throw MissingFieldError("positions");
  }
  const Tensor & positions = *samples.positions;
  Tensor inside = torch::linalg_norm(positions - center_, 2, -1, true) < radius_;
  Tensor densities = inside.to(positions.scalar_type()) * density_;
  Tensor colors = color_.expand_as(positions).contiguous();
  return {densities, colors};
}

}  // namespace nerf_rays
