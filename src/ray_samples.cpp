#include "ray_samples.hpp"

#include "common.hpp"
#include "errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace nerf_rays
{
using Tensor = torch::Tensor;

namespace
{

void check_vector_field(const std::optional<Tensor> & field, const std::string & name)
{
  if (field) {
    check_shape(
      field->dim() >= 1 && field->size(-1) == 3, "{} must be [..., 3], got {}", name,
      shape_str(*field));
  }
}

}  // namespace

RaySamples::RaySamples(
  std::optional<Tensor> positions, std::optional<Tensor> directions,
  std::optional<Tensor> camera_indices, std::optional<Tensor> valid_mask, std::optional<Tensor> ts,
  std::optional<Tensor> deltas)
{
  check_vector_field(positions, "positions");
  check_vector_field(directions, "directions");

  // The per-sample shape is taken from the first field that carries it.
  std::optional<std::vector<int64_t>> sample_shape;
  auto check_sample_shape = [&sample_shape](const std::vector<int64_t> & shape, const char * name) {
    if (!sample_shape) {
      sample_shape = shape;
      return;
    }
    check_shape(
      shape == *sample_shape, "{} has sample shape {}, expected {}", name,
      c10::str(c10::IntArrayRef(shape)), c10::str(c10::IntArrayRef(*sample_shape)));
  };
  if (positions) {
    const auto sizes = positions->sizes();
    check_sample_shape(std::vector<int64_t>(sizes.begin(), sizes.end() - 1), "positions");
  }
  if (directions) {
    const auto sizes = directions->sizes();
    check_sample_shape(std::vector<int64_t>(sizes.begin(), sizes.end() - 1), "directions");
  }
  if (ts) {
    check_sample_shape(ts->sizes().vec(), "ts");
  }
  if (deltas) {
    check_sample_shape(deltas->sizes().vec(), "deltas");
  }
  if (valid_mask) {
    check_sample_shape(valid_mask->sizes().vec(), "valid_mask");
  }
  if (camera_indices) {
    check_sample_shape(camera_indices->sizes().vec(), "camera_indices");
  }

  positions_ = std::move(positions);
  directions_ = std::move(directions);
  camera_indices_ = std::move(camera_indices);
  valid_mask_ = std::move(valid_mask);
  ts_ = std::move(ts);
  deltas_ = std::move(deltas);
}

PointSamples RaySamples::to_point_samples() const
{
  PointSamples point_samples;
  point_samples.positions = positions_;
  point_samples.directions = directions_;
  point_samples.valid_mask = valid_mask_;
  return point_samples;
}

Tensor RaySamples::get_weights(const Tensor & densities) const
{
  if (!deltas_) {
    throw MissingFieldError("deltas");
  }
  const Tensor & deltas = *deltas_;
  check_shape(
    densities.dim() == deltas.dim() + 1 && densities.size(-1) == 1 &&
      densities.sizes().slice(0, deltas.dim()).equals(deltas.sizes()),
    "densities must be {} + [1], got {}", shape_str(deltas), shape_str(densities));

  Tensor delta_density = deltas * densities.index({"...", 0});
  Tensor alphas = 1.f - torch::exp(-delta_density);

  // Exclusive cumulative sum: the first sample sees nothing in front of it.
  Tensor acc_density = torch::cumsum(delta_density.index({"...", Slc(0, -1)}), -1);
  acc_density =
    torch::cat({torch::zeros_like(delta_density.index({"...", Slc(0, 1)})), acc_density}, -1);
  Tensor trans = torch::exp(-acc_density);

  return alphas * trans;
}

void RaySamples::set_valid_mask(const Tensor & valid_mask)
{
  valid_mask_ = valid_mask;
}

}  // namespace nerf_rays
