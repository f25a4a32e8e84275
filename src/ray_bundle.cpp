#include "ray_bundle.hpp"

#include "common.hpp"
#include "errors.hpp"

#include <string>
#include <utility>

namespace nerf_rays
{
using Tensor = torch::Tensor;
using torch::indexing::None;

namespace
{

void check_per_ray_field(
  const std::optional<Tensor> & field, const std::string & name, int64_t n_rays)
{
  if (field) {
    check_shape(
      field->dim() == 1 && field->size(0) == n_rays, "{} must be [{}], got {}", name, n_rays,
      shape_str(*field));
  }
}

std::optional<Tensor> index_optional(const std::optional<Tensor> & field, const Tensor & index)
{
  if (!field) {
    return std::nullopt;
  }
  return field->index({index});
}

std::optional<Tensor> to_device(const std::optional<Tensor> & field, const torch::Device & device)
{
  if (!field) {
    return std::nullopt;
  }
  return field->to(device);
}

}  // namespace

RayBundle::RayBundle(
  const Tensor & origins, const Tensor & directions, std::optional<Tensor> camera_indices,
  std::optional<Tensor> nears, std::optional<Tensor> fars, std::optional<Tensor> valid_mask)
{
  check_shape(
    origins.dim() == 2 && origins.size(1) == 3, "origins must be [n_rays, 3], got {}",
    shape_str(origins));
  check_shape(
    directions.sizes().equals(origins.sizes()), "directions must be {}, got {}",
    shape_str(origins), shape_str(directions));
  const int64_t n_rays = origins.size(0);
  check_per_ray_field(camera_indices, "camera_indices", n_rays);
  check_per_ray_field(nears, "nears", n_rays);
  check_per_ray_field(fars, "fars", n_rays);
  check_per_ray_field(valid_mask, "valid_mask", n_rays);

  origins_ = origins;
  directions_ = directions;
  camera_indices_ = std::move(camera_indices);
  nears_ = std::move(nears);
  fars_ = std::move(fars);
  valid_mask_ = std::move(valid_mask);
}

void RayBundle::move_to_device(const torch::Device & device)
{
  Tensor origins = origins_.to(device);
  Tensor directions = directions_.to(device);
  std::optional<Tensor> camera_indices = to_device(camera_indices_, device);
  std::optional<Tensor> nears = to_device(nears_, device);
  std::optional<Tensor> fars = to_device(fars_, device);
  std::optional<Tensor> valid_mask = to_device(valid_mask_, device);

  origins_ = std::move(origins);
  directions_ = std::move(directions);
  camera_indices_ = std::move(camera_indices);
  nears_ = std::move(nears);
  fars_ = std::move(fars);
  valid_mask_ = std::move(valid_mask);
}

RayBundle RayBundle::sample(int64_t num_rays) const
{
  check_shape(
    num_rays >= 0 && num_rays <= size(), "cannot sample {} rays from a bundle of {}", num_rays,
    size());
  Tensor indices =
    torch::randperm(size(), torch::TensorOptions().dtype(torch::kLong).device(origins_.device()))
      .index({Slc(0, num_rays)});
  return RayBundle(
    origins_.index({indices}), directions_.index({indices}),
    index_optional(camera_indices_, indices));
}

RayBundle RayBundle::get_masked_ray_bundle(const Tensor & valid_mask) const
{
  check_shape(
    valid_mask.scalar_type() == torch::kBool && valid_mask.dim() == 1 &&
      valid_mask.size(0) == size(),
    "valid_mask must be bool [{}], got {} {}", size(), c10::toString(valid_mask.scalar_type()),
    shape_str(valid_mask));
  return RayBundle(
    origins_.index({valid_mask}), directions_.index({valid_mask}),
    index_optional(camera_indices_, valid_mask), index_optional(nears_, valid_mask),
    index_optional(fars_, valid_mask), index_optional(valid_mask_, valid_mask));
}

RaySamples RayBundle::get_ray_samples(const Tensor & ts) const
{
  check_shape(
    ts.dim() == 2 && ts.size(0) == size(), "ts must be [{}, n_samples], got {}", size(),
    shape_str(ts));
  const int64_t n_samples = ts.size(1);
  check_shape(n_samples >= 2, "at least 2 samples per ray are needed, got {}", n_samples);

  Tensor positions = origins_.index({Slc(), None}) +
                     ts.index({Slc(), Slc(), None}) * directions_.index({Slc(), None});
  Tensor directions = directions_.unsqueeze(1).repeat({1, n_samples, 1});
  Tensor valid_mask = torch::ones_like(ts, torch::TensorOptions().dtype(torch::kBool));

  Tensor dists = ts.index({"...", Slc(1, None)}) - ts.index({"...", Slc(None, -1)});
  dists = torch::cat({dists, dists.index({"...", Slc(-1, None)})}, -1);  // [ n_rays, n_samples ]
  Tensor deltas = dists * torch::linalg_norm(directions_, 2, -1, true);

  std::optional<Tensor> camera_indices;
  if (camera_indices_) {
    camera_indices = camera_indices_->unsqueeze(1).repeat({1, n_samples});
  }

  return RaySamples(positions, directions, camera_indices, valid_mask, ts, deltas);
}

CameraRayBundle RayBundle::to_camera_ray_bundle(int64_t image_height, int64_t image_width) const
{
  check_shape(
    image_height >= 0 && image_width >= 0 && image_height * image_width == size(),
    "cannot reshape {} rays into a {}x{} image", size(), image_height, image_width);
  std::optional<Tensor> camera_indices;
  if (camera_indices_) {
    camera_indices = camera_indices_->reshape({image_height, image_width});
  }
  return CameraRayBundle(
    origins_.reshape({image_height, image_width, 3}),
    directions_.reshape({image_height, image_width, 3}), camera_indices);
}

CameraRayBundle::CameraRayBundle(
  const Tensor & origins, const Tensor & directions, std::optional<Tensor> camera_indices,
  std::optional<int64_t> camera_index)
{
  check_shape(
    origins.dim() == 3 && origins.size(2) == 3, "origins must be [height, width, 3], got {}",
    shape_str(origins));
  check_shape(
    directions.sizes().equals(origins.sizes()), "directions must be {}, got {}",
    shape_str(origins), shape_str(directions));
  if (camera_indices && !camera_index) {
    check_shape(
      camera_indices->dim() == 2 && camera_indices->size(0) == origins.size(0) &&
        camera_indices->size(1) == origins.size(1),
      "camera_indices must be [{}, {}], got {}", origins.size(0), origins.size(1),
      shape_str(*camera_indices));
  }

  origins_ = origins;
  directions_ = directions;
  camera_indices_ = std::move(camera_indices);
  if (camera_index) {
    set_camera_indices(*camera_index);
  }
}

void CameraRayBundle::set_camera_indices(int64_t camera_index)
{
  camera_indices_ = torch::full(
    {height(), width()}, camera_index,
    torch::TensorOptions().dtype(torch::kLong).device(origins_.device()));
  camera_index_ = camera_index;
}

void CameraRayBundle::move_to_device(const torch::Device & device)
{
  Tensor origins = origins_.to(device);
  Tensor directions = directions_.to(device);
  std::optional<Tensor> camera_indices = to_device(camera_indices_, device);

  origins_ = std::move(origins);
  directions_ = std::move(directions);
  camera_indices_ = std::move(camera_indices);
}

RayBundle CameraRayBundle::to_ray_bundle() const
{
  return RayBundle(origins_.reshape({-1, 3}), directions_.reshape({-1, 3}));
}

RayBundle CameraRayBundle::get_row_major_sliced_ray_bundle(int64_t start_idx, int64_t end_idx) const
{
  check_shape(
    start_idx >= 0 && start_idx <= end_idx && end_idx <= get_num_rays(),
    "slice [{}, {}) is out of range for {} rays", start_idx, end_idx, get_num_rays());
  std::optional<Tensor> camera_indices;
  if (camera_indices_) {
    camera_indices = camera_indices_->reshape({-1}).index({Slc(start_idx, end_idx)});
  }
  return RayBundle(
    origins_.reshape({-1, 3}).index({Slc(start_idx, end_idx)}),
    directions_.reshape({-1, 3}).index({Slc(start_idx, end_idx)}), camera_indices);
}

}  // namespace nerf_rays
