#ifndef NERF_RAYS__RAY_BUNDLE_HPP_
#define NERF_RAYS__RAY_BUNDLE_HPP_

#include "ray_samples.hpp"

#include <torch/torch.h>

#include <cstdint>
#include <optional>

namespace nerf_rays
{

class CameraRayBundle;

// A flat bundle of rays. Every present optional field has one entry per ray.
class RayBundle
{
  using Tensor = torch::Tensor;

public:
  // origins, directions: [ n_rays, 3 ]
  // camera_indices, nears, fars, valid_mask: [ n_rays ]
  RayBundle(
    const Tensor & origins, const Tensor & directions,
    std::optional<Tensor> camera_indices = std::nullopt, std::optional<Tensor> nears = std::nullopt,
    std::optional<Tensor> fars = std::nullopt, std::optional<Tensor> valid_mask = std::nullopt);

  const Tensor & origins() const { return origins_; }
  const Tensor & directions() const { return directions_; }
  const std::optional<Tensor> & camera_indices() const { return camera_indices_; }
  const std::optional<Tensor> & nears() const { return nears_; }
  const std::optional<Tensor> & fars() const { return fars_; }
  const std::optional<Tensor> & valid_mask() const { return valid_mask_; }

  int64_t size() const { return origins_.size(0); }

  // Moves every present field to the device in place.
  void move_to_device(const torch::Device & device);

  // Random subset of num_rays distinct rays, drawn with the global torch
  // generator. Only origins, directions and camera_indices are carried over.
  RayBundle sample(int64_t num_rays) const;

  // valid_mask: bool [ n_rays ]. Absent fields stay absent.
  RayBundle get_masked_ray_bundle(const Tensor & valid_mask) const;

  // ts: [ n_rays, n_samples ] with n_samples >= 2. The last sample reuses the
  // width of the interval before it.
  RaySamples get_ray_samples(const Tensor & ts) const;

  // Requires n_rays == image_height * image_width.
  CameraRayBundle to_camera_ray_bundle(int64_t image_height, int64_t image_width) const;

private:
  Tensor origins_;
  Tensor directions_;
  std::optional<Tensor> camera_indices_;
  std::optional<Tensor> nears_;
  std::optional<Tensor> fars_;
  std::optional<Tensor> valid_mask_;
};

// Rays laid out on an image grid, one ray per pixel. camera_indices, when
// present, is kept in sync with camera_index by set_camera_indices.
class CameraRayBundle
{
  using Tensor = torch::Tensor;

public:
  // origins, directions: [ height, width, 3 ], camera_indices: [ height, width ]
  // A given camera_index overrides camera_indices.
  CameraRayBundle(
    const Tensor & origins, const Tensor & directions,
    std::optional<Tensor> camera_indices = std::nullopt,
    std::optional<int64_t> camera_index = std::nullopt);

  const Tensor & origins() const { return origins_; }
  const Tensor & directions() const { return directions_; }
  const std::optional<Tensor> & camera_indices() const { return camera_indices_; }
  std::optional<int64_t> camera_index() const { return camera_index_; }

  int64_t height() const { return origins_.size(0); }
  int64_t width() const { return origins_.size(1); }
  int64_t get_num_rays() const { return height() * width(); }

  // Fills camera_indices with camera_index and stores the scalar.
  void set_camera_indices(int64_t camera_index);

  // Moves every present field to the device in place.
  void move_to_device(const torch::Device & device);

  // Flattened origins and directions only; camera_indices is not carried over.
  RayBundle to_ray_bundle() const;

  // Rays [start_idx, end_idx) in row-major pixel order.
  RayBundle get_row_major_sliced_ray_bundle(int64_t start_idx, int64_t end_idx) const;

private:
  Tensor origins_;
  Tensor directions_;
  std::optional<Tensor> camera_indices_;
  std::optional<int64_t> camera_index_;
};

}  // namespace nerf_rays

#endif  // NERF_RAYS__RAY_BUNDLE_HPP_
