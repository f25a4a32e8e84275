#ifndef NERF_RAYS__RAY_SAMPLES_HPP_
#define NERF_RAYS__RAY_SAMPLES_HPP_

#include <torch/torch.h>

#include <optional>

namespace nerf_rays
{

// Samples in space, without any ordering along a ray.
struct PointSamples
{
  using Tensor = torch::Tensor;
  std::optional<Tensor> positions;       // [ ..., 3 ]
  std::optional<Tensor> directions;      // [ ..., 3 ]
  std::optional<Tensor> camera_indices;  // [ ... ]
  std::optional<Tensor> valid_mask;      // [ ... ] bool
};

// Samples ordered along rays. ts and deltas share the leading shape of
// positions without its trailing coordinate dimension.
class RaySamples
{
  using Tensor = torch::Tensor;

public:
  // Throws ShapeError when present fields disagree on the per-sample shape.
  RaySamples(
    std::optional<Tensor> positions, std::optional<Tensor> directions,
    std::optional<Tensor> camera_indices, std::optional<Tensor> valid_mask,
    std::optional<Tensor> ts, std::optional<Tensor> deltas);

  const std::optional<Tensor> & positions() const { return positions_; }
  const std::optional<Tensor> & directions() const { return directions_; }
  const std::optional<Tensor> & camera_indices() const { return camera_indices_; }
  const std::optional<Tensor> & valid_mask() const { return valid_mask_; }
  const std::optional<Tensor> & ts() const { return ts_; }
  const std::optional<Tensor> & deltas() const { return deltas_; }

  // Drops camera_indices, ts and deltas. Does not modify this object.
  PointSamples to_point_samples() const;

  // densities: [ ..., n_samples, 1 ], same leading shape as deltas.
  // Returns the alpha compositing weights [ ..., n_samples ]. Samples are
  // assumed to be sorted by increasing ts. Does not modify this object.
  Tensor get_weights(const Tensor & densities) const;

  // Replaces valid_mask in place.
  void set_valid_mask(const Tensor & valid_mask);

private:
  std::optional<Tensor> positions_;
  std::optional<Tensor> directions_;
  std::optional<Tensor> camera_indices_;
  std::optional<Tensor> valid_mask_;
  std::optional<Tensor> ts_;
  std::optional<Tensor> deltas_;
};

}  // namespace nerf_rays

#endif  // NERF_RAYS__RAY_SAMPLES_HPP_
