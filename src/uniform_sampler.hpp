#ifndef NERF_RAYS__UNIFORM_SAMPLER_HPP_
#define NERF_RAYS__UNIFORM_SAMPLER_HPP_

#include "ray_bundle.hpp"

#include <torch/torch.h>

#include <cstdint>

namespace nerf_rays
{

enum RunningMode { TRAIN, VALIDATE };

struct SamplerParam
{
  int64_t num_samples = 64;
  float near = 0.5f;
  float far = 4.0f;
  bool stratified = true;
};

// Chooses sample distances evenly spread between the near and far bound of
// each ray. Per-ray nears/fars of the bundle take precedence over the
// parameters.
class UniformSampler
{
  using Tensor = torch::Tensor;

public:
  explicit UniformSampler(const SamplerParam & param);

  // Returns ts [ n_rays, num_samples ], increasing along each ray. In TRAIN
  // mode with stratified sampling every sample is jittered inside its bin,
  // otherwise bin centers are used. Throws ShapeError if the resolved near
  // bound of any ray is not below its far bound.
  Tensor get_ts(const RayBundle & ray_bundle, RunningMode mode) const;

  const SamplerParam & param() const { return param_; }

private:
  SamplerParam param_;
};

}  // namespace nerf_rays

#endif  // NERF_RAYS__UNIFORM_SAMPLER_HPP_
