#ifndef NERF_RAYS__RENDERER_HPP_
#define NERF_RAYS__RENDERER_HPP_

#include "field.hpp"
#include "ray_bundle.hpp"
#include "uniform_sampler.hpp"

#include <torch/torch.h>

#include <cstdint>
#include <memory>

namespace nerf_rays
{

struct RendererParam
{
  int64_t chunk_size = 4096;
  float background = .5f;
};

struct RenderResult
{
  using Tensor = torch::Tensor;
  Tensor colors;        // [ n_rays, 3 ]
  Tensor depth;         // [ n_rays ]
  Tensor accumulation;  // [ n_rays ]
  Tensor weights;       // [ n_rays, n_samples ]
};

class Renderer
{
  using Tensor = torch::Tensor;

public:
  Renderer(
    const RendererParam & param, std::shared_ptr<UniformSampler> sampler,
    std::shared_ptr<Field> field);

  RenderResult render(const RayBundle & ray_bundle, RunningMode mode);

  // Renders chunk_size rays at a time without gradients. The result tensors
  // are shaped [ height, width, ... ].
  RenderResult render_image(const CameraRayBundle & camera_ray_bundle);

private:
  RendererParam param_;
  std::shared_ptr<UniformSampler> sampler_;
  std::shared_ptr<Field> field_;
};

}  // namespace nerf_rays

#endif  // NERF_RAYS__RENDERER_HPP_
