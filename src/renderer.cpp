#include "renderer.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace nerf_rays
{
using Tensor = torch::Tensor;

Renderer::Renderer(
  const RendererParam & param, std::shared_ptr<UniformSampler> sampler,
  std::shared_ptr<Field> field)
: param_(param), sampler_(std::move(sampler)), field_(std::move(field))
{
  if (param_.chunk_size < 1) {
    throw std::runtime_error(fmt::format("chunk_size must be positive, got {}", param_.chunk_size));
  }
}

RenderResult Renderer::render(const RayBundle & ray_bundle, RunningMode mode)
{
  const int64_t n_rays = ray_bundle.size();
  const auto options =
    torch::TensorOptions().dtype(torch::kFloat32).device(ray_bundle.origins().device());

  Tensor ts = sampler_->get_ts(ray_bundle, mode);
  RaySamples ray_samples = ray_bundle.get_ray_samples(ts);
  FieldOutput field_output = field_->query(ray_samples.to_point_samples());

  Tensor weights = ray_samples.get_weights(field_output.densities);  // [ n_rays, n_samples ]
  Tensor accumulation = weights.sum(-1);

  Tensor bg_color =
    ((mode == RunningMode::TRAIN) ? torch::rand({n_rays, 3}, options)
                                  : torch::full({n_rays, 3}, param_.background, options));
  Tensor colors = (weights.unsqueeze(-1) * field_output.colors).sum(-2);
  colors = colors + (1.f - accumulation).unsqueeze(-1) * bg_color;
  Tensor depth = (weights * ts).sum(-1) / (accumulation + 1e-4f);

  if (n_rays > 0) {
    TORCH_CHECK(std::isfinite(colors.mean().item<float>()), "composited colors are not finite");
  }

  return {colors, depth, accumulation, weights};
}

RenderResult Renderer::render_image(const CameraRayBundle & camera_ray_bundle)
{
  torch::NoGradGuard no_grad_guard;

  const int64_t n_rays = camera_ray_bundle.get_num_rays();
  const int64_t height = camera_ray_bundle.height();
  const int64_t width = camera_ray_bundle.width();

  if (n_rays == 0) {
    const auto options = camera_ray_bundle.origins().options().dtype(torch::kFloat32);
    const int64_t n_samples = sampler_->param().num_samples;
    return {
      torch::zeros({height, width, 3}, options), torch::zeros({height, width}, options),
      torch::zeros({height, width}, options), torch::zeros({height, width, n_samples}, options)};
  }

  std::vector<Tensor> colors, depth, accumulation, weights;
  for (int64_t i = 0; i < n_rays; i += param_.chunk_size) {
    const int64_t i_high = std::min(i + param_.chunk_size, n_rays);
    RayBundle chunk = camera_ray_bundle.get_row_major_sliced_ray_bundle(i, i_high);
    RenderResult result = render(chunk, RunningMode::VALIDATE);
    colors.push_back(result.colors);
    depth.push_back(result.depth);
    accumulation.push_back(result.accumulation);
    weights.push_back(result.weights);
  }

  return {
    torch::cat(colors, 0).reshape({height, width, 3}),
    torch::cat(depth, 0).reshape({height, width}),
    torch::cat(accumulation, 0).reshape({height, width}),
    torch::cat(weights, 0).reshape({height, width, -1})};
}

}  // namespace nerf_rays
