#include "uniform_sampler.hpp"

#include "common.hpp"
#include "errors.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace nerf_rays
{
using Tensor = torch::Tensor;
using torch::indexing::None;

UniformSampler::UniformSampler(const SamplerParam & param) : param_(param)
{
  if (param_.num_samples < 2) {
    throw std::runtime_error(
      fmt::format("num_samples must be at least 2, got {}", param_.num_samples));
  }
  if (!(param_.near < param_.far)) {
    throw std::runtime_error(
      fmt::format("near ({}) must be smaller than far ({})", param_.near, param_.far));
  }
}

Tensor UniformSampler::get_ts(const RayBundle & ray_bundle, RunningMode mode) const
{
  const int64_t n_rays = ray_bundle.size();
  const int64_t n_samples = param_.num_samples;
  const auto options =
    torch::TensorOptions().dtype(torch::kFloat32).device(ray_bundle.origins().device());

  Tensor nears = ray_bundle.nears() ? ray_bundle.nears()->to(options)
                                    : torch::full({n_rays}, param_.near, options);
  Tensor fars = ray_bundle.fars() ? ray_bundle.fars()->to(options)
                                  : torch::full({n_rays}, param_.far, options);
  const int64_t n_inverted = (nears >= fars).sum().item<int64_t>();
  check_shape(n_inverted == 0, "{} of {} rays have near >= far", n_inverted, n_rays);

  Tensor offsets;
  if (mode == RunningMode::TRAIN && param_.stratified) {
    offsets = torch::rand({n_rays, n_samples}, options);
  } else {
    offsets = torch::full({n_rays, n_samples}, .5f, options);
  }
  Tensor bin_starts = torch::arange(n_samples, options).index({None, Slc()});
  Tensor fractions = (bin_starts + offsets) / float(n_samples);  // [ n_rays, n_samples ]

  nears = nears.index({Slc(), None});
  fars = fars.index({Slc(), None});
  return nears + (fars - nears) * fractions;
}

}  // namespace nerf_rays
