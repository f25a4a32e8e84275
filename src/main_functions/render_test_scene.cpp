#include "../common.hpp"
#include "../config.hpp"
#include "../field.hpp"
#include "../ray_bundle.hpp"
#include "../renderer.hpp"
#include "../stop_watch.hpp"
#include "../uniform_sampler.hpp"
#include "main_functions.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <vector>

namespace nerf_rays
{
using Tensor = torch::Tensor;

CameraRayBundle make_orthographic_rays(int64_t height, int64_t width)
{
  Tensor ys = torch::linspace(1.f, -1.f, height, CPUFloat);
  Tensor xs = torch::linspace(-1.f, 1.f, width, CPUFloat);
  std::vector<Tensor> grid = torch::meshgrid({ys, xs}, "ij");
  Tensor origins =
    torch::stack({grid[1], grid[0], torch::full({height, width}, -2.f, CPUFloat)}, -1);
  Tensor directions = torch::zeros({height, width, 3}, CPUFloat);
  directions.index_put_({"...", 2}, 1.f);
  return CameraRayBundle(origins, directions, std::nullopt, 0);
}

void render_test_scene(const std::string & config_path)
{
  ScopeWatch watch("render_test_scene");

  const Config config = load_config(config_path);
  torch::manual_seed(static_cast<uint64_t>(config.seed));

  const TestSceneParam & scene = config.test_scene;
  std::cout << fmt::format(
                 "scene: {}x{}, sphere radius = {}, density = {}", scene.height, scene.width,
                 scene.sphere_radius, scene.sphere_density)
            << std::endl;

  auto sampler = std::make_shared<UniformSampler>(config.sampler);
  auto field = std::make_shared<SphereField>(
    std::vector<float>{0.f, 0.f, 0.f}, scene.sphere_radius, scene.sphere_density,
    std::vector<float>{1.f, .5f, .25f});
  Renderer renderer(config.renderer, sampler, field);

  CameraRayBundle camera_ray_bundle = make_orthographic_rays(scene.height, scene.width);

  Timer timer;
  RenderResult result = renderer.render_image(camera_ray_bundle);
  const double elapsed = timer.elapsed_seconds();

  Tensor hit = result.accumulation > .5f;
  const int64_t n_hit = hit.sum().item<int64_t>();
  std::cout << fmt::format(
                 "rendered {} rays in {:.3f} s, {} hit the sphere ({:.1f}%)",
                 camera_ray_bundle.get_num_rays(), elapsed, n_hit,
                 100.0 * n_hit / camera_ray_bundle.get_num_rays())
            << std::endl;
  if (n_hit > 0) {
    Tensor hit_depth = result.depth.index({hit});
    std::cout << fmt::format(
                   "depth of hits: min = {:.4f}, max = {:.4f}", hit_depth.min().item<float>(),
                   hit_depth.max().item<float>())
              << std::endl;
  }
  std::cout << fmt::format("mean color: {}", c10::str(result.colors.mean({0, 1})))
            << std::endl;
}

}  // namespace nerf_rays
