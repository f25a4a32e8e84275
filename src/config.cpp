#include "config.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace nerf_rays
{

Config parse_config(const YAML::Node & root)
{
  Config config;
  config.seed = root["seed"].as<int64_t>();

  const YAML::Node & sampler = root["sampler"];
  config.sampler.num_samples = sampler["num_samples"].as<int64_t>();
  config.sampler.near = sampler["near"].as<float>();
  config.sampler.far = sampler["far"].as<float>();
  config.sampler.stratified = sampler["stratified"].as<bool>();

  const YAML::Node & renderer = root["renderer"];
  config.renderer.chunk_size = renderer["chunk_size"].as<int64_t>();
  config.renderer.background = renderer["background"].as<float>();

  // Only the command line tool needs a scene.
  const YAML::Node & scene = root["test_scene"];
  if (scene) {
    config.test_scene.height = scene["height"].as<int64_t>();
    config.test_scene.width = scene["width"].as<int64_t>();
    config.test_scene.sphere_radius = scene["sphere_radius"].as<float>();
    config.test_scene.sphere_density = scene["sphere_density"].as<float>();
  }

  if (config.seed < 0) {
    throw std::runtime_error(fmt::format("seed must be non-negative, got {}", config.seed));
  }
  if (config.sampler.num_samples < 2) {
    throw std::runtime_error(
      fmt::format("sampler.num_samples must be at least 2, got {}", config.sampler.num_samples));
  }
  if (!(config.sampler.near < config.sampler.far)) {
    throw std::runtime_error(fmt::format(
      "sampler.near ({}) must be smaller than sampler.far ({})", config.sampler.near,
      config.sampler.far));
  }
  if (config.renderer.chunk_size < 1) {
    throw std::runtime_error(
      fmt::format("renderer.chunk_size must be positive, got {}", config.renderer.chunk_size));
  }
  if (config.test_scene.height < 1 || config.test_scene.width < 1) {
    throw std::runtime_error(fmt::format(
      "test_scene size must be positive, got {}x{}", config.test_scene.height,
      config.test_scene.width));
  }
  return config;
}

Config load_config(const std::string & config_path)
{
  const YAML::Node root = YAML::LoadFile(config_path);
  return parse_config(root);
}

}  // namespace nerf_rays
