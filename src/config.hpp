#ifndef NERF_RAYS__CONFIG_HPP_
#define NERF_RAYS__CONFIG_HPP_

#include "renderer.hpp"
#include "uniform_sampler.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace nerf_rays
{

struct TestSceneParam
{
  int64_t height = 64;
  int64_t width = 64;
  float sphere_radius = .75f;
  float sphere_density = 20.f;
};

struct Config
{
  int64_t seed = 2022;
  SamplerParam sampler;
  RendererParam renderer;
  TestSceneParam test_scene;
};

Config parse_config(const YAML::Node & root);
Config load_config(const std::string & config_path);

}  // namespace nerf_rays

#endif  // NERF_RAYS__CONFIG_HPP_
