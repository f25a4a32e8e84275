#include "../src/config.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace
{

const char * kConfig = R"(
seed: 7
sampler:
  num_samples: 48
  near: 0.25
  far: 6.0
  stratified: false
renderer:
  chunk_size: 1024
  background: 1.0
test_scene:
  height: 10
  width: 20
  sphere_radius: 0.5
  sphere_density: 3.0
)";

}  // namespace

TEST(ConfigTest, ParsesEverySection)
{
  const nerf_rays::Config config = nerf_rays::parse_config(YAML::Load(kConfig));
  EXPECT_EQ(config.seed, 7);
  EXPECT_EQ(config.sampler.num_samples, 48);
  EXPECT_FLOAT_EQ(config.sampler.near, .25f);
  EXPECT_FLOAT_EQ(config.sampler.far, 6.f);
  EXPECT_FALSE(config.sampler.stratified);
  EXPECT_EQ(config.renderer.chunk_size, 1024);
  EXPECT_FLOAT_EQ(config.renderer.background, 1.f);
  EXPECT_EQ(config.test_scene.height, 10);
  EXPECT_EQ(config.test_scene.width, 20);
  EXPECT_FLOAT_EQ(config.test_scene.sphere_radius, .5f);
  EXPECT_FLOAT_EQ(config.test_scene.sphere_density, 3.f);
}

TEST(ConfigTest, TestSceneIsOptional)
{
  YAML::Node root = YAML::Load(kConfig);
  root.remove("test_scene");
  const nerf_rays::Config config = nerf_rays::parse_config(root);
  EXPECT_EQ(config.test_scene.height, nerf_rays::TestSceneParam().height);
  EXPECT_EQ(config.test_scene.width, nerf_rays::TestSceneParam().width);
}

TEST(ConfigTest, MissingKeyThrows)
{
  YAML::Node root = YAML::Load(kConfig);
  root["sampler"].remove("far");
  EXPECT_THROW(nerf_rays::parse_config(root), YAML::Exception);
}

TEST(ConfigTest, RejectsInvalidValues)
{
  YAML::Node negative_seed = YAML::Load(kConfig);
  negative_seed["seed"] = -1;
  EXPECT_THROW(nerf_rays::parse_config(negative_seed), std::runtime_error);

  YAML::Node few_samples = YAML::Load(kConfig);
  few_samples["sampler"]["num_samples"] = 1;
  EXPECT_THROW(nerf_rays::parse_config(few_samples), std::runtime_error);

  YAML::Node inverted_bounds = YAML::Load(kConfig);
  inverted_bounds["sampler"]["near"] = 8.0;
  EXPECT_THROW(nerf_rays::parse_config(inverted_bounds), std::runtime_error);

  YAML::Node empty_chunks = YAML::Load(kConfig);
  empty_chunks["renderer"]["chunk_size"] = 0;
  EXPECT_THROW(nerf_rays::parse_config(empty_chunks), std::runtime_error);

  YAML::Node empty_image = YAML::Load(kConfig);
  empty_image["test_scene"]["width"] = 0;
  EXPECT_THROW(nerf_rays::parse_config(empty_image), std::runtime_error);
}

TEST(ConfigTest, MissingFileThrows)
{
  EXPECT_THROW(nerf_rays::load_config("/nonexistent/nerf_rays.yaml"), YAML::BadFile);
}
