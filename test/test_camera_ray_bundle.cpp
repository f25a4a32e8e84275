#include "../src/errors.hpp"
#include "../src/ray_bundle.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <vector>

using nerf_rays::CameraRayBundle;
using nerf_rays::RayBundle;
using Tensor = torch::Tensor;

namespace
{

CameraRayBundle make_camera_bundle(int64_t height, int64_t width)
{
  Tensor origins = torch::arange(height * width * 3, torch::kFloat32).reshape({height, width, 3});
  Tensor directions = torch::rand({height, width, 3});
  return CameraRayBundle(origins, directions);
}

}  // namespace

TEST(CameraRayBundleTest, CameraIndexFillsGrid)
{
  Tensor origins = torch::rand({2, 3, 3});
  Tensor stale_indices = torch::arange(6, torch::kLong).reshape({2, 3});
  CameraRayBundle camera_ray_bundle(origins, origins.clone(), stale_indices, 4);

  ASSERT_TRUE(camera_ray_bundle.camera_index().has_value());
  EXPECT_EQ(*camera_ray_bundle.camera_index(), 4);
  EXPECT_TRUE(
    torch::equal(*camera_ray_bundle.camera_indices(), torch::full({2, 3}, 4, torch::kLong)));
}

TEST(CameraRayBundleTest, SetCameraIndices)
{
  CameraRayBundle camera_ray_bundle = make_camera_bundle(2, 3);
  EXPECT_FALSE(camera_ray_bundle.camera_indices().has_value());
  EXPECT_FALSE(camera_ray_bundle.camera_index().has_value());

  camera_ray_bundle.set_camera_indices(5);
  ASSERT_TRUE(camera_ray_bundle.camera_indices().has_value());
  EXPECT_EQ(camera_ray_bundle.camera_indices()->sizes().vec(), (std::vector<int64_t>{2, 3}));
  EXPECT_TRUE(
    torch::equal(*camera_ray_bundle.camera_indices(), torch::full({2, 3}, 5, torch::kLong)));
  EXPECT_EQ(*camera_ray_bundle.camera_index(), 5);
}

TEST(CameraRayBundleTest, NumRays)
{
  EXPECT_EQ(make_camera_bundle(4, 7).get_num_rays(), 28);
}

TEST(CameraRayBundleTest, ConstructorChecksShapes)
{
  EXPECT_THROW(CameraRayBundle(torch::rand({6, 3}), torch::rand({6, 3})), nerf_rays::ShapeError);
  EXPECT_THROW(
    CameraRayBundle(torch::rand({2, 3, 3}), torch::rand({3, 2, 3})), nerf_rays::ShapeError);
  Tensor origins = torch::rand({2, 3, 3});
  EXPECT_THROW(
    CameraRayBundle(origins, origins, torch::zeros({6}, torch::kLong)), nerf_rays::ShapeError);
}

TEST(CameraRayBundleTest, RoundTripThroughRayBundle)
{
  CameraRayBundle camera_ray_bundle = make_camera_bundle(3, 5);
  RayBundle ray_bundle = camera_ray_bundle.to_ray_bundle();
  EXPECT_EQ(ray_bundle.size(), 15);

  CameraRayBundle restored = ray_bundle.to_camera_ray_bundle(3, 5);
  EXPECT_TRUE(torch::equal(restored.origins(), camera_ray_bundle.origins()));
  EXPECT_TRUE(torch::equal(restored.directions(), camera_ray_bundle.directions()));
}

TEST(CameraRayBundleTest, ToRayBundleDropsCameraIndices)
{
  Tensor origins = torch::rand({2, 2, 3});
  CameraRayBundle camera_ray_bundle(origins, origins.clone(), std::nullopt, 1);
  RayBundle ray_bundle = camera_ray_bundle.to_ray_bundle();
  EXPECT_FALSE(ray_bundle.camera_indices().has_value());
}

TEST(CameraRayBundleTest, RowMajorSlices)
{
  CameraRayBundle camera_ray_bundle = make_camera_bundle(4, 5);
  camera_ray_bundle.set_camera_indices(2);

  RayBundle slice = camera_ray_bundle.get_row_major_sliced_ray_bundle(3, 9);
  ASSERT_EQ(slice.size(), 6);
  // Pixel 5 is row 1, column 0.
  EXPECT_TRUE(torch::equal(slice.origins()[2], camera_ray_bundle.origins()[1][0]));
  EXPECT_TRUE(torch::equal(slice.directions()[2], camera_ray_bundle.directions()[1][0]));
  ASSERT_TRUE(slice.camera_indices().has_value());
  EXPECT_TRUE(torch::equal(*slice.camera_indices(), torch::full({6}, 2, torch::kLong)));

  std::vector<Tensor> chunks;
  for (int64_t i = 0; i < camera_ray_bundle.get_num_rays(); i += 8) {
    const int64_t end = std::min<int64_t>(i + 8, camera_ray_bundle.get_num_rays());
    chunks.push_back(camera_ray_bundle.get_row_major_sliced_ray_bundle(i, end).origins());
  }
  EXPECT_TRUE(
    torch::equal(torch::cat(chunks, 0), camera_ray_bundle.origins().reshape({-1, 3})));
}

TEST(CameraRayBundleTest, RowMajorSliceWithoutCameraIndices)
{
  CameraRayBundle camera_ray_bundle = make_camera_bundle(2, 2);
  RayBundle slice = camera_ray_bundle.get_row_major_sliced_ray_bundle(0, 4);
  EXPECT_EQ(slice.size(), 4);
  EXPECT_FALSE(slice.camera_indices().has_value());
  EXPECT_EQ(camera_ray_bundle.get_row_major_sliced_ray_bundle(2, 2).size(), 0);
}

TEST(CameraRayBundleTest, RowMajorSliceOutOfRange)
{
  CameraRayBundle camera_ray_bundle = make_camera_bundle(2, 2);
  EXPECT_THROW(camera_ray_bundle.get_row_major_sliced_ray_bundle(0, 5), nerf_rays::ShapeError);
  EXPECT_THROW(camera_ray_bundle.get_row_major_sliced_ray_bundle(3, 1), nerf_rays::ShapeError);
  EXPECT_THROW(camera_ray_bundle.get_row_major_sliced_ray_bundle(-1, 1), nerf_rays::ShapeError);
}

TEST(CameraRayBundleTest, MoveToDeviceKeepsCameraIdentity)
{
  CameraRayBundle camera_ray_bundle = make_camera_bundle(2, 3);
  camera_ray_bundle.set_camera_indices(3);
  Tensor origins = camera_ray_bundle.origins().clone();
  Tensor directions = camera_ray_bundle.directions().clone();

  camera_ray_bundle.move_to_device(torch::Device(torch::kCPU));

  EXPECT_TRUE(camera_ray_bundle.origins().device().is_cpu());
  EXPECT_TRUE(torch::equal(camera_ray_bundle.origins(), origins));
  EXPECT_TRUE(torch::equal(camera_ray_bundle.directions(), directions));
  ASSERT_TRUE(camera_ray_bundle.camera_indices().has_value());
  EXPECT_EQ(camera_ray_bundle.camera_indices()->scalar_type(), torch::kLong);
  EXPECT_TRUE(
    torch::equal(*camera_ray_bundle.camera_indices(), torch::full({2, 3}, 3, torch::kLong)));
  ASSERT_TRUE(camera_ray_bundle.camera_index().has_value());
  EXPECT_EQ(*camera_ray_bundle.camera_index(), 3);
}

TEST(CameraRayBundleTest, FailedSliceLeavesBundleUntouched)
{
  CameraRayBundle camera_ray_bundle = make_camera_bundle(2, 2);
  camera_ray_bundle.set_camera_indices(1);
  Tensor origins = camera_ray_bundle.origins().clone();

  EXPECT_THROW(camera_ray_bundle.get_row_major_sliced_ray_bundle(1, 9), nerf_rays::ShapeError);
  EXPECT_TRUE(torch::equal(camera_ray_bundle.origins(), origins));
  EXPECT_TRUE(
    torch::equal(*camera_ray_bundle.camera_indices(), torch::full({2, 2}, 1, torch::kLong)));
  EXPECT_EQ(*camera_ray_bundle.camera_index(), 1);
}
