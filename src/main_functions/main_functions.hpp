#ifndef NERF_RAYS__MAIN_FUNCTIONS_HPP_
#define NERF_RAYS__MAIN_FUNCTIONS_HPP_

#include "../ray_bundle.hpp"

#include <cstdint>
#include <string>

namespace nerf_rays
{

// Orthographic camera at z = -2 looking down +z, pixels spread over
// [-1, 1] x [-1, 1] with row 0 at y = 1. camera_index is 0.
CameraRayBundle make_orthographic_rays(int64_t height, int64_t width);

void render_test_scene(const std::string & config_path);

}  // namespace nerf_rays

#endif  // NERF_RAYS__MAIN_FUNCTIONS_HPP_
