#ifndef NERF_RAYS__COMMON_HPP_
#define NERF_RAYS__COMMON_HPP_

#include <torch/torch.h>

#include <string>

namespace nerf_rays
{
using Slc = torch::indexing::Slice;

const auto CPUFloat = torch::TensorOptions().dtype(torch::kFloat32).device(torch::kCPU);

inline std::string shape_str(const torch::Tensor & tensor)
{
  return c10::str(tensor.sizes());
}

}  // namespace nerf_rays

#endif  // NERF_RAYS__COMMON_HPP_
