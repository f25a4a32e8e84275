#ifndef NERF_RAYS__FIELD_HPP_
#define NERF_RAYS__FIELD_HPP_

#include "ray_samples.hpp"

#include <torch/torch.h>

#include <vector>

namespace nerf_rays
{

struct FieldOutput
{
  using Tensor = torch::Tensor;
  Tensor densities;  // [ ..., 1 ]
  Tensor colors;     // [ ..., 3 ]
};

// Source of density and color at sample positions.
class Field : public torch::nn::Module
{
public:
  virtual FieldOutput query(const PointSamples & samples) = 0;
};

// Ball of constant density and color, empty elsewhere.
class SphereField : public Field
{
  using Tensor = torch::Tensor;

public:
  SphereField(
    const std::vector<float> & center, float radius, float density,
    const std::vector<float> & color);

  FieldOutput query(const PointSamples & samples) override;

private:
  Tensor center_;
  Tensor color_;
  float radius_;
  float density_;
};

}  // namespace nerf_rays

#endif  // NERF_RAYS__FIELD_HPP_
