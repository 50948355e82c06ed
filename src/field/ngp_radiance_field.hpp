#ifndef NGP_FIELDS__NGP_RADIANCE_FIELD_HPP_
#define NGP_FIELDS__NGP_RADIANCE_FIELD_HPP_

#include "../config.hpp"
#include "activation.hpp"
#include "tcnn_module.hpp"

#include <torch/torch.h>

#include <memory>
#include <vector>

struct DensityResult
{
  using Tensor = torch::Tensor;
  Tensor density;  // [..., 1]
  Tensor feature;  // [..., geo_feat_dim], undefined unless requested
};

struct RadianceResult
{
  using Tensor = torch::Tensor;
  Tensor rgb;      // [..., 3]
  Tensor density;  // [..., 1]
};

// Instant-NGP radiance field: hash grid + small MLP for density and a
// geometry feature, then a second MLP turning the feature (and optionally an
// encoded direction or condition) into color.
class NGPRadianceField : public torch::nn::Module
{
  using Tensor = torch::Tensor;

public:
  NGPRadianceField(const RadianceFieldConfig & config, uint32_t seed = TCNNModule::DEFAULT_SEED);

  DensityResult query_density(const Tensor & x, bool return_feat = false);

  RadianceResult forward(const Tensor & positions, const Tensor & directions = Tensor());

  std::vector<torch::optim::OptimizerParamGroup> optim_param_groups(const OptimConfig & optim);

  const RadianceFieldConfig & config() const { return config_; }

  Tensor aabb_;

  std::shared_ptr<TCNNModule> mlp_base_;
  std::shared_ptr<TCNNModule> direction_encoding_;
  std::shared_ptr<TCNNModule> mlp_head_;

private:
  Tensor query_rgb(const Tensor & dir, const Tensor & embedding);

  RadianceFieldConfig config_;
  Activation density_activation_;
};

#endif  // NGP_FIELDS__NGP_RADIANCE_FIELD_HPP_
