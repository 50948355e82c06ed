#ifndef NGP_FIELDS__NGP_NET_HPP_
#define NGP_FIELDS__NGP_NET_HPP_

#include "../config.hpp"
#include "activation.hpp"
#include "tcnn_module.hpp"

#include <torch/torch.h>

#include <memory>
#include <vector>

// Hash-grid network mapping points inside the aabb (and an optional condition
// living in the same box) to output_dim values through last_op, times scale.
class NGPNet : public torch::nn::Module
{
  using Tensor = torch::Tensor;

public:
  NGPNet(const NetConfig & config, uint32_t seed = TCNNModule::DEFAULT_SEED);

  // x: [..., input_dim], cond: [..., cond_dim] or undefined -> [..., output_dim]
  Tensor forward(const Tensor & x, const Tensor & cond = Tensor());

  std::vector<torch::optim::OptimizerParamGroup> optim_param_groups(const OptimConfig & optim);

  const NetConfig & config() const { return config_; }

  Tensor aabb_;

  std::shared_ptr<TCNNModule> encoder_;
  std::shared_ptr<TCNNModule> cond_encoder_;
  std::shared_ptr<TCNNModule> mlp_;

private:
  NetConfig config_;
  Activation last_op_;
};

#endif  // NGP_FIELDS__NGP_NET_HPP_
