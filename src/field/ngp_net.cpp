#include "ngp_net.hpp"

#include "../common.hpp"
#include "../stop_watch.hpp"
#include "../utils.hpp"
#include "contraction.hpp"

#include <fmt/core.h>

using Tensor = torch::Tensor;

NGPNet::NGPNet(const NetConfig & config, uint32_t seed)
: config_(config), last_op_(make_activation(config.last_op))
{
  ScopeWatch watch("NGPNet::NGPNet");

  if (static_cast<int>(config_.aabb.size()) != 2 * config_.input_dim) {
    throw std::invalid_argument(fmt::format(
      "aabb must have {} entries, got {}", 2 * config_.input_dim, config_.aabb.size()));
  }
  aabb_ = torch::tensor(config_.aabb, CPUFloat).to(torch::kCUDA);
  register_buffer("aabb", aabb_);

  const float per_level_scale = per_level_scale_for(config_.aabb);

  HashGridConfig grid;
  grid.n_levels = config_.n_levels;
  grid.log2_hashmap_size = config_.log2_hashmap_size;
  grid.per_level_scale = per_level_scale;
  encoder_ = TCNNModule::encoding(config_.input_dim, grid.to_json(), seed);
  register_module("encoder", encoder_);

  int mlp_in_dims = encoder_->n_output_dims();
  if (config_.cond_dim > 0) {
    HashGridConfig cond_grid = grid;
    cond_grid.n_levels = config_.n_levels / 2;
    cond_grid.log2_hashmap_size = config_.log2_hashmap_size / 2;
    cond_encoder_ = TCNNModule::encoding(config_.cond_dim, cond_grid.to_json(), seed + 1);
    register_module("cond_encoder", cond_encoder_);
    mlp_in_dims += cond_encoder_->n_output_dims();
  }

  MLPConfig mlp;
  mlp.n_hidden_layers = 1;
  mlp_ = TCNNModule::network(mlp_in_dims, config_.output_dim, mlp, seed + 2);
  register_module("mlp", mlp_);
}

Tensor NGPNet::forward(const Tensor & x, const Tensor & cond)
{
  if (x.size(-1) != config_.input_dim) {
    throw std::invalid_argument(
      fmt::format("x must end with dim {}, got {}", config_.input_dim, c10::str(x.sizes())));
  }

  Tensor x_norm = normalize_to_aabb(x, aabb_);
  Tensor x_enc = encoder_->query(x_norm.reshape({-1, config_.input_dim}));

  if (cond.defined()) {
    if (!cond_encoder_) {
      throw std::invalid_argument("NGPNet was built without a condition encoder");
    }
    if (cond.size(-1) != config_.cond_dim || cond.numel() / config_.cond_dim != x_enc.size(0)) {
      throw std::invalid_argument(fmt::format(
        "cond {} does not match x {}", c10::str(cond.sizes()), c10::str(x.sizes())));
    }
    Tensor cond_norm = normalize_to_aabb(cond, aabb_);
    Tensor cond_enc = cond_encoder_->query(cond_norm.reshape({-1, config_.cond_dim}));
    x_enc = torch::cat({x_enc, cond_enc}, -1);
  } else if (cond_encoder_) {
    // Nets built with a condition still run without one, the condition
    // features are then zero.
    x_enc = torch::cat(
      {x_enc, torch::zeros({x_enc.size(0), cond_encoder_->n_output_dims()}, x_enc.options())}, -1);
  }

  std::vector<int64_t> out_shape = x.sizes().vec();
  out_shape.back() = config_.output_dim;
  Tensor out = mlp_->query(x_enc).reshape(out_shape).to(x_norm);
  return last_op_(out) * config_.scale;
}

std::vector<torch::optim::OptimizerParamGroup> NGPNet::optim_param_groups(const OptimConfig & optim)
{
  std::vector<torch::optim::OptimizerParamGroup> ret;

  {
    std::vector<Tensor> params = {encoder_->params_};
    if (cond_encoder_) {
      params.push_back(cond_encoder_->params_);
    }
    ret.emplace_back(std::move(params), utils::adam_options(optim));
  }

  {
    auto opt = utils::adam_options(optim);
    opt->weight_decay() = optim.weight_decay;
    std::vector<Tensor> params = {mlp_->params_};
    ret.emplace_back(std::move(params), std::move(opt));
  }

  return ret;
}
