#include "ngp_radiance_field.hpp"

#include "../common.hpp"
#include "../stop_watch.hpp"
#include "../utils.hpp"
#include "contraction.hpp"

#include <fmt/core.h>

#include <iostream>

using Tensor = torch::Tensor;

namespace
{

std::vector<int64_t> prefix_shape_with(const Tensor & x, int64_t last_dim)
{
  std::vector<int64_t> shape = x.sizes().vec();
  shape.back() = last_dim;
  return shape;
}

}  // namespace

NGPRadianceField::NGPRadianceField(const RadianceFieldConfig & config, uint32_t seed)
: config_(config), density_activation_(make_activation(config.density_activation))
{
  ScopeWatch watch("NGPRadianceField::NGPRadianceField");

  if (static_cast<int>(config_.aabb.size()) != 2 * config_.num_dim) {
    throw std::invalid_argument(fmt::format(
      "aabb must have {} entries, got {}", 2 * config_.num_dim, config_.aabb.size()));
  }
  aabb_ = torch::tensor(config_.aabb, CPUFloat).to(torch::kCUDA);
  register_buffer("aabb", aabb_);

  const float per_level_scale = per_level_scale_for(config_.aabb);

  int dir_dims = 0;
  if (config_.use_viewdirs) {
    if (config_.cond_type == CondType::kNeckPose) {
      direction_encoding_ =
        TCNNModule::encoding(config_.num_dim, SHConfig{}.to_json(), seed + 1);
    } else if (config_.cond_type == CondType::kPosedVerts) {
      HashGridConfig grid;
      grid.n_levels = config_.n_levels / 2;
      grid.log2_hashmap_size = config_.log2_hashmap_size / 2;
      grid.per_level_scale = per_level_scale;
      direction_encoding_ = TCNNModule::encoding(config_.num_dim, grid.to_json(), seed + 1);
    } else {
      throw std::invalid_argument("use_viewdirs needs cond_type neck_pose or posed_verts");
    }
    register_module("direction_encoding", direction_encoding_);
    dir_dims = direction_encoding_->n_output_dims();
  }

  HashGridConfig grid;
  grid.n_levels = config_.n_levels;
  grid.log2_hashmap_size = config_.log2_hashmap_size;
  grid.per_level_scale = per_level_scale;
  MLPConfig base_mlp;
  base_mlp.n_hidden_layers = 1;
  mlp_base_ = TCNNModule::network_with_input_encoding(
    config_.num_dim, 1 + config_.geo_feat_dim, grid.to_json(), base_mlp, seed);
  register_module("mlp_base", mlp_base_);

  if (config_.geo_feat_dim > 0) {
    MLPConfig head_mlp;
    head_mlp.output_activation = "Sigmoid";
    head_mlp.n_hidden_layers = 2;
    mlp_head_ = TCNNModule::network(dir_dims + config_.geo_feat_dim, 3, head_mlp, seed + 2);
    register_module("mlp_head", mlp_head_);
  }

  std::cout << fmt::format(
                 "NGPRadianceField: cond_type = {}, unbounded = {}, per_level_scale = {:.6f}",
                 to_string(config_.cond_type), config_.unbounded, per_level_scale)
            << std::endl;
}

DensityResult NGPRadianceField::query_density(const Tensor & positions, bool return_feat)
{
  if (positions.size(-1) != config_.num_dim) {
    throw std::invalid_argument(fmt::format(
      "positions must end with dim {}, got {}", config_.num_dim,
      c10::str(positions.sizes())));
  }

  Tensor x = config_.unbounded ? contract_to_unisphere(positions, aabb_)
                               : normalize_to_aabb(positions, aabb_);
  Tensor selector = inside_unit_cube(x);

  const int64_t out_dim = 1 + config_.geo_feat_dim;
  x = mlp_base_->query(x.reshape({-1, config_.num_dim}))
        .reshape(prefix_shape_with(x, out_dim))
        .to(x);

  Tensor density_before_activation = x.index({"...", Slc(0, 1)});
  Tensor density = density_activation_(density_before_activation) * selector.unsqueeze(-1);

  DensityResult result;
  result.density = density;
  if (return_feat) {
    result.feature = x.index({"...", Slc(1, out_dim)});
  }
  return result;
}

Tensor NGPRadianceField::query_rgb(const Tensor & dir, const Tensor & embedding)
{
  const int64_t geo_feat_dim = config_.geo_feat_dim;
  Tensor h;
  if (config_.use_viewdirs) {
    Tensor d = dir;
    if (config_.cond_type == CondType::kNeckPose) {
      // tcnn expects directions in [0, 1]
      d = (d + 1.f) / 2.f;
    } else if (config_.cond_type == CondType::kPosedVerts) {
      d = normalize_to_aabb(d, aabb_);
    }
    Tensor d_enc = direction_encoding_->query(d.reshape({-1, d.size(-1)}));
    h = torch::cat({d_enc, embedding.reshape({-1, geo_feat_dim})}, -1);
  } else {
    h = embedding.reshape({-1, geo_feat_dim});
  }
  return mlp_head_->query(h).reshape(prefix_shape_with(embedding, 3)).to(embedding);
}

RadianceResult NGPRadianceField::forward(const Tensor & positions, const Tensor & directions)
{
  if (!mlp_head_) {
    throw std::logic_error("NGPRadianceField without geometry features has no color head");
  }
  if (config_.use_viewdirs) {
    if (!directions.defined()) {
      throw std::invalid_argument("directions are required when use_viewdirs is set");
    }
    if (positions.sizes() != directions.sizes()) {
      throw std::invalid_argument(fmt::format(
        "{} v.s. {}", c10::str(positions.sizes()), c10::str(directions.sizes())));
    }
  }

  DensityResult density_result = query_density(positions, true);
  Tensor rgb = query_rgb(directions, density_result.feature);
  return {rgb, density_result.density};
}

std::vector<torch::optim::OptimizerParamGroup> NGPRadianceField::optim_param_groups(
  const OptimConfig & optim)
{
  std::vector<torch::optim::OptimizerParamGroup> ret;

  {
    // Hash grid tables, including the fused grid+MLP of the base network.
    std::vector<Tensor> params = {mlp_base_->params_};
    if (direction_encoding_ && direction_encoding_->n_params() > 0) {
      params.push_back(direction_encoding_->params_);
    }
    ret.emplace_back(std::move(params), utils::adam_options(optim));
  }

  if (mlp_head_) {
    auto opt = utils::adam_options(optim);
    opt->weight_decay() = optim.weight_decay;
    std::vector<Tensor> params = {mlp_head_->params_};
    ret.emplace_back(std::move(params), std::move(opt));
  }

  return ret;
}
