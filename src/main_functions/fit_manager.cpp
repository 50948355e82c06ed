//
// Created by ppwang on 2022/5/6.
//

#include "fit_manager.hpp"

#include "../common.hpp"
#include "../stop_watch.hpp"
#include "../utils.hpp"
#include "sample_inputs.hpp"

#include <experimental/filesystem>

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

namespace fs = std::experimental::filesystem::v1;
using Tensor = torch::Tensor;

FitManager::FitManager(const std::string & conf_path)
{
  const YAML::Node config = load_yaml(conf_path);

  base_exp_dir_ = get_or<std::string>(config, "base_exp_dir", "./exp");
  fs::create_directories(base_exp_dir_);

  const YAML::Node fit_config = config["fit"];
  end_iter_ = get_or<unsigned>(fit_config, "end_iter", 2000);
  report_freq_ = std::max(get_or<unsigned>(fit_config, "report_freq", 100), 1u);
  batch_size_ = get_or<int64_t>(fit_config, "batch_size", 1 << 16);
  if (batch_size_ <= 0) {
    throw std::invalid_argument(fmt::format("fit batch_size must be positive, got {}", batch_size_));
  }
  learning_rate_alpha_ = get_or<float>(fit_config, "learning_rate_alpha", 0.01f);
  learning_rate_warm_up_end_iter_ = get_or<int>(fit_config, "learning_rate_warm_up_end_iter", 100);
  sphere_radius_ = get_or<float>(fit_config, "sphere_radius", 0.25f);

  if (!config["net"]) {
    throw std::invalid_argument("fit needs a \"net\" section");
  }
  NetConfig net_config = load_net_config(config["net"]);
  // Occupancy is a single probability.
  net_config.output_dim = 1;
  net_config.last_op = "sigmoid";
  net_config.scale = 1.f;
  net_config.cond_dim = 0;
  const uint32_t seed = get_or<uint32_t>(config, "seed", TCNNModule::DEFAULT_SEED);
  net_ = std::make_shared<NGPNet>(net_config, seed);

  const int dim = net_config.input_dim;
  Tensor aabb = net_->aabb_;
  center_ = ((aabb.index({Slc(0, dim)}) + aabb.index({Slc(dim, 2 * dim)})) * .5f).unsqueeze(0);

  const OptimConfig optim_config = load_optim_config(config["optim"]);
  learning_rate_ = optim_config.learning_rate;
  optimizer_ = std::make_shared<torch::optim::Adam>(net_->optim_param_groups(optim_config));
}

Tensor FitManager::target(const Tensor & pts) const
{
  Tensor dist = (pts - center_).norm(2, {-1}, true);
  return (dist < sphere_radius_).to(torch::kFloat32);
}

float FitManager::fit()
{
  std::ofstream ofs_log(base_exp_dir_ + "/fit_log.txt");

  Timer timer;
  timer.start();

  const std::vector<float> & aabb = net_->config().aabb;
  float acc = 0.f;
  update_ada_params();

  for (; iter_step_ < end_iter_;) {
    Tensor pts = sample_in_aabb(aabb, batch_size_);
    Tensor gt = target(pts);
    Tensor pred = net_->forward(pts).clamp(1e-6f, 1.f - 1e-6f);
    Tensor loss = torch::binary_cross_entropy(pred, gt);
    CHECK(std::isfinite(loss.item<float>()));

    optimizer_->zero_grad();
    loss.backward();
    optimizer_->step();

    iter_step_++;
    acc = ((pred.detach() > .5f).to(torch::kFloat32) == gt).to(torch::kFloat32).mean().item<float>();

    if (iter_step_ % report_freq_ == 0 || iter_step_ == end_iter_) {
      const int64_t total_sec = timer.elapsed_seconds();
      const std::string log_str = fmt::format(
        "Time: {:02d}:{:02d} Iter: {:6d} LOSS: {:.6f} ACC: {:.4f} LR: {:.6f}", total_sec / 60,
        total_sec % 60, iter_step_, loss.item<float>(), acc,
        optimizer_->param_groups()[0].options().get_lr());
      std::cout << log_str << std::endl;
      ofs_log << log_str << std::endl;
    }
    update_ada_params();
  }

  utils::save_checkpoint(net_, base_exp_dir_ + "/checkpoints/net.pt");
  std::cout << "Fit done" << std::endl;
  return acc;
}

void FitManager::update_ada_params()
{
  const float lr_factor = utils::lr_factor(
    iter_step_, learning_rate_warm_up_end_iter_, end_iter_, learning_rate_alpha_);
  utils::apply_lr(*optimizer_, learning_rate_ * lr_factor);
}
