//
// Created by ppwang on 2023/4/4.
//

#include "utils.hpp"

#include <experimental/filesystem>
#include <opencv2/opencv.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace fs = std::experimental::filesystem::v1;
using Tensor = torch::Tensor;

bool utils::write_image_tensor(const std::string & path, Tensor img)
{
  img = img.contiguous();
  img = (img * 255.f).clamp(0, 255).to(torch::kUInt8).to(torch::kCPU).contiguous();
  cv::Mat img_mat(img.size(0), img.size(1), CV_8UC3, img.data_ptr());
  cv::cvtColor(img_mat, img_mat, cv::COLOR_RGB2BGR);
  return cv::imwrite(path, img_mat);
}

float utils::lr_factor(int iter_step, int warm_up_end_iter, int end_iter, float alpha)
{
  if (iter_step < warm_up_end_iter) {
    return float(iter_step) / float(warm_up_end_iter);
  }
  if (end_iter <= warm_up_end_iter) {
    return alpha;
  }
  const float progress =
    std::min(float(iter_step - warm_up_end_iter) / float(end_iter - warm_up_end_iter), 1.f);
  return (1.f - alpha) * (std::cos(progress * float(M_PI)) * .5f + .5f) + alpha;
}

void utils::apply_lr(torch::optim::Optimizer & optimizer, float lr)
{
  for (auto & g : optimizer.param_groups()) {
    g.options().set_lr(lr);
  }
}

std::unique_ptr<torch::optim::AdamOptions> utils::adam_options(const OptimConfig & optim)
{
  auto opt = std::make_unique<torch::optim::AdamOptions>(optim.learning_rate);
  opt->betas() = {optim.betas.first, optim.betas.second};
  opt->eps() = optim.eps;
  return opt;
}

void utils::save_checkpoint(
  const std::shared_ptr<torch::nn::Module> & module, const std::string & path)
{
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent);
  }
  torch::save(module, path);
}

void utils::load_checkpoint(
  const std::shared_ptr<torch::nn::Module> & module, const std::string & path)
{
  if (!fs::exists(path)) {
    throw std::runtime_error(fmt::format("Checkpoint not found: {}", path));
  }
  torch::load(module, path);
}
