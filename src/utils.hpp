//
// Created by ppwang on 2022/5/11.
//

#ifndef NGP_FIELDS__UTILS_HPP_
#define NGP_FIELDS__UTILS_HPP_

#include "config.hpp"

#include <torch/torch.h>

#include <string>

namespace utils
{
using Tensor = torch::Tensor;

// img: [H, W, 3] in [0, 1]
bool write_image_tensor(const std::string & path, Tensor img);

// Linear warm up followed by a cosine decay down to alpha.
float lr_factor(int iter_step, int warm_up_end_iter, int end_iter, float alpha);
void apply_lr(torch::optim::Optimizer & optimizer, float lr);

// Adam with the betas/eps of the config and no weight decay.
std::unique_ptr<torch::optim::AdamOptions> adam_options(const OptimConfig & optim);

void save_checkpoint(const std::shared_ptr<torch::nn::Module> & module, const std::string & path);
void load_checkpoint(const std::shared_ptr<torch::nn::Module> & module, const std::string & path);

}  // namespace utils

#endif  // NGP_FIELDS__UTILS_HPP_
