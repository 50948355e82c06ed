//
// Created by ppwang on 2022/5/6.
//

#ifndef NGP_FIELDS__FIT_MANAGER_HPP_
#define NGP_FIELDS__FIT_MANAGER_HPP_

#include "../config.hpp"
#include "../field/ngp_net.hpp"

#include <torch/torch.h>

#include <memory>
#include <string>

// Fits an NGPNet to the occupancy of a sphere centered in the aabb.
class FitManager
{
  using Tensor = torch::Tensor;

public:
  FitManager(const std::string & conf_path);

  // Returns the accuracy on the final batch.
  float fit();

  // Ground truth occupancy, 1 inside the sphere. pts: [N, input_dim]
  Tensor target(const Tensor & pts) const;

  std::string base_exp_dir_;

  unsigned iter_step_ = 0;
  unsigned end_iter_;
  unsigned report_freq_;
  int64_t batch_size_;

  float learning_rate_, learning_rate_alpha_;
  int learning_rate_warm_up_end_iter_;
  float sphere_radius_;

  std::shared_ptr<NGPNet> net_;
  std::shared_ptr<torch::optim::Adam> optimizer_;

private:
  void update_ada_params();

  Tensor center_;
};

#endif  // NGP_FIELDS__FIT_MANAGER_HPP_
