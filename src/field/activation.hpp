#ifndef NGP_FIELDS__ACTIVATION_HPP_
#define NGP_FIELDS__ACTIVATION_HPP_

#include <torch/torch.h>

#include <functional>
#include <string>

using Activation = std::function<torch::Tensor(const torch::Tensor &)>;

// Accepted names: none, sigmoid, relu, softplus, exp, trunc_exp, trunc_exp_shifted.
// trunc_exp_shifted is trunc_exp(x - 1), the usual NGP density activation.
Activation make_activation(const std::string & name);

#endif  // NGP_FIELDS__ACTIVATION_HPP_
