#include "activation.hpp"

#include "trunc_exp.hpp"

#include <fmt/core.h>

using Tensor = torch::Tensor;

Activation make_activation(const std::string & name)
{
  if (name == "none") {
    return [](const Tensor & x) { return x; };
  } else if (name == "sigmoid") {
    return [](const Tensor & x) { return torch::sigmoid(x); };
  } else if (name == "relu") {
    return [](const Tensor & x) { return torch::relu(x); };
  } else if (name == "softplus") {
    return [](const Tensor & x) { return torch::nn::functional::softplus(x); };
  } else if (name == "exp") {
    return [](const Tensor & x) { return torch::exp(x); };
  } else if (name == "trunc_exp") {
    return [](const Tensor & x) { return trunc_exp(x); };
  } else if (name == "trunc_exp_shifted") {
    return [](const Tensor & x) { return trunc_exp(x - 1.f); };
  }
  throw std::invalid_argument(fmt::format("There is no such activation: {}", name));
}
