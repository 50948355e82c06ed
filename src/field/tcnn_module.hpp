//
// Created by ppwang on 2022/10/4.
//

#ifndef NGP_FIELDS__TCNN_MODULE_HPP_
#define NGP_FIELDS__TCNN_MODULE_HPP_

#include "../config.hpp"

#include <tiny-cuda-nn/cpp_api.h>
#include <torch/torch.h>

#include <memory>

// A tiny-cuda-nn module (encoding, network, or both fused) exposed to libtorch.
// The weights live in params_ as a flat float32 tensor so that torch optimizers
// and serialization handle them like any other parameter.
class TCNNModule : public torch::nn::Module
{
  using Tensor = torch::Tensor;

public:
  static constexpr uint32_t DEFAULT_SEED = 1337;

  static std::shared_ptr<TCNNModule> network(
    int d_in, int d_out, const MLPConfig & mlp, uint32_t seed = DEFAULT_SEED);
  static std::shared_ptr<TCNNModule> encoding(
    int d_in, const tcnn::cpp::json & encoding, uint32_t seed = DEFAULT_SEED);
  static std::shared_ptr<TCNNModule> network_with_input_encoding(
    int d_in, int d_out, const tcnn::cpp::json & encoding, const MLPConfig & mlp,
    uint32_t seed = DEFAULT_SEED);

  // d_out is the width callers see. tcnn may pad the native output beyond it.
  TCNNModule(std::unique_ptr<tcnn::cpp::Module> module, int d_out, uint32_t seed);

  // pts: [N, n_input_dims] on CUDA -> [N, n_output_dims] float32
  Tensor query(const Tensor & pts);

  int n_input_dims() const;
  int n_output_dims() const;
  int64_t n_params() const;

  std::unique_ptr<tcnn::cpp::Module> module_;
  int d_out_;
  Tensor params_;

  float loss_scale_ = 128.f;
};

class TCNNModuleInfo : public torch::CustomClassHolder
{
public:
  TCNNModule * tcnn_ = nullptr;
  // Kept alive between forward and backward of one call.
  tcnn::cpp::Context native_ctx_;
};

namespace torch::autograd
{

class TCNNModuleFunction : public Function<TCNNModuleFunction>
{
public:
  static variable_list forward(
    AutogradContext * ctx, Tensor input, Tensor params, IValue tcnn_info);

  static variable_list backward(AutogradContext * ctx, variable_list grad_output);
};

}  // namespace torch::autograd

#endif  // NGP_FIELDS__TCNN_MODULE_HPP_
