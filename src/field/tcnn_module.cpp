//
// Created by ppwang on 2022/10/4.
//

#include "tcnn_module.hpp"

#include "../common.hpp"

#include <c10/cuda/CUDAStream.h>

#include <fmt/core.h>

using Tensor = torch::Tensor;

TORCH_LIBRARY(ngp_fields_tcnn, m)
{
  m.class_<TCNNModuleInfo>("TCNNModuleInfo").def(torch::init());
}

std::shared_ptr<TCNNModule> TCNNModule::network(
  int d_in, int d_out, const MLPConfig & mlp, uint32_t seed)
{
  std::unique_ptr<tcnn::cpp::Module> module(
    tcnn::cpp::create_network(d_in, d_out, mlp.to_json()));
  return std::make_shared<TCNNModule>(std::move(module), d_out, seed);
}

std::shared_ptr<TCNNModule> TCNNModule::encoding(
  int d_in, const tcnn::cpp::json & encoding, uint32_t seed)
{
  std::unique_ptr<tcnn::cpp::Module> module(tcnn::cpp::create_encoding(d_in, encoding));
  const auto d_out = static_cast<int>(module->n_output_dims());
  return std::make_shared<TCNNModule>(std::move(module), d_out, seed);
}

std::shared_ptr<TCNNModule> TCNNModule::network_with_input_encoding(
  int d_in, int d_out, const tcnn::cpp::json & encoding, const MLPConfig & mlp, uint32_t seed)
{
  std::unique_ptr<tcnn::cpp::Module> module(
    tcnn::cpp::create_network_with_input_encoding(d_in, d_out, encoding, mlp.to_json()));
  return std::make_shared<TCNNModule>(std::move(module), d_out, seed);
}

TCNNModule::TCNNModule(std::unique_ptr<tcnn::cpp::Module> module, int d_out, uint32_t seed)
: module_(std::move(module)), d_out_(d_out)
{
  CHECK(module_ != nullptr);
  CHECK_GT(d_out_, 0);
  CHECK_LE(d_out_, static_cast<int>(module_->n_output_dims()));

  params_ = torch::zeros({n_params()}, CUDAFloat);
  if (n_params() > 0) {
    module_->initialize_params(seed, params_.data_ptr<float>());
  }
  params_.requires_grad_(true);
  register_parameter("params", params_);
}

int TCNNModule::n_input_dims() const
{
  return static_cast<int>(module_->n_input_dims());
}

int TCNNModule::n_output_dims() const
{
  return d_out_;
}

int64_t TCNNModule::n_params() const
{
  return static_cast<int64_t>(module_->n_params());
}

Tensor TCNNModule::query(const Tensor & pts)
{
  if (pts.dim() != 2 || pts.size(1) != n_input_dims()) {
    throw std::invalid_argument(fmt::format(
      "TCNNModule expects input of shape [N, {}], got {}", n_input_dims(),
      c10::str(pts.sizes())));
  }
  if (!pts.is_cuda()) {
    throw std::invalid_argument("TCNNModule expects a CUDA tensor");
  }

  const int64_t batch_size = pts.size(0);
  if (batch_size == 0) {
    return torch::zeros({0, n_output_dims()}, CUDAFloat);
  }

  const auto granularity = static_cast<int64_t>(tcnn::cpp::batch_size_granularity());
  const int64_t real_batch_size = (batch_size + granularity - 1) / granularity * granularity;

  Tensor input = pts.to(torch::kFloat32);
  if (real_batch_size != batch_size) {
    namespace F = torch::nn::functional;
    input = F::pad(input, F::PadFuncOptions({0, 0, 0, real_batch_size - batch_size}));
  }
  input = input.contiguous();

  Tensor params = params_.to(to_torch_dtype(module_->param_precision())).contiguous();

  auto info = torch::make_intrusive<TCNNModuleInfo>();
  info->tcnn_ = this;

  Tensor output =
    torch::autograd::TCNNModuleFunction::apply(input, params, torch::IValue(info))[0];
  return output.index({Slc(0, batch_size), Slc(0, n_output_dims())}).to(torch::kFloat32);
}

namespace torch::autograd
{

variable_list TCNNModuleFunction::forward(
  AutogradContext * ctx, Tensor input, Tensor params, IValue tcnn_info)
{
  ctx->set_materialize_grads(false);
  auto info = tcnn_info.toCustomClass<TCNNModuleInfo>();
  TCNNModule * tcnn = info->tcnn_;
  tcnn::cpp::Module * module = tcnn->module_.get();

  CHECK(input.is_contiguous());
  CHECK(params.is_contiguous());
  CHECK(input.scalar_type() == torch::kFloat32);
  CHECK(params.scalar_type() == to_torch_dtype(module->param_precision()));
  CHECK_EQ(params.numel(), tcnn->n_params());

  cudaStream_t stream = c10::cuda::getCurrentCUDAStream().stream();
  const auto batch_size = static_cast<uint32_t>(input.size(0));
  const bool prepare_input_gradients = input.requires_grad();

  // Networks write their padded output width, e.g. a multiple of 16 for FullyFusedMLP.
  Tensor output = torch::empty(
    {input.size(0), static_cast<int64_t>(module->n_output_dims())},
    torch::TensorOptions()
      .dtype(to_torch_dtype(module->output_precision()))
      .device(input.device()));

  info->native_ctx_ = module->forward(
    stream, batch_size, input.data_ptr<float>(), output.data_ptr(), params.data_ptr(),
    prepare_input_gradients);

  ctx->saved_data["tcnn_info"] = tcnn_info;
  ctx->saved_data["needs_input_grad"] = prepare_input_gradients;
  ctx->save_for_backward({input, params, output});
  return {output};
}

variable_list TCNNModuleFunction::backward(AutogradContext * ctx, variable_list grad_output)
{
  Tensor dL_doutput = grad_output[0];
  if (!dL_doutput.defined()) {
    return {Tensor(), Tensor(), Tensor()};
  }

  auto info = ctx->saved_data["tcnn_info"].toCustomClass<TCNNModuleInfo>();
  TCNNModule * tcnn = info->tcnn_;
  tcnn::cpp::Module * module = tcnn->module_.get();
  CHECK(info->native_ctx_.ctx != nullptr);

  variable_list saved = ctx->get_saved_variables();
  Tensor input = saved[0];
  Tensor params = saved[1];
  Tensor output = saved[2];

  cudaStream_t stream = c10::cuda::getCurrentCUDAStream().stream();
  const auto batch_size = static_cast<uint32_t>(input.size(0));
  const float loss_scale = tcnn->loss_scale_;

  Tensor scaled_grad = (dL_doutput * loss_scale).to(output.scalar_type()).contiguous();

  Tensor dL_dinput;
  if (ctx->saved_data["needs_input_grad"].toBool()) {
    dL_dinput = torch::empty({input.size(0), input.size(1)}, input.options());
  }
  Tensor dL_dparams = torch::empty({params.numel()}, params.options());

  module->backward(
    stream, info->native_ctx_, batch_size,
    dL_dinput.defined() ? dL_dinput.data_ptr<float>() : nullptr, scaled_grad.data_ptr(),
    dL_dparams.numel() > 0 ? dL_dparams.data_ptr() : nullptr, input.data_ptr<float>(),
    output.data_ptr(), params.data_ptr());

  if (dL_dinput.defined()) {
    dL_dinput = dL_dinput / loss_scale;
  }
  dL_dparams = dL_dparams / loss_scale;

  return {dL_dinput, dL_dparams, Tensor()};
}

}  // namespace torch::autograd
