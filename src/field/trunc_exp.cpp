#include "trunc_exp.hpp"

using Tensor = torch::Tensor;

namespace torch::autograd
{

variable_list TruncExp::forward(AutogradContext * ctx, Tensor input)
{
  input = input.to(torch::kFloat32);
  ctx->save_for_backward({input});
  return {torch::exp(input)};
}

variable_list TruncExp::backward(AutogradContext * ctx, variable_list grad_output)
{
  Tensor x = ctx->get_saved_variables()[0];
  return {grad_output[0] * torch::exp(x.clamp_max(15.f))};
}

}  // namespace torch::autograd

Tensor trunc_exp(const Tensor & x)
{
  return torch::autograd::TruncExp::apply(x)[0];
}
