#ifndef NGP_FIELDS__TRUNC_EXP_HPP_
#define NGP_FIELDS__TRUNC_EXP_HPP_

#include <torch/torch.h>

namespace torch::autograd
{

// exp(x) whose gradient is computed with x clamped to 15, which keeps density
// gradients finite under mixed precision.
class TruncExp : public Function<TruncExp>
{
public:
  static variable_list forward(AutogradContext * ctx, Tensor input);

  static variable_list backward(AutogradContext * ctx, variable_list grad_output);
};

}  // namespace torch::autograd

torch::Tensor trunc_exp(const torch::Tensor & x);

#endif  // NGP_FIELDS__TRUNC_EXP_HPP_
