#ifndef NGP_FIELDS__CONTRACTION_HPP_
#define NGP_FIELDS__CONTRACTION_HPP_

#include <torch/torch.h>

// aabb: [2 * D] laid out as (min_0, ..., min_{D-1}, max_0, ..., max_{D-1}).
// x: [..., D]. Returns x mapped so that the box becomes [0, 1]^D.
torch::Tensor normalize_to_aabb(const torch::Tensor & x, const torch::Tensor & aabb);

// Maps all of R^3 into [0, 1]^3. The aabb is first sent to [-1, 1]^3, points
// outside the unit sphere are squashed into the shell of radius (1, 2], and
// the result is rescaled so the radius-2 ball fills the unit cube.
// With derivative = true, returns the per-component derivative of the
// contraction instead (1 inside the unit sphere, clamped to eps from below).
torch::Tensor contract_to_unisphere(
  const torch::Tensor & x, const torch::Tensor & aabb, float eps = 1e-6f,
  bool derivative = false);

// [..., D] -> [...] bool, true where every component lies strictly in (0, 1).
torch::Tensor inside_unit_cube(const torch::Tensor & x);

#endif  // NGP_FIELDS__CONTRACTION_HPP_
