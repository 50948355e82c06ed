#ifndef NGP_FIELDS__SAMPLE_INPUTS_HPP_
#define NGP_FIELDS__SAMPLE_INPUTS_HPP_

#include "../config.hpp"

#include <torch/torch.h>

// Uniform points inside the aabb, [n, dim] on CUDA.
torch::Tensor sample_in_aabb(const std::vector<float> & aabb, int64_t n);

// Second input of the radiance field for the given positions: unit directions
// for neck_pose, points inside the aabb for posed_verts, undefined otherwise.
torch::Tensor make_directions(const RadianceFieldConfig & config, const torch::Tensor & positions);

#endif  // NGP_FIELDS__SAMPLE_INPUTS_HPP_
