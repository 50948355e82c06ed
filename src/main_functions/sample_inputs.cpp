#include "sample_inputs.hpp"

#include "../common.hpp"

using Tensor = torch::Tensor;

Tensor sample_in_aabb(const std::vector<float> & aabb, int64_t n)
{
  const int64_t dim = static_cast<int64_t>(aabb.size()) / 2;
  Tensor bounds = torch::tensor(aabb, CPUFloat).to(torch::kCUDA);
  Tensor aabb_min = bounds.index({Slc(0, dim)});
  Tensor aabb_max = bounds.index({Slc(dim, 2 * dim)});
  return torch::rand({n, dim}, CUDAFloat) * (aabb_max - aabb_min) + aabb_min;
}

Tensor make_directions(const RadianceFieldConfig & config, const Tensor & positions)
{
  if (!config.use_viewdirs) {
    return Tensor();
  }
  if (config.cond_type == CondType::kPosedVerts) {
    Tensor flat = sample_in_aabb(config.aabb, positions.numel() / config.num_dim);
    return flat.view(positions.sizes());
  }
  Tensor dirs = torch::randn(positions.sizes(), CUDAFloat);
  return dirs / dirs.norm(2, {-1}, true).clamp_min(1e-6f);
}
