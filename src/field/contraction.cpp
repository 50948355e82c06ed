#include "contraction.hpp"

#include <fmt/core.h>

using Tensor = torch::Tensor;

Tensor normalize_to_aabb(const Tensor & x, const Tensor & aabb)
{
  const int64_t dim = x.size(-1);
  if (aabb.dim() != 1 || aabb.size(0) != 2 * dim) {
    throw std::invalid_argument(fmt::format(
      "aabb must have {} entries for {}-dimensional points, got {}", 2 * dim, dim,
      aabb.numel()));
  }
  auto bounds = torch::split(aabb.to(x.device(), x.scalar_type()), dim, -1);
  const Tensor & aabb_min = bounds[0];
  const Tensor & aabb_max = bounds[1];
  return (x - aabb_min) / (aabb_max - aabb_min);
}

Tensor contract_to_unisphere(const Tensor & x, const Tensor & aabb, float eps, bool derivative)
{
  Tensor y = normalize_to_aabb(x, aabb);
  y = y * 2.f - 1.f;
  Tensor mag = y.norm(2, {-1}, true);
  Tensor mask = mag > 1.f;

  if (derivative) {
    Tensor dev =
      (2.f * mag - 1.f) / mag.square() +
      2.f * y.square() * (1.f / mag.pow(3) - (2.f * mag - 1.f) / mag.pow(4));
    dev = torch::where(mask, dev, torch::ones_like(dev));
    return dev.clamp_min(eps);
  }

  // Guard the division for the points that keep their value anyway.
  Tensor safe_mag = torch::where(mask, mag, torch::ones_like(mag));
  Tensor contracted = (2.f - 1.f / safe_mag) * (y / safe_mag);
  y = torch::where(mask, contracted, y);
  return y / 4.f + .5f;
}

Tensor inside_unit_cube(const Tensor & x)
{
  return ((x > 0.f) & (x < 1.f)).all(-1);
}
