#include "../common.hpp"
#include "../config.hpp"
#include "../field/field_factory.hpp"
#include "../utils.hpp"
#include "main_functions.hpp"
#include "sample_inputs.hpp"

#include <experimental/filesystem>

#include <fmt/core.h>

#include <algorithm>

#include <iostream>

namespace fs = std::experimental::filesystem::v1;
using Tensor = torch::Tensor;

void render_slice(const std::string & config_path)
{
  torch::NoGradGuard no_grad_guard;
  const YAML::Node config = load_yaml(config_path);
  const std::string base_exp_dir = get_or<std::string>(config, "base_exp_dir", ".");
  auto field = construct_radiance_field(config);
  const RadianceFieldConfig & field_config = field->config();
  if (field_config.num_dim != 3) {
    throw std::invalid_argument("slice needs a 3 dimensional field");
  }

  const std::vector<float> & aabb = field_config.aabb;
  const YAML::Node slice_config = config["slice"];
  const int64_t res = get_or<int64_t>(slice_config, "resolution", 256);
  const float z = get_or<float>(slice_config, "z", (aabb[2] + aabb[5]) * .5f);
  if (res < 2) {
    throw std::invalid_argument(fmt::format("slice resolution must be at least 2, got {}", res));
  }

  Tensor xs = torch::linspace(aabb[0], aabb[3], res, CUDAFloat);
  Tensor ys = torch::linspace(aabb[4], aabb[1], res, CUDAFloat);  // image rows go down
  auto grid = torch::meshgrid({ys, xs}, "ij");
  Tensor positions =
    torch::stack({grid[1], grid[0], torch::full({res, res}, z, CUDAFloat)}, -1);

  Tensor directions = make_directions(field_config, positions);

  const int64_t chunk = std::max<int64_t>(1, (1 << 16) / res);
  std::vector<Tensor> density_rows, rgb_rows;
  for (int64_t i = 0; i < res; i += chunk) {
    const int64_t i_high = std::min(i + chunk, res);
    Tensor cur_pos = positions.index({Slc(i, i_high)});
    if (field_config.geo_feat_dim > 0) {
      Tensor cur_dir = directions.defined() ? directions.index({Slc(i, i_high)}) : Tensor();
      RadianceResult result = field->forward(cur_pos, cur_dir);
      density_rows.push_back(result.density);
      rgb_rows.push_back(result.rgb);
    } else {
      Tensor cur_density = field->query_density(cur_pos).density;
      density_rows.push_back(cur_density);
      rgb_rows.push_back(torch::zeros({i_high - i, res, 3}, CUDAFloat));
    }
  }
  Tensor density = torch::cat(density_rows, 0);
  Tensor rgb = torch::cat(rgb_rows, 0);

  const float max_density = density.max().item<float>();
  density = density / std::max(max_density, 1e-6f);

  Tensor img = torch::cat({density.repeat({1, 1, 3}), rgb}, 1);
  fs::create_directories(base_exp_dir);
  const std::string path = base_exp_dir + "/slice.png";
  if (!utils::write_image_tensor(path, img)) {
    throw std::runtime_error(fmt::format("Failed to write {}", path));
  }
  std::cout << fmt::format("max density = {:.6f}, saved {}", max_density, path) << std::endl;
}
