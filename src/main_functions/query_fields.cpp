#include "../config.hpp"
#include "../field/field_factory.hpp"
#include "../stop_watch.hpp"
#include "main_functions.hpp"
#include "sample_inputs.hpp"

#include <fmt/core.h>

#include <algorithm>

#include <iostream>

namespace
{

template <typename Fn>
double average_milli_seconds(int repeat, Fn && fn)
{
  fn();  // warm up
  torch::cuda::synchronize();
  Timer timer;
  timer.start();
  for (int i = 0; i < repeat; i++) {
    fn();
  }
  torch::cuda::synchronize();
  return double(timer.elapsed_milli_seconds()) / std::max(repeat, 1);
}

}  // namespace

void query_fields(const std::string & config_path)
{
  torch::NoGradGuard no_grad_guard;
  const YAML::Node config = load_yaml(config_path);
  const YAML::Node query_config = config["query"];
  const int64_t bs = get_or<int64_t>(query_config, "batch_size", 1 << 18);
  const int repeat = get_or<int>(query_config, "repeat", 10);

  if (config["radiance_field"]) {
    auto field = construct_radiance_field(config);
    const RadianceFieldConfig & field_config = field->config();
    torch::Tensor positions = sample_in_aabb(field_config.aabb, bs);
    torch::Tensor directions = make_directions(field_config, positions);

    RadianceResult result;
    const double ms = average_milli_seconds(repeat, [&]() {
      result = field_config.geo_feat_dim > 0
                 ? field->forward(positions, directions)
                 : RadianceResult{torch::Tensor(), field->query_density(positions).density};
    });
    std::cout << "radiance_field" << std::endl;
    std::cout << "  positions.sizes() = " << positions.sizes() << std::endl;
    if (result.rgb.defined()) {
      std::cout << "  rgb.sizes()       = " << result.rgb.sizes() << std::endl;
    }
    std::cout << "  density.sizes()   = " << result.density.sizes() << std::endl;
    std::cout << fmt::format("  {:.3f} ms per call", ms) << std::endl;
  }

  if (config["net"]) {
    auto net = construct_net(config);
    const NetConfig & net_config = net->config();
    torch::Tensor x = sample_in_aabb(net_config.aabb, bs);
    torch::Tensor cond =
      net_config.cond_dim > 0 ? sample_in_aabb(net_config.aabb, bs) : torch::Tensor();

    torch::Tensor output;
    const double ms = average_milli_seconds(repeat, [&]() { output = net->forward(x, cond); });
    std::cout << "net" << std::endl;
    std::cout << "  x.sizes()      = " << x.sizes() << std::endl;
    std::cout << "  output.sizes() = " << output.sizes() << std::endl;
    std::cout << fmt::format("  {:.3f} ms per call", ms) << std::endl;
  }
}
