//
// Created by ppwang on 2022/9/16.
//

#include "field_factory.hpp"

#include <fmt/core.h>

namespace
{

uint32_t read_seed(const YAML::Node & root)
{
  return root["seed"] ? root["seed"].as<uint32_t>() : TCNNModule::DEFAULT_SEED;
}

const YAML::Node section(const YAML::Node & root, const std::string & name)
{
  const YAML::Node node = root[name];
  if (!node || !node.IsMap()) {
    throw std::invalid_argument(fmt::format("Config has no \"{}\" section", name));
  }
  return node;
}

}  // namespace

std::shared_ptr<NGPRadianceField> construct_radiance_field(const YAML::Node & root)
{
  const RadianceFieldConfig config = load_radiance_field_config(section(root, "radiance_field"));
  return std::make_shared<NGPRadianceField>(config, read_seed(root));
}

std::shared_ptr<NGPNet> construct_net(const YAML::Node & root)
{
  const NetConfig config = load_net_config(section(root, "net"));
  return std::make_shared<NGPNet>(config, read_seed(root));
}
