#include "config.hpp"

#include <fmt/core.h>

#include <cmath>

using json = tcnn::cpp::json;

json HashGridConfig::to_json() const
{
  return {
    {"otype", "HashGrid"},
    {"n_levels", n_levels},
    {"n_features_per_level", n_features_per_level},
    {"log2_hashmap_size", log2_hashmap_size},
    {"base_resolution", base_resolution},
    {"per_level_scale", per_level_scale},
  };
}

json MLPConfig::to_json() const
{
  return {
    {"otype", otype},
    {"activation", activation},
    {"output_activation", output_activation},
    {"n_neurons", n_neurons},
    {"n_hidden_layers", n_hidden_layers},
  };
}

json SHConfig::to_json() const
{
  return {
    {"otype", "Composite"},
    {"nested", json::array({{
                 {"n_dims_to_encode", 3},
                 {"otype", "SphericalHarmonics"},
                 {"degree", degree},
               }})},
  };
}

float per_level_scale_for(
  const std::vector<float> & aabb, float finest_resolution, float base_resolution, int n_levels)
{
  if (aabb.empty() || aabb[0] == 0.f) {
    throw std::invalid_argument("per_level_scale needs a non-zero aabb[0]");
  }
  if (n_levels < 2) {
    throw std::invalid_argument(fmt::format("n_levels must be at least 2, got {}", n_levels));
  }
  const float ratio = finest_resolution * std::abs(aabb[0]) / base_resolution;
  return std::exp2(std::log2(ratio) / float(n_levels - 1));
}

CondType parse_cond_type(const std::string & name)
{
  if (name == "none") {
    return CondType::kNone;
  } else if (name == "neck_pose") {
    return CondType::kNeckPose;
  } else if (name == "posed_verts") {
    return CondType::kPosedVerts;
  }
  throw std::invalid_argument(fmt::format("There is no such cond type: {}", name));
}

std::string to_string(CondType cond_type)
{
  switch (cond_type) {
    case CondType::kNone:
      return "none";
    case CondType::kNeckPose:
      return "neck_pose";
    case CondType::kPosedVerts:
      return "posed_verts";
  }
  return "unknown";
}

YAML::Node load_yaml(const std::string & path)
{
  try {
    return YAML::LoadFile(path);
  } catch (const YAML::Exception & e) {
    throw std::runtime_error(fmt::format("Failed to load {}: {}", path, e.what()));
  }
}

namespace
{

template <typename T>
void read_if_present(const YAML::Node & node, const char * key, T & value)
{
  if (node[key]) {
    value = node[key].as<T>();
  }
}

std::vector<float> read_aabb(const YAML::Node & node, int dim)
{
  if (!node["aabb"] || !node["aabb"].IsSequence()) {
    throw std::invalid_argument("aabb must be given as a list");
  }
  auto aabb = node["aabb"].as<std::vector<float>>();
  if (static_cast<int>(aabb.size()) != 2 * dim) {
    throw std::invalid_argument(
      fmt::format("aabb must have {} entries, got {}", 2 * dim, aabb.size()));
  }
  for (int i = 0; i < dim; i++) {
    if (!(aabb[i] < aabb[dim + i])) {
      throw std::invalid_argument(fmt::format("aabb min must be below max on axis {}", i));
    }
  }
  return aabb;
}

}  // namespace

RadianceFieldConfig load_radiance_field_config(const YAML::Node & node)
{
  RadianceFieldConfig config;
  try {
    read_if_present(node, "num_dim", config.num_dim);
    read_if_present(node, "use_viewdirs", config.use_viewdirs);
    read_if_present(node, "density_activation", config.density_activation);
    read_if_present(node, "unbounded", config.unbounded);
    read_if_present(node, "geo_feat_dim", config.geo_feat_dim);
    read_if_present(node, "n_levels", config.n_levels);
    read_if_present(node, "log2_hashmap_size", config.log2_hashmap_size);
    if (node["cond_type"]) {
      config.cond_type = parse_cond_type(node["cond_type"].as<std::string>());
    }
  } catch (const YAML::Exception & e) {
    throw std::invalid_argument(fmt::format("Malformed radiance_field config: {}", e.what()));
  }
  config.aabb = read_aabb(node, config.num_dim);
  if (config.geo_feat_dim < 0) {
    throw std::invalid_argument("geo_feat_dim must not be negative");
  }
  return config;
}

NetConfig load_net_config(const YAML::Node & node)
{
  NetConfig config;
  try {
    read_if_present(node, "input_dim", config.input_dim);
    read_if_present(node, "cond_dim", config.cond_dim);
    read_if_present(node, "output_dim", config.output_dim);
    read_if_present(node, "last_op", config.last_op);
    read_if_present(node, "scale", config.scale);
    read_if_present(node, "log2_hashmap_size", config.log2_hashmap_size);
    read_if_present(node, "n_levels", config.n_levels);
  } catch (const YAML::Exception & e) {
    throw std::invalid_argument(fmt::format("Malformed net config: {}", e.what()));
  }
  config.aabb = read_aabb(node, config.input_dim);
  if (config.output_dim <= 0) {
    throw std::invalid_argument("output_dim must be positive");
  }
  // The condition is normalized with the same aabb as the input.
  if (config.cond_dim > 0 && config.cond_dim != config.input_dim) {
    throw std::invalid_argument(fmt::format(
      "cond_dim ({}) must equal input_dim ({})", config.cond_dim, config.input_dim));
  }
  return config;
}

OptimConfig load_optim_config(const YAML::Node & node)
{
  OptimConfig config;
  if (!node) {
    return config;
  }
  try {
    read_if_present(node, "learning_rate", config.learning_rate);
    read_if_present(node, "eps", config.eps);
    read_if_present(node, "weight_decay", config.weight_decay);
    if (node["betas"]) {
      auto betas = node["betas"].as<std::vector<double>>();
      if (betas.size() != 2) {
        throw std::invalid_argument("betas must have 2 entries");
      }
      config.betas = {betas[0], betas[1]};
    }
  } catch (const YAML::Exception & e) {
    throw std::invalid_argument(fmt::format("Malformed optim config: {}", e.what()));
  }
  return config;
}
