#ifndef NGP_FIELDS__CONFIG_HPP_
#define NGP_FIELDS__CONFIG_HPP_

#include <tiny-cuda-nn/cpp_api.h>
#include <yaml-cpp/yaml.h>

#include <string>
#include <utility>
#include <vector>

struct HashGridConfig
{
  int n_levels = 16;
  int n_features_per_level = 2;
  int log2_hashmap_size = 19;
  int base_resolution = 16;
  float per_level_scale = 2.f;

  tcnn::cpp::json to_json() const;
};

struct MLPConfig
{
  std::string otype = "FullyFusedMLP";
  std::string activation = "ReLU";
  std::string output_activation = "None";
  int n_neurons = 64;
  int n_hidden_layers = 1;

  tcnn::cpp::json to_json() const;
};

// Spherical harmonics over the first 3 input dims, wrapped in a Composite
// encoding so that extra input dims are dropped.
struct SHConfig
{
  int degree = 4;

  tcnn::cpp::json to_json() const;
};

// Scale between successive hash grid levels such that the finest level reaches
// `finest_resolution` scaled by |aabb[0]|.
float per_level_scale_for(
  const std::vector<float> & aabb, float finest_resolution = 2048.f,
  float base_resolution = 16.f, int n_levels = 16);

enum class CondType { kNone, kNeckPose, kPosedVerts };

CondType parse_cond_type(const std::string & name);
std::string to_string(CondType cond_type);

struct RadianceFieldConfig
{
  std::vector<float> aabb;
  int num_dim = 3;
  bool use_viewdirs = false;
  CondType cond_type = CondType::kNone;
  std::string density_activation = "trunc_exp_shifted";
  bool unbounded = false;
  int geo_feat_dim = 15;
  int n_levels = 16;
  int log2_hashmap_size = 19;
};

struct NetConfig
{
  std::vector<float> aabb;
  int input_dim = 3;
  int cond_dim = 0;
  int output_dim = 3;
  std::string last_op = "sigmoid";
  float scale = 1.f;
  int log2_hashmap_size = 19;
  int n_levels = 16;
};

struct OptimConfig
{
  float learning_rate = 1e-2f;
  std::pair<double, double> betas = {0.9, 0.99};
  double eps = 1e-15;
  double weight_decay = 1e-6;
};

YAML::Node load_yaml(const std::string & path);

// node[key] as T, or fallback when the node or the key is missing.
template <typename T>
T get_or(const YAML::Node & node, const char * key, const T & fallback)
{
  if (!node || !node[key]) {
    return fallback;
  }
  return node[key].as<T>();
}

RadianceFieldConfig load_radiance_field_config(const YAML::Node & node);
NetConfig load_net_config(const YAML::Node & node);
OptimConfig load_optim_config(const YAML::Node & node);

#endif  // NGP_FIELDS__CONFIG_HPP_
