#include "../src/config.hpp"

#include <gtest/gtest.h>

#include <cmath>

TEST(ConfigTest, PerLevelScaleFollowsAabb)
{
  // 2048 * 0.5 / 16 = 64 = 2^6 spread over 15 level steps.
  EXPECT_NEAR(per_level_scale_for({-.5f, 0.f, 0.f, .5f, 1.f, 1.f}), std::exp2(6.f / 15.f), 1e-5f);
  EXPECT_NEAR(per_level_scale_for({1.f, 0.f, 0.f, 2.f, 1.f, 1.f}), std::exp2(7.f / 15.f), 1e-5f);
}

TEST(ConfigTest, PerLevelScaleRejectsZeroAabb)
{
  EXPECT_THROW(per_level_scale_for({0.f, 0.f, 0.f, 1.f, 1.f, 1.f}), std::invalid_argument);
  EXPECT_THROW(per_level_scale_for({}), std::invalid_argument);
}

TEST(ConfigTest, CondType)
{
  EXPECT_EQ(parse_cond_type("none"), CondType::kNone);
  EXPECT_EQ(parse_cond_type("neck_pose"), CondType::kNeckPose);
  EXPECT_EQ(parse_cond_type("posed_verts"), CondType::kPosedVerts);
  EXPECT_EQ(to_string(CondType::kPosedVerts), "posed_verts");
  EXPECT_THROW(parse_cond_type("pose"), std::invalid_argument);
}

TEST(ConfigTest, EncodingJson)
{
  HashGridConfig grid;
  grid.n_levels = 8;
  grid.log2_hashmap_size = 9;
  tcnn::cpp::json j = grid.to_json();
  EXPECT_EQ(j["otype"], "HashGrid");
  EXPECT_EQ(j["n_levels"].get<int>(), 8);
  EXPECT_EQ(j["log2_hashmap_size"].get<int>(), 9);
  EXPECT_EQ(j["base_resolution"].get<int>(), 16);

  tcnn::cpp::json sh = SHConfig{}.to_json();
  EXPECT_EQ(sh["otype"], "Composite");
  ASSERT_EQ(sh["nested"].size(), 1u);
  EXPECT_EQ(sh["nested"][0]["otype"], "SphericalHarmonics");
  EXPECT_EQ(sh["nested"][0]["degree"].get<int>(), 4);
  EXPECT_EQ(sh["nested"][0]["n_dims_to_encode"].get<int>(), 3);

  MLPConfig mlp;
  mlp.output_activation = "Sigmoid";
  tcnn::cpp::json m = mlp.to_json();
  EXPECT_EQ(m["otype"], "FullyFusedMLP");
  EXPECT_EQ(m["output_activation"], "Sigmoid");
  EXPECT_EQ(m["n_neurons"].get<int>(), 64);
}

TEST(ConfigTest, RadianceFieldDefaults)
{
  const YAML::Node node = YAML::Load("aabb: [-1, -1, -1, 1, 1, 1]");
  const RadianceFieldConfig config = load_radiance_field_config(node);
  EXPECT_EQ(config.aabb.size(), 6u);
  EXPECT_EQ(config.num_dim, 3);
  EXPECT_FALSE(config.use_viewdirs);
  EXPECT_EQ(config.cond_type, CondType::kNone);
  EXPECT_EQ(config.density_activation, "trunc_exp_shifted");
  EXPECT_FALSE(config.unbounded);
  EXPECT_EQ(config.geo_feat_dim, 15);
  EXPECT_EQ(config.n_levels, 16);
  EXPECT_EQ(config.log2_hashmap_size, 19);
}

TEST(ConfigTest, RadianceFieldOverrides)
{
  const YAML::Node node = YAML::Load(R"(
aabb: [-0.5, 0.4, -0.5, 0.5, 0.7, 0.3]
use_viewdirs: true
cond_type: posed_verts
unbounded: true
geo_feat_dim: 7
n_levels: 8
log2_hashmap_size: 15
density_activation: softplus
)");
  const RadianceFieldConfig config = load_radiance_field_config(node);
  EXPECT_TRUE(config.use_viewdirs);
  EXPECT_EQ(config.cond_type, CondType::kPosedVerts);
  EXPECT_TRUE(config.unbounded);
  EXPECT_EQ(config.geo_feat_dim, 7);
  EXPECT_EQ(config.n_levels, 8);
  EXPECT_EQ(config.log2_hashmap_size, 15);
  EXPECT_EQ(config.density_activation, "softplus");
  EXPECT_FLOAT_EQ(config.aabb[1], .4f);
}

TEST(ConfigTest, RadianceFieldErrors)
{
  EXPECT_THROW(load_radiance_field_config(YAML::Load("num_dim: 3")), std::invalid_argument);
  EXPECT_THROW(
    load_radiance_field_config(YAML::Load("aabb: [-1, -1, 1, 1]")), std::invalid_argument);
  EXPECT_THROW(
    load_radiance_field_config(YAML::Load("aabb: [1, -1, -1, -1, 1, 1]")),
    std::invalid_argument);
  EXPECT_THROW(
    load_radiance_field_config(YAML::Load("{aabb: [-1, -1, -1, 1, 1, 1], cond_type: foo}")),
    std::invalid_argument);
  EXPECT_THROW(
    load_radiance_field_config(YAML::Load("{aabb: [-1, -1, -1, 1, 1, 1], n_levels: abc}")),
    std::invalid_argument);
}

TEST(ConfigTest, NetConfig)
{
  const NetConfig defaults = load_net_config(YAML::Load("aabb: [-1, -1, -1, 1, 1, 1]"));
  EXPECT_EQ(defaults.input_dim, 3);
  EXPECT_EQ(defaults.cond_dim, 0);
  EXPECT_EQ(defaults.output_dim, 3);
  EXPECT_EQ(defaults.last_op, "sigmoid");
  EXPECT_FLOAT_EQ(defaults.scale, 1.f);

  const NetConfig config = load_net_config(YAML::Load(
    "{aabb: [-1, -1, 1, 1], input_dim: 2, cond_dim: 2, output_dim: 1, last_op: none, scale: "
    "0.5}"));
  EXPECT_EQ(config.input_dim, 2);
  EXPECT_EQ(config.cond_dim, 2);
  EXPECT_EQ(config.output_dim, 1);
  EXPECT_EQ(config.last_op, "none");
  EXPECT_FLOAT_EQ(config.scale, .5f);
}

TEST(ConfigTest, NetConfigErrors)
{
  EXPECT_THROW(
    load_net_config(YAML::Load("{aabb: [-1, -1, -1, 1, 1, 1], cond_dim: 2}")),
    std::invalid_argument);
  EXPECT_THROW(
    load_net_config(YAML::Load("{aabb: [-1, -1, -1, 1, 1, 1], output_dim: 0}")),
    std::invalid_argument);
  EXPECT_THROW(load_net_config(YAML::Load("{aabb: 3}")), std::invalid_argument);
}

TEST(ConfigTest, OptimConfig)
{
  const OptimConfig defaults = load_optim_config(YAML::Node());
  EXPECT_FLOAT_EQ(defaults.learning_rate, 1e-2f);
  EXPECT_DOUBLE_EQ(defaults.betas.second, .99);
  EXPECT_DOUBLE_EQ(defaults.eps, 1e-15);

  const OptimConfig config =
    load_optim_config(YAML::Load("{learning_rate: 0.001, betas: [0.8, 0.9], weight_decay: 0}"));
  EXPECT_FLOAT_EQ(config.learning_rate, 1e-3f);
  EXPECT_DOUBLE_EQ(config.betas.first, .8);
  EXPECT_DOUBLE_EQ(config.weight_decay, 0.);

  EXPECT_THROW(load_optim_config(YAML::Load("{betas: [0.8]}")), std::invalid_argument);
}

TEST(ConfigTest, GetOr)
{
  const YAML::Node node = YAML::Load("{fit: {end_iter: 10}}");
  EXPECT_EQ(get_or<int>(node["fit"], "end_iter", 5), 10);
  EXPECT_EQ(get_or<int>(node["fit"], "report_freq", 5), 5);
  EXPECT_EQ(get_or<int>(node["query"], "batch_size", 7), 7);
}

TEST(ConfigTest, LoadYamlMissingFile)
{
  EXPECT_THROW(load_yaml("/nonexistent/ngp_fields.yaml"), std::runtime_error);
}
