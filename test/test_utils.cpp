#include "../src/utils.hpp"

#include <gtest/gtest.h>

TEST(LrScheduleTest, WarmUpIsLinear)
{
  EXPECT_FLOAT_EQ(utils::lr_factor(0, 100, 1000, .1f), 0.f);
  EXPECT_FLOAT_EQ(utils::lr_factor(50, 100, 1000, .1f), .5f);
  EXPECT_FLOAT_EQ(utils::lr_factor(100, 100, 1000, .1f), 1.f);
}

TEST(LrScheduleTest, CosineDecayEndsAtAlpha)
{
  EXPECT_NEAR(utils::lr_factor(1000, 100, 1000, .1f), .1f, 1e-6f);
  EXPECT_NEAR(utils::lr_factor(5000, 100, 1000, .1f), .1f, 1e-6f);
  EXPECT_NEAR(utils::lr_factor(550, 100, 1000, .1f), .55f, 1e-5f);

  float prev = utils::lr_factor(100, 100, 1000, .1f);
  for (int i = 110; i <= 1000; i += 10) {
    const float cur = utils::lr_factor(i, 100, 1000, .1f);
    EXPECT_LE(cur, prev);
    prev = cur;
  }
}

TEST(LrScheduleTest, ApplyLrSetsEveryGroup)
{
  torch::nn::Linear a(3, 4), b(4, 2);
  OptimConfig optim;
  std::vector<torch::optim::OptimizerParamGroup> groups;
  groups.emplace_back(a->parameters(), utils::adam_options(optim));
  groups.emplace_back(b->parameters(), utils::adam_options(optim));
  torch::optim::Adam adam(groups);

  utils::apply_lr(adam, .25f);
  for (auto & g : adam.param_groups()) {
    EXPECT_DOUBLE_EQ(g.options().get_lr(), .25);
  }
}

TEST(LrScheduleTest, AdamOptionsFollowConfig)
{
  OptimConfig optim;
  optim.learning_rate = 3e-3f;
  optim.betas = {.8, .95};
  auto opt = utils::adam_options(optim);
  EXPECT_NEAR(opt->lr(), 3e-3, 1e-9);
  EXPECT_DOUBLE_EQ(std::get<0>(opt->betas()), .8);
  EXPECT_DOUBLE_EQ(std::get<1>(opt->betas()), .95);
  EXPECT_DOUBLE_EQ(opt->eps(), 1e-15);
  EXPECT_DOUBLE_EQ(opt->weight_decay(), 0.);
}

TEST(CheckpointTest, SaveAndLoadModule)
{
  const std::string path = testing::TempDir() + "ngp_fields_ckpt/nested/linear.pt";
  auto saved = std::make_shared<torch::nn::LinearImpl>(3, 5);
  utils::save_checkpoint(saved, path);

  auto loaded = std::make_shared<torch::nn::LinearImpl>(3, 5);
  ASSERT_FALSE(torch::equal(saved->weight, loaded->weight));
  utils::load_checkpoint(loaded, path);
  EXPECT_TRUE(torch::equal(saved->weight, loaded->weight));
  EXPECT_TRUE(torch::equal(saved->bias, loaded->bias));
}

TEST(CheckpointTest, MissingFileThrows)
{
  auto module = std::make_shared<torch::nn::LinearImpl>(3, 5);
  EXPECT_THROW(
    utils::load_checkpoint(module, testing::TempDir() + "does_not_exist.pt"), std::runtime_error);
}
