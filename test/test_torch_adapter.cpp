// C++ standard library includes
#include <stdexcept>
#include <tuple>

// Google Test includes
#include <gtest/gtest.h>

// Torch includes
#include <torch/torch.h>

// Local includes
#include "detection_eval/coco_evaluator.hpp"
#include "detection_eval_torch/torch_adapter.hpp"
#include "test_utils.hpp"


TEST(TorchAdapterTest, ConvertsDetectorOutput)
{
  const auto boxes = torch::tensor({10.0, 20.0, 160.0, 120.0, 0.0, 0.0, 5.0, 5.0},
      torch::kFloat64).reshape({2, 4});
  const auto scores = torch::tensor({0.9, 0.4}, torch::kFloat32);
  const auto labels = torch::tensor({2, 0}, torch::kInt32);

  const auto prediction = detection_eval_torch::to_prediction(boxes, scores, labels);
  ASSERT_EQ(prediction.boxes.size(), 2u);
  EXPECT_FLOAT_EQ(prediction.boxes[0][2], 160.0f);
  EXPECT_FLOAT_EQ(prediction.boxes[1][3], 5.0f);
  EXPECT_FLOAT_EQ(prediction.scores[1], 0.4f);
  EXPECT_EQ(prediction.labels[0], 2);

  const auto same = detection_eval_torch::to_prediction(std::make_tuple(boxes, scores, labels));
  EXPECT_EQ(same.labels, prediction.labels);
}

TEST(TorchAdapterTest, AcceptsEmptyOutput)
{
  const auto prediction = detection_eval_torch::to_prediction(
    torch::zeros({0}), torch::zeros({0}), torch::zeros({0}, torch::kInt64));
  EXPECT_TRUE(prediction.boxes.empty());
  EXPECT_TRUE(prediction.scores.empty());
}

TEST(TorchAdapterTest, RejectsBadShapes)
{
  EXPECT_THROW(
    detection_eval_torch::to_prediction(torch::zeros({2, 5}), torch::zeros({2}), torch::zeros({2})),
    std::invalid_argument);
  EXPECT_THROW(
    detection_eval_torch::to_prediction(torch::zeros({2, 4}), torch::zeros({3}), torch::zeros({2})),
    std::invalid_argument);
  EXPECT_THROW(
    detection_eval_torch::to_prediction(torch::zeros({2, 4}), torch::zeros({2, 1}), torch::zeros({2})),
    std::invalid_argument);
  EXPECT_THROW(detection_eval_torch::to_target(torch::tensor({1, 2})), std::invalid_argument);
}

TEST(TorchAdapterTest, FeedsEvaluator)
{
  auto store = test_utils::make_store(1, {4, 9});
  test_utils::add_ground_truth(store, 1, 1, 9, {10.0, 20.0, 150.0, 100.0});

  detection_eval::COCOEvaluator::Config config;
  config.log_level = detection_eval::Logger::Severity::kERROR;
  detection_eval::COCOEvaluator evaluator(store, config);

  const auto boxes = torch::tensor({10.0f, 20.0f, 160.0f, 120.0f}).reshape({1, 4});
  const auto scores = torch::tensor({0.75f});
  const auto labels = torch::tensor({1}, torch::kInt64);

  const auto target = detection_eval_torch::to_target(torch::tensor(int64_t{1}));
  EXPECT_EQ(target.image_id, 1);

  evaluator.update({detection_eval_torch::to_prediction(boxes, scores, labels)}, {target});
  EXPECT_NEAR(evaluator.compute().at("AP"), 100.0, 1e-6);
}
