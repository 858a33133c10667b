// C++ standard library includes
#include <memory>
#include <string>
#include <vector>

// Google Test includes
#include <gtest/gtest.h>

// Local includes
#include "detection_eval/image_evaluator.hpp"
#include "test_utils.hpp"


class ImageEvaluatorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    store_ = test_utils::make_store(3, {7, 2});
  }

  std::unique_ptr<detection_eval::ImageEvaluator> make_evaluator(
    const detection_eval::EvaluationParams & params = detection_eval::EvaluationParams())
  {
    ground_truth_ = std::make_shared<const detection_eval::AnnotationStore>(store_);
    return std::make_unique<detection_eval::ImageEvaluator>(ground_truth_, params);
  }

  size_t area_index(const std::string & label) const
  {
    return detection_eval::EvaluationParams().area_range_index(label);
  }

  detection_eval::AnnotationStore store_;
  std::shared_ptr<const detection_eval::AnnotationStore> ground_truth_;
};


TEST_F(ImageEvaluatorTest, CategoryAxisIsSorted)
{
  auto evaluator = make_evaluator();
  EXPECT_EQ(evaluator->category_ids(), (std::vector<int64_t>{2, 7}));
}

TEST_F(ImageEvaluatorTest, HighestScoreTakesTheMatch)
{
  test_utils::add_ground_truth(store_, 1, 1, 7, {0, 0, 100, 100});
  auto evaluator = make_evaluator();

  // Second record scores higher, it is matched and the first one is a false positive
  auto detections = ground_truth_->load_results({
      test_utils::make_record(1, 7, {0, 0, 100, 100}, 0.6),
      test_utils::make_record(1, 7, {10, 10, 100, 100}, 0.9),
    });

  const auto record = evaluator->evaluate_image(1, 7, area_index("all"), detections);
  const size_t num_thresholds = detection_eval::EvaluationParams().iou_thresholds.size();

  ASSERT_EQ(record.detection_ids, (std::vector<int64_t>{2, 1}));
  EXPECT_EQ(record.detection_scores, (std::vector<double>{0.9, 0.6}));
  ASSERT_EQ(record.detection_matches.size(), num_thresholds * 2);
  ASSERT_EQ(record.ground_truth_matches.size(), num_thresholds);

  // At IoU 0.5 the best detection matches, the other one stays unmatched
  EXPECT_EQ(record.detection_matches[0], 1);
  EXPECT_EQ(record.detection_matches[1], 0);
  EXPECT_EQ(record.ground_truth_matches[0], 2);

  // The shifted box has IoU 8100 / 11900, at 0.95 only the exact box matches
  const size_t last = num_thresholds - 1;
  EXPECT_EQ(record.detection_matches[last * 2], 0);
  EXPECT_EQ(record.detection_matches[last * 2 + 1], 1);
  EXPECT_EQ(record.ground_truth_matches[last], 1);

  EXPECT_FALSE(record.ground_truth_ignores[0]);
  for (bool ignore : record.detection_ignores) {
    EXPECT_FALSE(ignore);
  }
}

TEST_F(ImageEvaluatorTest, RegularGroundTruthPreferredOverIgnored)
{
  // Crowd region listed first, both overlap the detection perfectly
  test_utils::add_ground_truth(store_, 1, 1, 7, {0, 0, 200, 200}, true);
  test_utils::add_ground_truth(store_, 2, 1, 7, {10, 10, 50, 50});
  auto evaluator = make_evaluator();

  auto detections = ground_truth_->load_results({
      test_utils::make_record(1, 7, {10, 10, 50, 50}, 0.8),
    });
  const auto record = evaluator->evaluate_image(1, 7, area_index("all"), detections);

  // Ignored ground truths are moved behind regular ones
  EXPECT_EQ(record.ground_truth_ids, (std::vector<int64_t>{2, 1}));
  EXPECT_EQ(record.ground_truth_ignores, (std::vector<bool>{false, true}));

  EXPECT_EQ(record.detection_matches[0], 2);
  EXPECT_FALSE(record.detection_ignores[0]);
}

TEST_F(ImageEvaluatorTest, MatchToIgnoredGroundTruthIsIgnored)
{
  test_utils::add_ground_truth(store_, 1, 1, 7, {0, 0, 200, 200}, true);
  auto evaluator = make_evaluator();

  auto detections = ground_truth_->load_results({
      test_utils::make_record(1, 7, {20, 20, 30, 30}, 0.8),
      test_utils::make_record(1, 7, {40, 40, 30, 30}, 0.7),
    });
  const auto record = evaluator->evaluate_image(1, 7, area_index("all"), detections);

  // A crowd region can absorb several detections, none of them counts
  EXPECT_EQ(record.detection_matches[0], 1);
  EXPECT_EQ(record.detection_matches[1], 1);
  EXPECT_TRUE(record.detection_ignores[0]);
  EXPECT_TRUE(record.detection_ignores[1]);
  EXPECT_TRUE(record.ground_truth_ignores[0]);
}

TEST_F(ImageEvaluatorTest, AreaRangeIgnoresOutOfBucketGroundTruth)
{
  // 20 x 20 = 400 is a small object
  test_utils::add_ground_truth(store_, 1, 1, 7, {0, 0, 20, 20});
  auto evaluator = make_evaluator();
  auto detections = ground_truth_->load_results({
      test_utils::make_record(1, 7, {0, 0, 20, 20}, 0.9),
    });

  const auto small = evaluator->evaluate_image(1, 7, area_index("small"), detections);
  EXPECT_EQ(small.ground_truth_ignores, (std::vector<bool>{false}));
  EXPECT_EQ(small.detection_matches[0], 1);
  EXPECT_FALSE(small.detection_ignores[0]);

  const auto large = evaluator->evaluate_image(1, 7, area_index("large"), detections);
  EXPECT_EQ(large.ground_truth_ignores, (std::vector<bool>{true}));
  EXPECT_EQ(large.detection_matches[0], 1);
  EXPECT_TRUE(large.detection_ignores[0]);
}

TEST_F(ImageEvaluatorTest, UnmatchedDetectionOutsideAreaRangeIsIgnored)
{
  auto evaluator = make_evaluator();
  auto detections = ground_truth_->load_results({
      test_utils::make_record(1, 7, {0, 0, 20, 20}, 0.9),
    });

  const auto large = evaluator->evaluate_image(1, 7, area_index("large"), detections);
  EXPECT_EQ(large.detection_matches[0], 0);
  EXPECT_TRUE(large.detection_ignores[0]);

  const auto small = evaluator->evaluate_image(1, 7, area_index("small"), detections);
  EXPECT_EQ(small.detection_matches[0], 0);
  EXPECT_FALSE(small.detection_ignores[0]);
}

TEST_F(ImageEvaluatorTest, TruncatesToMaxDetsWithStableOrder)
{
  detection_eval::EvaluationParams params;
  params.max_dets = {1, 2};
  auto evaluator = make_evaluator(params);

  auto detections = ground_truth_->load_results({
      test_utils::make_record(1, 7, {0, 0, 10, 10}, 0.5),
      test_utils::make_record(1, 7, {0, 0, 11, 11}, 0.9),
      test_utils::make_record(1, 7, {0, 0, 12, 12}, 0.5),
    });
  const auto record = evaluator->evaluate_image(1, 7, area_index("all"), detections);

  EXPECT_EQ(record.max_dets, 2);
  EXPECT_EQ(record.detection_ids, (std::vector<int64_t>{2, 1}));
  EXPECT_EQ(record.detection_scores, (std::vector<double>{0.9, 0.5}));
}

TEST_F(ImageEvaluatorTest, CellWithoutInstancesIsEmpty)
{
  test_utils::add_ground_truth(store_, 1, 1, 7, {0, 0, 50, 50});
  auto evaluator = make_evaluator();
  auto detections = ground_truth_->load_results({});

  const auto empty = evaluator->evaluate_image(2, 7, area_index("all"), detections);
  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(empty.image_id, 2);

  // Ground truth without detections is a false negative, not an empty cell
  const auto missed = evaluator->evaluate_image(1, 7, area_index("all"), detections);
  EXPECT_FALSE(missed.empty());
  EXPECT_TRUE(missed.detection_ids.empty());
  EXPECT_EQ(missed.ground_truth_matches.size(), detection_eval::EvaluationParams().iou_thresholds.size());
  for (int64_t match : missed.ground_truth_matches) {
    EXPECT_EQ(match, 0);
  }
}

TEST_F(ImageEvaluatorTest, EvaluateFillsEveryCell)
{
  test_utils::add_ground_truth(store_, 1, 1, 7, {0, 0, 50, 50});
  test_utils::add_ground_truth(store_, 2, 3, 2, {0, 0, 150, 150});
  auto evaluator = make_evaluator();
  auto detections = ground_truth_->load_results({
      test_utils::make_record(3, 2, {0, 0, 150, 150}, 0.7),
    });

  const std::vector<int64_t> image_ids = {1, 3};
  const auto tensor = evaluator->evaluate(image_ids, detections);

  ASSERT_EQ(tensor.num_categories(), 2u);
  ASSERT_EQ(tensor.num_area_ranges(), 4u);
  ASSERT_EQ(tensor.num_images(), 2u);

  for (size_t c = 0; c < 2; ++c) {
    for (size_t a = 0; a < 4; ++a) {
      for (size_t i = 0; i < 2; ++i) {
        const auto & record = tensor.at(c, a, i);
        EXPECT_EQ(record.image_id, image_ids[i]);
        EXPECT_EQ(record.category_id, evaluator->category_ids()[c]);
        EXPECT_EQ(record.area_range_index, a);

        // Cells match a direct single-cell evaluation
        EXPECT_EQ(record, evaluator->evaluate_image(image_ids[i], record.category_id, a, detections));
      }
    }
  }

  // Category 2 on image 3 holds the true positive
  EXPECT_EQ(tensor.at(0, 0, 1).detection_matches[0], 2);
  EXPECT_TRUE(tensor.at(0, 0, 0).empty());
  EXPECT_EQ(tensor.num_detections(), 4u);  // one detection in every area range
}
