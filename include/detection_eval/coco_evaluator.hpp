#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Local includes
#include "detection_eval/annotation_store.hpp"
#include "detection_eval/communicator.hpp"
#include "detection_eval/config.hpp"
#include "detection_eval/logger.hpp"
#include "detection_eval/partial_accumulator.hpp"
#include "detection_eval/statistics_accumulator.hpp"


namespace detection_eval
{

// COCO evaluator that works across processes
class COCOEvaluator
{
public:
  struct Config
  {
    /**
     * @brief Kind of evaluation, only IoUType::kBbox is supported
     */
    IoUType iou_type;

    /**
     * @brief Evaluation protocol
     */
    EvaluationParams params;

    /**
     * @brief Log level for evaluation messages
     * @details The per-threshold summary lines are logged at kVERBOSE.
     */
    Logger::Severity log_level;

    /**
     * @brief Stream the log is written to
     */
    std::ostream * log_stream;

    /**
     * @brief Default constructor
     * @details Bounding-box evaluation with the COCO protocol, logging to std::cerr.
     */
    Config()
    : iou_type(IoUType::kBbox), log_level(Logger::Severity::kINFO), log_stream(&std::cerr) {}
  };

  /**
   * @brief Evaluate against a COCO annotation file
   * @param annotation_file Path to the ground truth JSON
   * @param config Evaluation configuration
   * @param communicator Gather used by compute(), a LocalCommunicator if null
   */
  explicit COCOEvaluator(
    const std::string & annotation_file,
    const Config & config = Config(),
    std::shared_ptr<Communicator> communicator = nullptr);

  /**
   * @brief Evaluate against an in-memory ground truth
   * @details The store is copied, later changes to it have no effect.
   */
  explicit COCOEvaluator(
    const AnnotationStore & ground_truth,
    const Config & config = Config(),
    std::shared_ptr<Communicator> communicator = nullptr);

  // Disable copy and move semantics, the accumulator state belongs to one worker
  COCOEvaluator(const COCOEvaluator &) = delete;
  COCOEvaluator & operator=(const COCOEvaluator &) = delete;
  COCOEvaluator(COCOEvaluator &&) = delete;
  COCOEvaluator & operator=(COCOEvaluator &&) = delete;

  // Accumulate one batch of model outputs
  void update(const std::vector<Prediction> & predictions, const std::vector<Target> & targets);

  // Accumulate detections already in annotation space
  void update(const std::vector<DetectionRecord> & records, const std::vector<int64_t> & image_ids);

  /**
   * @brief Gather, merge and summarize everything seen by all participants
   * @param class_names Optional names of the categories for per-category AP
   * @return Metrics on a 0-100 scale
   * @details Blocks in the gather until every participant calls compute().
   *          Calling it again returns the same result.
   */
  SummaryMetrics compute(const std::vector<std::string> & class_names = {});

  // Drop the accumulated state
  void reset();

  const AnnotationStore & ground_truth() const { return *ground_truth_; }
  const PartialEvaluationAccumulator & accumulator() const { return accumulator_; }

  const std::vector<int64_t> & contiguous_to_json_category() const
  {
    return accumulator_.formatter().contiguous_to_json_category();
  }

  // Statistics of the last compute(), null before the first one
  const StatisticsAccumulator * statistics() const { return statistics_.get(); }

private:
  const Config config_;
  const Logger logger_;
  std::shared_ptr<const AnnotationStore> ground_truth_;
  std::shared_ptr<Communicator> communicator_;
  PartialEvaluationAccumulator accumulator_;
  std::unique_ptr<StatisticsAccumulator> statistics_;
};

} // namespace detection_eval
