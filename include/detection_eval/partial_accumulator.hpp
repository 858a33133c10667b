#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <memory>
#include <vector>

// Local includes
#include "detection_eval/annotation_store.hpp"
#include "detection_eval/config.hpp"
#include "detection_eval/distributed_merger.hpp"
#include "detection_eval/image_evaluator.hpp"
#include "detection_eval/result_formatter.hpp"


namespace detection_eval
{

/**
 * @brief Process-local evaluation state fed batch by batch
 * @details Calls must be sequential per instance. Concurrent workers each
 *          own an accumulator and meet at the merge.
 */
class PartialEvaluationAccumulator
{
public:
  PartialEvaluationAccumulator(
    std::shared_ptr<const AnnotationStore> ground_truth,
    const EvaluationParams & params,
    IoUType iou_type = IoUType::kBbox);

  /**
   * @brief Evaluate one batch of model outputs
   * @param predictions Model output per image
   * @param targets Image ids, parallel to predictions and unique in the call
   * @throws std::invalid_argument on length mismatch or repeated image ids
   */
  void update(const std::vector<Prediction> & predictions, const std::vector<Target> & targets);

  /**
   * @brief Evaluate detections already in annotation space
   * @param records Detections, records of images outside image_ids are ignored
   * @param image_ids Images evaluated by this call, unique
   */
  void update(const std::vector<DetectionRecord> & records, const std::vector<int64_t> & image_ids);

  // Image ids seen so far with their match records, ready for the gather
  PartialResult local_result() const;

  void reset();

  const std::vector<int64_t> & image_ids() const { return image_ids_; }
  const std::vector<EvaluationTensor> & tensors() const { return eval_imgs_; }
  // Detections on the evaluated images, records outside image_ids excluded
  size_t num_detections() const { return num_detections_; }

  const std::vector<int64_t> & category_ids() const { return evaluator_.category_ids(); }
  const ResultFormatter & formatter() const { return formatter_; }

private:
  std::shared_ptr<const AnnotationStore> ground_truth_;
  const IoUType iou_type_;
  const ResultFormatter formatter_;
  const ImageEvaluator evaluator_;

  std::vector<int64_t> image_ids_;
  std::vector<EvaluationTensor> eval_imgs_;
  size_t num_detections_;
};

} // namespace detection_eval
