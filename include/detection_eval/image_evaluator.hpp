#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "detection_eval/annotation_store.hpp"
#include "detection_eval/config.hpp"
#include "detection_eval/evaluation_tensor.hpp"


namespace detection_eval
{

/**
 * @brief Per-image, per-category greedy matcher following the COCO protocol
 */
class ImageEvaluator
{
public:
  /**
   * @brief Create an evaluator over the ground truth categories
   * @param ground_truth Read-only ground truth
   * @param params Evaluation protocol
   */
  ImageEvaluator(std::shared_ptr<const AnnotationStore> ground_truth, const EvaluationParams & params);

  /**
   * @brief Evaluate every (category, area range, image) cell
   * @param image_ids Images forming the image axis, in order
   * @param detections Detections loaded against the ground truth
   * @return Tensor of shape (categories, area ranges, images) matched at
   *         max_dets.back()
   */
  EvaluationTensor evaluate(
    const std::vector<int64_t> & image_ids,
    const AnnotationStore & detections) const;

  /**
   * @brief Evaluate a single cell
   */
  MatchRecord evaluate_image(
    int64_t image_id,
    int64_t category_id,
    size_t area_range_index,
    const AnnotationStore & detections) const;

  // Category axis: sorted unique ground truth category ids
  const std::vector<int64_t> & category_ids() const { return category_ids_; }

  const EvaluationParams & params() const { return params_; }

private:
  // Detections of one (image, category), stably sorted by score and truncated
  std::vector<Annotation> sorted_detections(
    int64_t image_id, int64_t category_id, const AnnotationStore & detections) const;

  cv::Mat compute_ious(
    const std::vector<Annotation> & ground_truths,
    const std::vector<Annotation> & detections) const;

  MatchRecord match(
    const std::vector<Annotation> & ground_truths,
    const std::vector<Annotation> & detections,
    const cv::Mat & ious,
    const std::array<double, 2> & area_range) const;

private:
  std::shared_ptr<const AnnotationStore> ground_truth_;
  const EvaluationParams params_;
  const int max_dets_;
  std::vector<int64_t> category_ids_;
};

} // namespace detection_eval
