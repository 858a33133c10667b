#include <stdexcept>
#include <string>

// Local includes
#include "detection_eval/detection_utils.hpp"
#include "detection_eval/exception.hpp"
#include "detection_eval/result_formatter.hpp"


namespace detection_eval
{

ResultFormatter::ResultFormatter(const std::vector<int64_t> & contiguous_to_json_category)
: contiguous_to_json_category_(contiguous_to_json_category)
{
}

void ResultFormatter::check_iou_type(IoUType iou_type)
{
  if (iou_type != IoUType::kBbox) {
    throw UnsupportedIoUType(to_string(iou_type));
  }
}

std::vector<DetectionRecord> ResultFormatter::prepare(
  const std::vector<Prediction> & predictions,
  const std::vector<Target> & targets,
  IoUType iou_type) const
{
  check_iou_type(iou_type);
  return prepare_for_coco_detection(predictions, targets);
}

std::vector<DetectionRecord> ResultFormatter::prepare_for_coco_detection(
  const std::vector<Prediction> & predictions,
  const std::vector<Target> & targets) const
{
  if (predictions.size() != targets.size()) {
    throw std::invalid_argument("Expected one target per prediction, got " +
      std::to_string(predictions.size()) + " predictions and " +
      std::to_string(targets.size()) + " targets");
  }

  std::vector<DetectionRecord> coco_results;
  for (size_t i = 0; i < predictions.size(); ++i) {
    const Prediction & prediction = predictions[i];
    const int64_t original_id = targets[i].image_id;

    if (prediction.boxes.size() != prediction.scores.size() ||
      prediction.boxes.size() != prediction.labels.size())
    {
      throw std::invalid_argument("Prediction for image " + std::to_string(original_id) +
        " has " + std::to_string(prediction.boxes.size()) + " boxes, " +
        std::to_string(prediction.scores.size()) + " scores and " +
        std::to_string(prediction.labels.size()) + " labels");
    }

    for (size_t k = 0; k < prediction.boxes.size(); ++k) {
      const int64_t label = prediction.labels[k];
      if (label < 0 || label >= static_cast<int64_t>(contiguous_to_json_category_.size())) {
        throw std::out_of_range("Label " + std::to_string(label) + " of image " +
          std::to_string(original_id) + " is outside the " +
          std::to_string(contiguous_to_json_category_.size()) + " known categories");
      }

      coco_results.push_back(DetectionRecord{
          original_id,
          contiguous_to_json_category_[label],
          utils::xyxy_to_xywh(prediction.boxes[k]),
          static_cast<double>(prediction.scores[k])});
    }
  }

  return coco_results;
}

} // namespace detection_eval
