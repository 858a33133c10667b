#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

// Local includes
#include "detection_eval/config.hpp"
#include "detection_eval/exception.hpp"


namespace detection_eval
{

std::string to_string(IoUType iou_type)
{
  switch (iou_type) {
    case IoUType::kBbox: return "bbox";
    case IoUType::kSegm: return "segm";
    case IoUType::kKeypoints: return "keypoints";
    default: return "unknown";
  }
}

std::vector<double> linspace(double start, double stop, size_t num)
{
  std::vector<double> values(num);
  if (num == 0) {
    return values;
  }
  if (num == 1) {
    values[0] = start;
    return values;
  }

  const double step = (stop - start) / static_cast<double>(num - 1);
  for (size_t i = 0; i < num; ++i) {
    values[i] = static_cast<double>(i) * step + start;
  }
  values[num - 1] = stop;
  return values;
}

EvaluationParams::EvaluationParams()
: max_dets(config::MAX_DETS.begin(), config::MAX_DETS.end()),
  area_ranges({
    {0.0, config::MAX_AREA},
    {0.0, config::SMALL_AREA},
    {config::SMALL_AREA, config::MEDIUM_AREA},
    {config::MEDIUM_AREA, config::MAX_AREA}}),
  area_range_labels({"all", "small", "medium", "large"})
{
  const auto num_iou = static_cast<size_t>(std::round(
      (config::IOU_THRESHOLD_MAX - config::IOU_THRESHOLD_MIN) / config::IOU_THRESHOLD_STEP)) + 1;
  iou_thresholds = linspace(config::IOU_THRESHOLD_MIN, config::IOU_THRESHOLD_MAX, num_iou);

  const auto num_recall = static_cast<size_t>(std::round(1.0 / config::RECALL_STEP)) + 1;
  recall_thresholds = linspace(0.0, 1.0, num_recall);
}

size_t EvaluationParams::area_range_index(const std::string & label) const
{
  auto it = std::find(area_range_labels.begin(), area_range_labels.end(), label);
  if (it == area_range_labels.end()) {
    throw std::out_of_range("Unknown area range label: " + label);
  }
  return static_cast<size_t>(it - area_range_labels.begin());
}

size_t EvaluationParams::max_dets_index(int max_dets_value) const
{
  auto it = std::find(max_dets.begin(), max_dets.end(), max_dets_value);
  if (it == max_dets.end()) {
    throw std::out_of_range("Unknown max detections value: " + std::to_string(max_dets_value));
  }
  return static_cast<size_t>(it - max_dets.begin());
}

size_t EvaluationParams::iou_threshold_index(double iou_threshold) const
{
  // Thresholds come out of linspace, compare with a float tolerance
  for (size_t i = 0; i < iou_thresholds.size(); ++i) {
    if (std::fabs(iou_thresholds[i] - iou_threshold) <
      std::numeric_limits<float>::epsilon())
    {
      return i;
    }
  }
  throw std::out_of_range("Unknown iou threshold: " + std::to_string(iou_threshold));
}

void EvaluationParams::validate() const
{
  if (iou_thresholds.empty() || recall_thresholds.empty() || max_dets.empty() ||
    area_ranges.empty())
  {
    throw ConfigurationError("Evaluation parameters must not be empty");
  }
  if (area_ranges.size() != area_range_labels.size()) {
    throw ConfigurationError("Area ranges and area range labels differ in length");
  }
  if (!std::is_sorted(iou_thresholds.begin(), iou_thresholds.end())) {
    throw ConfigurationError("IoU thresholds must be ascending");
  }
  if (!std::is_sorted(recall_thresholds.begin(), recall_thresholds.end())) {
    throw ConfigurationError("Recall thresholds must be ascending");
  }
  if (!std::is_sorted(max_dets.begin(), max_dets.end()) || max_dets.front() <= 0) {
    throw ConfigurationError("Max detections must be positive and ascending");
  }
}

} // namespace detection_eval
