#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <array>
#include <cstddef>
#include <string>
#include <vector>


namespace detection_eval
{

namespace config
{
// COCO evaluation protocol constants
constexpr double IOU_THRESHOLD_MIN = 0.5;
constexpr double IOU_THRESHOLD_MAX = 0.95;
constexpr double IOU_THRESHOLD_STEP = 0.05;
constexpr double RECALL_STEP = 0.01;
constexpr std::array<int, 3> MAX_DETS = {1, 10, 100};
constexpr double SMALL_AREA = 32.0 * 32.0;
constexpr double MEDIUM_AREA = 96.0 * 96.0;
constexpr double MAX_AREA = 1e5 * 1e5;

// Largest IoU a match threshold is clamped to
constexpr double MAX_MATCH_IOU = 1.0 - 1e-10;

} // namespace config

// IoU flavours known to COCO, only kBbox is evaluated
enum class IoUType
{
  kBbox,
  kSegm,
  kKeypoints
};

std::string to_string(IoUType iou_type);

// Evenly spaced values over [start, stop], endpoint included
std::vector<double> linspace(double start, double stop, size_t num);

struct EvaluationParams
{
  /**
   * @brief IoU thresholds swept when matching, ascending
   */
  std::vector<double> iou_thresholds;

  /**
   * @brief Recall points the interpolated precision is sampled at
   */
  std::vector<double> recall_thresholds;

  /**
   * @brief Ascending detection-count thresholds per image
   * @details Matching runs once at max_dets.back(), the smaller values are
   *          applied at accumulation time.
   */
  std::vector<int> max_dets;

  /**
   * @brief Object area buckets as [min, max] in squared pixels
   * @details Index 0 must be the "all" bucket.
   */
  std::vector<std::array<double, 2>> area_ranges;

  /**
   * @brief Names of the area buckets, parallel to area_ranges
   */
  std::vector<std::string> area_range_labels;

  /**
   * @brief Default constructor
   * @details Initializes the standard COCO detection protocol.
   */
  EvaluationParams();

  size_t area_range_index(const std::string & label) const;
  size_t max_dets_index(int max_dets_value) const;
  size_t iou_threshold_index(double iou_threshold) const;

  // Throws ConfigurationError if the parameters are inconsistent
  void validate() const;
};

} // namespace detection_eval
