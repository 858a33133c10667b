#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <string>
#include <utility>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "detection_eval/detection_types.hpp"


namespace detection_eval
{

namespace utils
{

// Corner format (x1, y1, x2, y2) to COCO xywh, computed in single precision
BoundingBox xyxy_to_xywh(const cv::Vec4f & box);

// COCO xywh to corner format (x1, y1, x2, y2)
cv::Vec4d xywh_to_xyxy(const BoundingBox & box);

// Column alignment for pipe tables
enum class Align
{
  kLeft,
  kCenter
};

/**
 * @brief Render rows as a markdown pipe table
 * @param headers Column headers
 * @param rows Cells, each row may be shorter than headers
 * @param align Alignment of every column
 */
std::string format_pipe_table(
  const std::vector<std::string> & headers,
  const std::vector<std::vector<std::string>> & rows,
  Align align);

// Format a value with fixed precision, NaN is rendered as "nan"
std::string format_float(double value, int digits = 3);

/**
 * @brief Arithmetic mean summed in numpy's pairwise order
 * @return NaN for an empty input
 */
double pairwise_mean(const std::vector<double> & values);

// Single-row table of metric name -> value
std::string create_small_table(const std::vector<std::pair<std::string, double>> & metrics);

// Multi-column (category, AP) table, at most three pairs per row
std::string create_per_category_table(
  const std::vector<std::pair<std::string, double>> & results_per_category);

} // namespace utils

} // namespace detection_eval
