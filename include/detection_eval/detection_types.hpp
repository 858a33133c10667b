#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <string>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>


namespace detection_eval
{

/**
 * @brief Box in COCO convention (min-x, min-y, width, height)
 */
using BoundingBox = cv::Rect2d;

/**
 * @brief Model output for a single image
 * @details Boxes are in corner format (x1, y1, x2, y2) and labels index the
 *          contiguous training-class space. All three vectors must have the
 *          same length.
 */
struct Prediction
{
  std::vector<cv::Vec4f> boxes;   ///< Corner-format boxes
  std::vector<float> scores;      ///< Confidence scores [0.0, 1.0]
  std::vector<int64_t> labels;    ///< Contiguous class indices
};

/**
 * @brief Label side of a batch element
 */
struct Target
{
  int64_t image_id;  ///< Image id in the annotation space
};

/**
 * @brief One detected object in COCO result format
 */
struct DetectionRecord
{
  int64_t image_id;
  int64_t category_id;  ///< Category id in the annotation space
  BoundingBox bbox;
  double score;
};

struct ImageInfo
{
  int64_t id;
  int width;
  int height;
  std::string file_name;
};

struct Category
{
  int64_t id;
  std::string name;
  std::string supercategory;
};

/**
 * @brief Ground-truth or loaded detection instance
 */
struct Annotation
{
  int64_t id;
  int64_t image_id;
  int64_t category_id;
  BoundingBox bbox;
  double area;
  bool iscrowd;
  double score;  ///< Only meaningful for detections
};

} // namespace detection_eval
