#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "detection_eval/detection_types.hpp"


namespace detection_eval
{

/**
 * @brief IoU between every detection and every ground truth box
 * @param detections Detection boxes (rows of the result)
 * @param ground_truths Ground truth boxes (columns of the result)
 * @param iscrowd Crowd flag per ground truth, a crowd box is compared
 *        against the detection area instead of the union
 * @return D x G matrix of type CV_64F, empty if either side is empty
 */
cv::Mat compute_iou_matrix(
  const std::vector<BoundingBox> & detections,
  const std::vector<BoundingBox> & ground_truths,
  const std::vector<bool> & iscrowd);

} // namespace detection_eval
