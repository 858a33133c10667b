#include <algorithm>
#include <stdexcept>

// Local includes
#include "detection_eval/iou_matcher.hpp"


namespace detection_eval
{

cv::Mat compute_iou_matrix(
  const std::vector<BoundingBox> & detections,
  const std::vector<BoundingBox> & ground_truths,
  const std::vector<bool> & iscrowd)
{
  if (iscrowd.size() != ground_truths.size()) {
    throw std::invalid_argument("Expected one crowd flag per ground truth box");
  }
  if (detections.empty() || ground_truths.empty()) {
    return cv::Mat();
  }

  const int num_detections = static_cast<int>(detections.size());
  const int num_ground_truths = static_cast<int>(ground_truths.size());
  cv::Mat ious = cv::Mat::zeros(num_detections, num_ground_truths, CV_64F);

  std::vector<double> ground_truth_areas(ground_truths.size());
  for (size_t g = 0; g < ground_truths.size(); ++g) {
    ground_truth_areas[g] = ground_truths[g].width * ground_truths[g].height;
  }

  for (int d = 0; d < num_detections; ++d) {
    const BoundingBox & dt = detections[d];
    const double dt_area = dt.width * dt.height;
    double * row = ious.ptr<double>(d);

    for (int g = 0; g < num_ground_truths; ++g) {
      const BoundingBox & gt = ground_truths[g];
      const double w = std::min(dt.x + dt.width, gt.x + gt.width) - std::max(dt.x, gt.x);
      if (w <= 0) {
        continue;
      }
      const double h = std::min(dt.y + dt.height, gt.y + gt.height) - std::max(dt.y, gt.y);
      if (h <= 0) {
        continue;
      }
      const double intersection = w * h;
      const double union_area = iscrowd[g] ? dt_area : dt_area + ground_truth_areas[g] - intersection;
      row[g] = intersection / union_area;
    }
  }

  return ious;
}

} // namespace detection_eval
