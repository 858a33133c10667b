#include <stdexcept>
#include <string>

// Local includes
#include "detection_eval/evaluation_tensor.hpp"
#include "detection_eval/exception.hpp"


namespace detection_eval
{

bool MatchRecord::operator==(const MatchRecord & other) const
{
  return image_id == other.image_id &&
         category_id == other.category_id &&
         area_range_index == other.area_range_index &&
         max_dets == other.max_dets &&
         detection_ids == other.detection_ids &&
         ground_truth_ids == other.ground_truth_ids &&
         detection_matches == other.detection_matches &&
         ground_truth_matches == other.ground_truth_matches &&
         detection_scores == other.detection_scores &&
         ground_truth_ignores == other.ground_truth_ignores &&
         detection_ignores == other.detection_ignores;
}

EvaluationTensor::EvaluationTensor(
  size_t num_categories, size_t num_area_ranges, size_t num_images)
: num_categories_(num_categories), num_area_ranges_(num_area_ranges),
  num_images_(num_images),
  records_(num_categories * num_area_ranges * num_images)
{
}

size_t EvaluationTensor::offset(size_t category, size_t area_range, size_t image) const
{
  if (category >= num_categories_ || area_range >= num_area_ranges_ || image >= num_images_) {
    throw std::out_of_range("EvaluationTensor index out of range: (" +
      std::to_string(category) + ", " + std::to_string(area_range) + ", " +
      std::to_string(image) + ")");
  }
  return (category * num_area_ranges_ + area_range) * num_images_ + image;
}

MatchRecord & EvaluationTensor::at(size_t category, size_t area_range, size_t image)
{
  return records_[offset(category, area_range, image)];
}

const MatchRecord & EvaluationTensor::at(size_t category, size_t area_range, size_t image) const
{
  return records_[offset(category, area_range, image)];
}

size_t EvaluationTensor::num_detections() const noexcept
{
  size_t count = 0;
  for (const auto & record : records_) {
    count += record.detection_ids.size();
  }
  return count;
}

EvaluationTensor EvaluationTensor::concatenate(const std::vector<EvaluationTensor> & parts)
{
  if (parts.empty()) {
    return EvaluationTensor();
  }

  size_t total_images = 0;
  for (const auto & part : parts) {
    if (!part.same_layout(parts.front())) {
      throw ConfigurationError(
        "Cannot concatenate evaluation tensors with different layouts: (" +
        std::to_string(part.num_categories_) + ", " + std::to_string(part.num_area_ranges_) +
        ") vs (" + std::to_string(parts.front().num_categories_) + ", " +
        std::to_string(parts.front().num_area_ranges_) + ")");
    }
    total_images += part.num_images_;
  }

  EvaluationTensor result(parts.front().num_categories_, parts.front().num_area_ranges_, total_images);
  for (size_t c = 0; c < result.num_categories_; ++c) {
    for (size_t a = 0; a < result.num_area_ranges_; ++a) {
      size_t image_offset = 0;
      for (const auto & part : parts) {
        for (size_t i = 0; i < part.num_images_; ++i) {
          result.at(c, a, image_offset + i) = part.at(c, a, i);
        }
        image_offset += part.num_images_;
      }
    }
  }
  return result;
}

EvaluationTensor EvaluationTensor::select_images(const std::vector<size_t> & image_indices) const
{
  EvaluationTensor result(num_categories_, num_area_ranges_, image_indices.size());
  for (size_t c = 0; c < num_categories_; ++c) {
    for (size_t a = 0; a < num_area_ranges_; ++a) {
      for (size_t i = 0; i < image_indices.size(); ++i) {
        result.at(c, a, i) = at(c, a, image_indices[i]);
      }
    }
  }
  return result;
}

bool EvaluationTensor::operator==(const EvaluationTensor & other) const
{
  return num_categories_ == other.num_categories_ &&
         num_area_ranges_ == other.num_area_ranges_ &&
         num_images_ == other.num_images_ &&
         records_ == other.records_;
}

} // namespace detection_eval
