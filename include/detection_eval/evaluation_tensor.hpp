#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <vector>


namespace detection_eval
{

/**
 * @brief Matching outcome of one (image, category, area range) cell
 * @details Per-threshold arrays are flattened threshold-major, entry
 *          [t * num_detections + d]. Match entries hold the id of the matched
 *          annotation on the other side, 0 when unmatched. A cell without
 *          ground truth and detections stays empty and is skipped during
 *          accumulation.
 */
struct MatchRecord
{
  int64_t image_id = 0;
  int64_t category_id = 0;
  size_t area_range_index = 0;
  int max_dets = 0;

  std::vector<int64_t> detection_ids;         ///< Sorted by descending score
  std::vector<int64_t> ground_truth_ids;      ///< Non-ignored first
  std::vector<int64_t> detection_matches;     ///< T x D
  std::vector<int64_t> ground_truth_matches;  ///< T x G
  std::vector<double> detection_scores;       ///< D
  std::vector<bool> ground_truth_ignores;     ///< G
  std::vector<bool> detection_ignores;        ///< T x D

  bool empty() const noexcept
  {
    return detection_ids.empty() && ground_truth_ids.empty();
  }

  bool operator==(const MatchRecord & other) const;
  bool operator!=(const MatchRecord & other) const { return !(*this == other); }
};

/**
 * @brief Match records indexed by (category, area range, image)
 * @details Stored row-major with the image axis innermost, the layout the
 *          statistics pass walks.
 */
class EvaluationTensor
{
public:
  EvaluationTensor() = default;
  EvaluationTensor(size_t num_categories, size_t num_area_ranges, size_t num_images);

  MatchRecord & at(size_t category, size_t area_range, size_t image);
  const MatchRecord & at(size_t category, size_t area_range, size_t image) const;

  size_t num_categories() const noexcept { return num_categories_; }
  size_t num_area_ranges() const noexcept { return num_area_ranges_; }
  size_t num_images() const noexcept { return num_images_; }

  // Number of detections over all cells
  size_t num_detections() const noexcept;

  bool same_layout(const EvaluationTensor & other) const noexcept
  {
    return num_categories_ == other.num_categories_ &&
           num_area_ranges_ == other.num_area_ranges_;
  }

  /**
   * @brief Join tensors along the image axis, in the given order
   * @throws ConfigurationError if category or area range axes differ
   */
  static EvaluationTensor concatenate(const std::vector<EvaluationTensor> & parts);

  /**
   * @brief Gather image slices
   * @param image_indices Positions on the image axis, in output order
   */
  EvaluationTensor select_images(const std::vector<size_t> & image_indices) const;

  bool operator==(const EvaluationTensor & other) const;
  bool operator!=(const EvaluationTensor & other) const { return !(*this == other); }

private:
  size_t offset(size_t category, size_t area_range, size_t image) const;

  size_t num_categories_ = 0;
  size_t num_area_ranges_ = 0;
  size_t num_images_ = 0;
  std::vector<MatchRecord> records_;
};

} // namespace detection_eval
