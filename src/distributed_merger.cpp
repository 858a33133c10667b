#include <algorithm>
#include <numeric>
#include <string>

// Local includes
#include "detection_eval/distributed_merger.hpp"
#include "detection_eval/exception.hpp"


namespace detection_eval
{

MergedEvaluation merge(const std::vector<PartialResult> & parts)
{
  // Fail fast on inconsistent contributions
  for (size_t p = 0; p < parts.size(); ++p) {
    if (parts[p].image_ids.size() != parts[p].tensor.num_images()) {
      throw ConfigurationError("Process " + std::to_string(p) + " reports " +
        std::to_string(parts[p].image_ids.size()) + " image ids for " +
        std::to_string(parts[p].tensor.num_images()) + " evaluated images");
    }
    if (!parts[p].tensor.same_layout(parts.front().tensor)) {
      throw ConfigurationError("Process " + std::to_string(p) +
        " evaluated a different category/area range configuration: (" +
        std::to_string(parts[p].tensor.num_categories()) + ", " +
        std::to_string(parts[p].tensor.num_area_ranges()) + ") vs (" +
        std::to_string(parts.front().tensor.num_categories()) + ", " +
        std::to_string(parts.front().tensor.num_area_ranges()) + ")");
    }
  }

  std::vector<int64_t> merged_img_ids;
  std::vector<EvaluationTensor> merged_eval_imgs;
  merged_eval_imgs.reserve(parts.size());
  for (const auto & part : parts) {
    merged_img_ids.insert(merged_img_ids.end(), part.image_ids.begin(), part.image_ids.end());
    merged_eval_imgs.push_back(part.tensor);
  }
  EvaluationTensor concatenated = EvaluationTensor::concatenate(merged_eval_imgs);

  // Sorted unique ids with the index of their first occurrence
  std::vector<size_t> order(merged_img_ids.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
    [&merged_img_ids](size_t a, size_t b) {
      return merged_img_ids[a] < merged_img_ids[b];
    });

  MergedEvaluation merged;
  std::vector<size_t> keep;
  for (size_t idx : order) {
    if (!merged.image_ids.empty() && merged.image_ids.back() == merged_img_ids[idx]) {
      continue;
    }
    merged.image_ids.push_back(merged_img_ids[idx]);
    keep.push_back(idx);
  }

  merged.tensor = concatenated.select_images(keep);
  return merged;
}

} // namespace detection_eval
