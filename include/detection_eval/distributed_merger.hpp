#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <vector>

// Local includes
#include "detection_eval/evaluation_tensor.hpp"


namespace detection_eval
{

/**
 * @brief What one process contributes to the merge
 * @details image_ids[i] labels slice i of the tensor's image axis. Ids are
 *          not deduplicated.
 */
struct PartialResult
{
  std::vector<int64_t> image_ids;
  EvaluationTensor tensor;
};

/**
 * @brief Global evaluation state after the merge
 * @details image_ids is sorted ascending and holds every id exactly once.
 */
struct MergedEvaluation
{
  std::vector<int64_t> image_ids;
  EvaluationTensor tensor;
};

/**
 * @brief Merge gathered partial results into one deduplicated tensor
 * @param parts Contributions in gather order
 * @return Image axis sorted ascending, the first occurrence of a repeated
 *         image id in concatenation order is kept
 * @throws ConfigurationError if contributions disagree on the category or
 *         area range axes, or ids and tensor disagree on the image count
 */
MergedEvaluation merge(const std::vector<PartialResult> & parts);

} // namespace detection_eval
