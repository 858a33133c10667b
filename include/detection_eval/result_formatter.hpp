#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <vector>

// Local includes
#include "detection_eval/config.hpp"
#include "detection_eval/detection_types.hpp"


namespace detection_eval
{

/**
 * @brief Converts model outputs into COCO detection records
 * @details Labels are remapped from the contiguous training-class space to
 *          the annotation category ids through a table fixed at construction.
 */
class ResultFormatter
{
public:
  /**
   * @brief Create a formatter
   * @param contiguous_to_json_category Annotation category id for each
   *        contiguous class index, in the order the store returns them
   */
  explicit ResultFormatter(const std::vector<int64_t> & contiguous_to_json_category);

  /**
   * @brief Format a batch for the given IoU type
   * @param predictions Model output per image
   * @param targets Image ids, parallel to predictions
   * @param iou_type Evaluation flavour
   * @throws UnsupportedIoUType for anything but IoUType::kBbox
   * @throws std::invalid_argument on mismatched lengths
   */
  std::vector<DetectionRecord> prepare(
    const std::vector<Prediction> & predictions,
    const std::vector<Target> & targets,
    IoUType iou_type) const;

  // Bounding-box flavour of prepare()
  std::vector<DetectionRecord> prepare_for_coco_detection(
    const std::vector<Prediction> & predictions,
    const std::vector<Target> & targets) const;

  // Throws UnsupportedIoUType unless iou_type can be formatted
  static void check_iou_type(IoUType iou_type);

  const std::vector<int64_t> & contiguous_to_json_category() const
  {
    return contiguous_to_json_category_;
  }

private:
  const std::vector<int64_t> contiguous_to_json_category_;
};

} // namespace detection_eval
