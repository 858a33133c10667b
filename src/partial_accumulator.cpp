#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

// Local includes
#include "detection_eval/partial_accumulator.hpp"


namespace detection_eval
{

namespace
{

std::shared_ptr<const AnnotationStore> require_store(std::shared_ptr<const AnnotationStore> store)
{
  if (!store) {
    throw std::invalid_argument("PartialEvaluationAccumulator requires a ground truth store");
  }
  return store;
}

} // namespace

PartialEvaluationAccumulator::PartialEvaluationAccumulator(
  std::shared_ptr<const AnnotationStore> ground_truth,
  const EvaluationParams & params,
  IoUType iou_type)
: ground_truth_(require_store(std::move(ground_truth))),
  iou_type_(iou_type),
  formatter_(ground_truth_->get_cat_ids()),
  evaluator_(ground_truth_, params),
  num_detections_(0)
{
  ResultFormatter::check_iou_type(iou_type_);
}

void PartialEvaluationAccumulator::update(
  const std::vector<Prediction> & predictions,
  const std::vector<Target> & targets)
{
  std::vector<int64_t> image_ids;
  image_ids.reserve(targets.size());
  for (const auto & target : targets) {
    image_ids.push_back(target.image_id);
  }

  const std::vector<DetectionRecord> records = formatter_.prepare(predictions, targets, iou_type_);
  update(records, image_ids);
}

void PartialEvaluationAccumulator::update(
  const std::vector<DetectionRecord> & records,
  const std::vector<int64_t> & image_ids)
{
  std::vector<int64_t> img_ids(image_ids);
  std::sort(img_ids.begin(), img_ids.end());
  auto duplicate = std::adjacent_find(img_ids.begin(), img_ids.end());
  if (duplicate != img_ids.end()) {
    throw std::invalid_argument("Image id " + std::to_string(*duplicate) +
      " appears more than once in a single update");
  }

  // Evaluation still runs without records, ground truth yields false negatives
  const AnnotationStore detections = ground_truth_->load_results(records);
  EvaluationTensor eval_imgs = evaluator_.evaluate(img_ids, detections);

  // Only records of the evaluated images count
  num_detections_ += static_cast<size_t>(std::count_if(records.begin(), records.end(),
    [&img_ids](const DetectionRecord & record) {
      return std::binary_search(img_ids.begin(), img_ids.end(), record.image_id);
    }));
  image_ids_.insert(image_ids_.end(), img_ids.begin(), img_ids.end());
  eval_imgs_.push_back(std::move(eval_imgs));
}

PartialResult PartialEvaluationAccumulator::local_result() const
{
  PartialResult result;
  result.image_ids = image_ids_;
  if (eval_imgs_.empty()) {
    result.tensor = EvaluationTensor(
      evaluator_.category_ids().size(), evaluator_.params().area_ranges.size(), 0);
  } else {
    result.tensor = EvaluationTensor::concatenate(eval_imgs_);
  }
  return result;
}

void PartialEvaluationAccumulator::reset()
{
  image_ids_.clear();
  eval_imgs_.clear();
  num_detections_ = 0;
}

} // namespace detection_eval
