#include <memory>
#include <string>
#include <utility>

// Local includes
#include "detection_eval/coco_evaluator.hpp"
#include "detection_eval/result_formatter.hpp"


namespace detection_eval
{

namespace
{

const COCOEvaluator::Config & checked(const COCOEvaluator::Config & config)
{
  ResultFormatter::check_iou_type(config.iou_type);
  config.params.validate();
  return config;
}

} // namespace

COCOEvaluator::COCOEvaluator(
  const std::string & annotation_file,
  const Config & config,
  std::shared_ptr<Communicator> communicator)
: COCOEvaluator(AnnotationStore(annotation_file), config, std::move(communicator))
{
}

COCOEvaluator::COCOEvaluator(
  const AnnotationStore & ground_truth,
  const Config & config,
  std::shared_ptr<Communicator> communicator)
: config_(checked(config)),
  logger_(config.log_level, config.log_stream ? *config.log_stream : std::cerr),
  ground_truth_(std::make_shared<const AnnotationStore>(ground_truth)),
  communicator_(communicator ? std::move(communicator) : std::make_shared<LocalCommunicator>()),
  accumulator_(ground_truth_, config.params, config.iou_type)
{
  logger_.verbose("COCOEvaluator initialized with " +
    std::to_string(ground_truth_->images().size()) + " images, " +
    std::to_string(ground_truth_->categories().size()) + " categories, rank " +
    std::to_string(communicator_->rank()) + " of " + std::to_string(communicator_->world_size()));
}

void COCOEvaluator::update(
  const std::vector<Prediction> & predictions,
  const std::vector<Target> & targets)
{
  accumulator_.update(predictions, targets);
}

void COCOEvaluator::update(
  const std::vector<DetectionRecord> & records,
  const std::vector<int64_t> & image_ids)
{
  accumulator_.update(records, image_ids);
}

SummaryMetrics COCOEvaluator::compute(const std::vector<std::string> & class_names)
{
  // Synchronize between processes
  MergedEvaluation merged = gather_and_merge(*communicator_, accumulator_.local_result());
  logger_.verbose("Merged " + std::to_string(merged.image_ids.size()) + " unique images from " +
    std::to_string(communicator_->world_size()) + " participants");

  statistics_ = std::make_unique<StatisticsAccumulator>(
    config_.params, accumulator_.category_ids(), std::move(merged), logger_);
  statistics_->accumulate();
  statistics_->summarize();
  return statistics_->derive_results(class_names);
}

void COCOEvaluator::reset()
{
  accumulator_.reset();
  statistics_.reset();
}

} // namespace detection_eval
