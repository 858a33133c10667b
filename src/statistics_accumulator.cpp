#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

// Local includes
#include "detection_eval/detection_utils.hpp"
#include "detection_eval/exception.hpp"
#include "detection_eval/statistics_accumulator.hpp"


namespace detection_eval
{

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

bool SummaryMetrics::contains(const std::string & name) const
{
  return std::any_of(metrics.begin(), metrics.end(),
    [&name](const std::pair<std::string, double> & metric) {
      return metric.first == name;
    });
}

double SummaryMetrics::at(const std::string & name) const
{
  for (const auto & metric : metrics) {
    if (metric.first == name) {
      return metric.second;
    }
  }
  throw std::out_of_range("Unknown metric: " + name);
}

const std::vector<std::string> & StatisticsAccumulator::metric_names()
{
  static const std::vector<std::string> names = {
    "AP", "AP50", "AP75", "APs", "APm", "APl",
    "AR1", "AR10", "AR100", "ARs", "ARm", "ARl"
  };
  return names;
}

StatisticsAccumulator::StatisticsAccumulator(
  const EvaluationParams & params,
  std::vector<int64_t> category_ids,
  MergedEvaluation merged,
  const Logger & logger)
: params_(params), category_ids_(std::move(category_ids)), merged_(std::move(merged)),
  logger_(logger), accumulated_(false), summarized_(false)
{
  params_.validate();
  if (merged_.tensor.num_images() > 0 &&
    (merged_.tensor.num_categories() != category_ids_.size() ||
    merged_.tensor.num_area_ranges() != params_.area_ranges.size()))
  {
    throw ConfigurationError("Merged evaluation does not match the category/area range configuration");
  }
}

void StatisticsAccumulator::accumulate()
{
  const int num_iou = static_cast<int>(params_.iou_thresholds.size());
  const int num_recall = static_cast<int>(params_.recall_thresholds.size());
  const int num_categories = static_cast<int>(category_ids_.size());
  const int num_area_ranges = static_cast<int>(params_.area_ranges.size());
  const int num_max_dets = static_cast<int>(params_.max_dets.size());

  if (num_categories == 0) {
    precision_.release();
    recall_.release();
    scores_.release();
  } else {
    const int precision_sizes[] = {num_iou, num_recall, num_categories, num_area_ranges, num_max_dets};
    const int recall_sizes[] = {num_iou, num_categories, num_area_ranges, num_max_dets};
    precision_ = cv::Mat(5, precision_sizes, CV_64F, cv::Scalar(-1.0));
    scores_ = cv::Mat(5, precision_sizes, CV_64F, cv::Scalar(-1.0));
    recall_ = cv::Mat(4, recall_sizes, CV_64F, cv::Scalar(-1.0));

    if (merged_.tensor.num_images() > 0) {
      for (size_t k = 0; k < category_ids_.size(); ++k) {
        for (size_t a = 0; a < params_.area_ranges.size(); ++a) {
          for (size_t m = 0; m < params_.max_dets.size(); ++m) {
            compute_precision_recall(k, a, m);
          }
        }
      }
    }
  }

  accumulated_ = true;
  summarized_ = false;
  logger_.verbose("Accumulated " + std::to_string(merged_.image_ids.size()) + " images over " +
    std::to_string(category_ids_.size()) + " categories");
}

void StatisticsAccumulator::compute_precision_recall(
  size_t category, size_t area_range, size_t max_dets_index)
{
  const EvaluationTensor & tensor = merged_.tensor;
  const size_t max_det = static_cast<size_t>(params_.max_dets[max_dets_index]);

  // Every applicable detection of the dataset as (image, position in image)
  std::vector<double> dt_scores;
  std::vector<std::pair<size_t, size_t>> dt_refs;
  size_t num_valid_ground_truth = 0;
  bool has_evaluations = false;

  for (size_t i = 0; i < tensor.num_images(); ++i) {
    const MatchRecord & evaluation = tensor.at(category, area_range, i);
    if (evaluation.empty()) {
      continue;
    }
    has_evaluations = true;

    const size_t num_detections = std::min(evaluation.detection_scores.size(), max_det);
    for (size_t d = 0; d < num_detections; ++d) {
      dt_scores.push_back(evaluation.detection_scores[d]);
      dt_refs.emplace_back(i, d);
    }
    for (bool ignore : evaluation.ground_truth_ignores) {
      if (!ignore) {
        ++num_valid_ground_truth;
      }
    }
  }

  if (!has_evaluations || num_valid_ground_truth == 0) {
    return;
  }

  // Stable sort to reproduce the reference ordering of equal scores
  std::vector<size_t> order(dt_scores.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
    [&dt_scores](size_t a, size_t b) {
      return dt_scores[a] > dt_scores[b];
    });

  const int k = static_cast<int>(category);
  const int a = static_cast<int>(area_range);
  const int m = static_cast<int>(max_dets_index);
  const double eps = std::numeric_limits<double>::epsilon();
  const size_t nd = order.size();

  std::vector<double> recalls;
  std::vector<double> precisions;
  recalls.reserve(nd);
  precisions.reserve(nd);

  for (size_t t = 0; t < params_.iou_thresholds.size(); ++t) {
    double tp = 0.0;
    double fp = 0.0;
    recalls.clear();
    precisions.clear();

    for (size_t idx : order) {
      const MatchRecord & evaluation = tensor.at(category, area_range, dt_refs[idx].first);
      const size_t num_detections = evaluation.detection_ids.size();
      const size_t flat = t * num_detections + dt_refs[idx].second;
      const bool matched = evaluation.detection_matches[flat] != 0;
      const bool ignored = evaluation.detection_ignores[flat];

      if (matched && !ignored) {
        tp += 1.0;
      }
      if (!matched && !ignored) {
        fp += 1.0;
      }
      recalls.push_back(tp / static_cast<double>(num_valid_ground_truth));
      precisions.push_back(tp / (fp + tp + eps));
    }

    const int ti = static_cast<int>(t);
    const int recall_idx[] = {ti, k, a, m};
    recall_.at<double>(recall_idx) = nd > 0 ? recalls.back() : 0.0;

    // Make precision non-increasing from the right
    for (size_t i = nd; i-- > 1;) {
      if (precisions[i] > precisions[i - 1]) {
        precisions[i - 1] = precisions[i];
      }
    }

    for (size_t r = 0; r < params_.recall_thresholds.size(); ++r) {
      const auto low = std::lower_bound(recalls.begin(), recalls.end(), params_.recall_thresholds[r]);
      const size_t pi = static_cast<size_t>(low - recalls.begin());

      const int precision_idx[] = {ti, static_cast<int>(r), k, a, m};
      if (pi < nd) {
        precision_.at<double>(precision_idx) = precisions[pi];
        scores_.at<double>(precision_idx) = dt_scores[order[pi]];
      } else {
        precision_.at<double>(precision_idx) = 0.0;
        scores_.at<double>(precision_idx) = 0.0;
      }
    }
  }
}

double StatisticsAccumulator::summarize_slice(
  bool ap, double iou_threshold, const std::string & area_range, int max_dets) const
{
  const int aind = static_cast<int>(params_.area_range_index(area_range));
  const int mind = static_cast<int>(params_.max_dets_index(max_dets));

  std::vector<int> thresholds;
  if (iou_threshold < 0) {
    for (size_t t = 0; t < params_.iou_thresholds.size(); ++t) {
      thresholds.push_back(static_cast<int>(t));
    }
  } else {
    thresholds.push_back(static_cast<int>(params_.iou_threshold_index(iou_threshold)));
  }

  std::vector<double> valid;
  if (!precision_.empty()) {
    const int num_recall = static_cast<int>(params_.recall_thresholds.size());
    const int num_categories = static_cast<int>(category_ids_.size());

    for (int t : thresholds) {
      if (ap) {
        for (int r = 0; r < num_recall; ++r) {
          for (int k = 0; k < num_categories; ++k) {
            const int idx[] = {t, r, k, aind, mind};
            const double value = precision_.at<double>(idx);
            if (value > -1) {
              valid.push_back(value);
            }
          }
        }
      } else {
        for (int k = 0; k < num_categories; ++k) {
          const int idx[] = {t, k, aind, mind};
          const double value = recall_.at<double>(idx);
          if (value > -1) {
            valid.push_back(value);
          }
        }
      }
    }
  }
  const double mean = utils::pairwise_mean(valid);

  char iou_str[32];
  if (iou_threshold < 0) {
    std::snprintf(iou_str, sizeof(iou_str), "%0.2f:%0.2f",
      params_.iou_thresholds.front(), params_.iou_thresholds.back());
  } else {
    std::snprintf(iou_str, sizeof(iou_str), "%0.2f", iou_threshold);
  }
  char line[160];
  std::snprintf(line, sizeof(line), " %-18s %s @[ IoU=%-9s | area=%6s | maxDets=%3d ] = %0.3f",
    ap ? "Average Precision" : "Average Recall", ap ? "(AP)" : "(AR)",
    iou_str, area_range.c_str(), max_dets, mean);
  logger_.verbose(line);

  return mean;
}

const std::vector<double> & StatisticsAccumulator::summarize()
{
  if (!accumulated_) {
    throw std::logic_error("Please run accumulate() before summarize()");
  }

  const auto & max_dets = params_.max_dets;
  auto max_dets_at = [&max_dets](size_t i) {
      return max_dets[std::min(i, max_dets.size() - 1)];
    };

  std::vector<double> stats(12);
  stats[0] = summarize_slice(true, -1.0, "all", max_dets.back());
  stats[1] = summarize_slice(true, 0.5, "all", max_dets_at(2));
  stats[2] = summarize_slice(true, 0.75, "all", max_dets_at(2));
  stats[3] = summarize_slice(true, -1.0, "small", max_dets_at(2));
  stats[4] = summarize_slice(true, -1.0, "medium", max_dets_at(2));
  stats[5] = summarize_slice(true, -1.0, "large", max_dets_at(2));
  stats[6] = summarize_slice(false, -1.0, "all", max_dets_at(0));
  stats[7] = summarize_slice(false, -1.0, "all", max_dets_at(1));
  stats[8] = summarize_slice(false, -1.0, "all", max_dets_at(2));
  stats[9] = summarize_slice(false, -1.0, "small", max_dets_at(2));
  stats[10] = summarize_slice(false, -1.0, "medium", max_dets_at(2));
  stats[11] = summarize_slice(false, -1.0, "large", max_dets_at(2));

  stats_ = stats;
  summarized_ = true;
  return stats_;
}

double StatisticsAccumulator::category_ap(size_t category) const
{
  std::vector<double> valid;
  if (!precision_.empty()) {
    const int k = static_cast<int>(category);
    const int a = 0;  // "all" area range
    const int m = static_cast<int>(params_.max_dets.size()) - 1;
    for (size_t t = 0; t < params_.iou_thresholds.size(); ++t) {
      for (size_t r = 0; r < params_.recall_thresholds.size(); ++r) {
        const int idx[] = {static_cast<int>(t), static_cast<int>(r), k, a, m};
        const double value = precision_.at<double>(idx);
        if (value > -1) {
          valid.push_back(value);
        }
      }
    }
  }
  return utils::pairwise_mean(valid);
}

SummaryMetrics StatisticsAccumulator::derive_results(const std::vector<std::string> & class_names) const
{
  if (!summarized_) {
    throw std::logic_error("Please run summarize() before derive_results()");
  }

  const std::vector<std::string> & names = metric_names();
  const size_t num_metrics = 6;  // AP family reported for bbox

  SummaryMetrics results;
  if (!has_detections()) {
    logger_.warning("No predictions from the model!");
    for (size_t idx = 0; idx < num_metrics; ++idx) {
      results.metrics.emplace_back(names[idx], kNaN);
    }
    results.table = utils::create_small_table(results.metrics);
    return results;
  }

  double total = 0.0;
  for (size_t idx = 0; idx < num_metrics; ++idx) {
    results.metrics.emplace_back(names[idx], stats_[idx] * 100);
    total += stats_[idx] * 100;
  }
  results.table = utils::create_small_table(results.metrics);
  logger_.info("Evaluation results for bbox:\n" + results.table);

  if (!std::isfinite(total)) {
    logger_.info("Some metrics cannot be computed and is shown as NaN.");
  }

  if (class_names.size() <= 1) {
    return results;
  }
  if (class_names.size() != category_ids_.size()) {
    throw std::invalid_argument("Got " + std::to_string(class_names.size()) +
      " class names for " + std::to_string(category_ids_.size()) + " categories");
  }

  for (size_t idx = 0; idx < class_names.size(); ++idx) {
    results.per_category.emplace_back(class_names[idx], category_ap(idx) * 100);
  }
  results.per_category_table = utils::create_per_category_table(results.per_category);
  logger_.info("Per-category bbox AP:\n" + results.per_category_table);

  for (const auto & category : results.per_category) {
    results.metrics.emplace_back("AP-" + category.first, category.second);
  }
  return results;
}

} // namespace detection_eval
