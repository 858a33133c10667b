#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "detection_eval/config.hpp"
#include "detection_eval/distributed_merger.hpp"
#include "detection_eval/logger.hpp"


namespace detection_eval
{

/**
 * @brief Final metrics, values on a 0-100 scale
 * @details NaN marks a metric that cannot be computed.
 */
struct SummaryMetrics
{
  std::vector<std::pair<std::string, double>> metrics;       ///< "AP", "AP50", ..., "AP-<class>"
  std::vector<std::pair<std::string, double>> per_category;  ///< (class name, AP)
  std::string table;                                         ///< Standard metrics as a pipe table
  std::string per_category_table;                            ///< Empty without class names

  bool contains(const std::string & name) const;

  // Throws std::out_of_range for unknown metrics
  double at(const std::string & name) const;
};

/**
 * @brief Precision/recall statistics over a merged evaluation
 */
class StatisticsAccumulator
{
public:
  // Names of the standard detection metrics, in stats() order
  static const std::vector<std::string> & metric_names();

  /**
   * @brief Take ownership of the merged evaluation
   * @param params Protocol the evaluation was produced with
   * @param category_ids Category axis of the merged tensor
   * @param merged Output of merge()
   * @param logger Sink for summaries and warnings
   */
  StatisticsAccumulator(
    const EvaluationParams & params,
    std::vector<int64_t> category_ids,
    MergedEvaluation merged,
    const Logger & logger = Logger());

  /**
   * @brief Build the precision, recall and score arrays
   * @details precision and scores have dims [iou, recall, category, area,
   *          max dets], recall has dims [iou, category, area, max dets];
   *          -1 marks undefined entries.
   */
  void accumulate();

  /**
   * @brief Reduce the arrays to the 12 standard COCO statistics
   * @details AP, AP50, AP75, APs, APm, APl, AR1, AR10, AR100, ARs, ARm, ARl
   *          on a 0-1 scale, NaN where the slice holds no valid entry.
   * @return Statistics, also kept for derive_results()
   */
  const std::vector<double> & summarize();

  /**
   * @brief Reportable mapping of the summarized statistics
   * @param class_names Optional names of the category axis; with more than
   *        one name the per-category AP is added
   */
  SummaryMetrics derive_results(const std::vector<std::string> & class_names = {}) const;

  const cv::Mat & precision() const { return precision_; }
  const cv::Mat & recall() const { return recall_; }
  const cv::Mat & scores() const { return scores_; }
  const std::vector<double> & stats() const { return stats_; }

  const MergedEvaluation & merged() const { return merged_; }

  bool has_detections() const { return merged_.tensor.num_detections() > 0; }

private:
  void compute_precision_recall(size_t category, size_t area_range, size_t max_dets_index);

  double summarize_slice(bool ap, double iou_threshold, const std::string & area_range, int max_dets) const;

  double category_ap(size_t category) const;

private:
  const EvaluationParams params_;
  const std::vector<int64_t> category_ids_;
  const MergedEvaluation merged_;
  const Logger logger_;

  cv::Mat precision_;
  cv::Mat recall_;
  cv::Mat scores_;
  std::vector<double> stats_;
  bool accumulated_;
  bool summarized_;
};

} // namespace detection_eval
