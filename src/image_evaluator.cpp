#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

// Local includes
#include "detection_eval/image_evaluator.hpp"
#include "detection_eval/iou_matcher.hpp"


namespace detection_eval
{

ImageEvaluator::ImageEvaluator(
  std::shared_ptr<const AnnotationStore> ground_truth,
  const EvaluationParams & params)
: ground_truth_(std::move(ground_truth)), params_(params),
  max_dets_(params.max_dets.empty() ? 0 : params.max_dets.back())
{
  if (!ground_truth_) {
    throw std::invalid_argument("ImageEvaluator requires a ground truth store");
  }
  params_.validate();

  category_ids_ = ground_truth_->get_cat_ids();
  std::sort(category_ids_.begin(), category_ids_.end());
  category_ids_.erase(std::unique(category_ids_.begin(), category_ids_.end()), category_ids_.end());
}

std::vector<Annotation> ImageEvaluator::sorted_detections(
  int64_t image_id, int64_t category_id, const AnnotationStore & detections) const
{
  std::vector<Annotation> dts = detections.get_annotations(image_id, category_id);

  // Stable sort keeps the input order between equal scores
  std::stable_sort(dts.begin(), dts.end(),
    [](const Annotation & a, const Annotation & b) {
      return a.score > b.score;
    });
  if (static_cast<int>(dts.size()) > max_dets_) {
    dts.resize(max_dets_);
  }
  return dts;
}

cv::Mat ImageEvaluator::compute_ious(
  const std::vector<Annotation> & ground_truths,
  const std::vector<Annotation> & detections) const
{
  std::vector<BoundingBox> dt_boxes;
  dt_boxes.reserve(detections.size());
  for (const auto & dt : detections) {
    dt_boxes.push_back(dt.bbox);
  }

  std::vector<BoundingBox> gt_boxes;
  std::vector<bool> iscrowd;
  gt_boxes.reserve(ground_truths.size());
  iscrowd.reserve(ground_truths.size());
  for (const auto & gt : ground_truths) {
    gt_boxes.push_back(gt.bbox);
    iscrowd.push_back(gt.iscrowd);
  }

  return compute_iou_matrix(dt_boxes, gt_boxes, iscrowd);
}

MatchRecord ImageEvaluator::match(
  const std::vector<Annotation> & ground_truths,
  const std::vector<Annotation> & detections,
  const cv::Mat & ious,
  const std::array<double, 2> & area_range) const
{
  MatchRecord record;
  if (ground_truths.empty() && detections.empty()) {
    return record;
  }

  // Crowd boxes and boxes outside the area range are ignored, ignored ones
  // are moved to the end so regular ground truths are preferred
  std::vector<bool> ignores;
  ignores.reserve(ground_truths.size());
  for (const auto & gt : ground_truths) {
    ignores.push_back(gt.iscrowd || gt.area < area_range[0] || gt.area > area_range[1]);
  }
  std::vector<size_t> gt_order(ground_truths.size());
  std::iota(gt_order.begin(), gt_order.end(), 0);
  std::stable_sort(gt_order.begin(), gt_order.end(),
    [&ignores](size_t a, size_t b) {
      return static_cast<int>(ignores[a]) < static_cast<int>(ignores[b]);
    });

  const size_t num_thresholds = params_.iou_thresholds.size();
  const size_t num_gt = gt_order.size();
  const size_t num_dt = detections.size();

  record.ground_truth_ids.reserve(num_gt);
  record.ground_truth_ignores.reserve(num_gt);
  for (size_t g : gt_order) {
    record.ground_truth_ids.push_back(ground_truths[g].id);
    record.ground_truth_ignores.push_back(ignores[g]);
  }
  record.detection_ids.reserve(num_dt);
  record.detection_scores.reserve(num_dt);
  for (const auto & dt : detections) {
    record.detection_ids.push_back(dt.id);
    record.detection_scores.push_back(dt.score);
  }

  record.ground_truth_matches.assign(num_thresholds * num_gt, 0);
  record.detection_matches.assign(num_thresholds * num_dt, 0);
  record.detection_ignores.assign(num_thresholds * num_dt, false);

  if (num_gt > 0 && num_dt > 0) {
    for (size_t t = 0; t < num_thresholds; ++t) {
      for (size_t d = 0; d < num_dt; ++d) {
        double best_iou = std::min(params_.iou_thresholds[t], config::MAX_MATCH_IOU);
        int match = -1;
        const double * iou_row = ious.ptr<double>(static_cast<int>(d));

        for (size_t g = 0; g < num_gt; ++g) {
          const Annotation & gt = ground_truths[gt_order[g]];
          // A matched regular ground truth cannot be matched twice
          if (record.ground_truth_matches[t * num_gt + g] > 0 && !gt.iscrowd) {
            continue;
          }
          // Ground truths are sorted by ignore, stop at the first ignored one
          // once a regular match exists
          if (match > -1 && !record.ground_truth_ignores[match] &&
            record.ground_truth_ignores[g])
          {
            break;
          }
          const double iou = iou_row[gt_order[g]];
          if (iou < best_iou) {
            continue;
          }
          best_iou = iou;
          match = static_cast<int>(g);
        }

        if (match == -1) {
          continue;
        }
        record.detection_ignores[t * num_dt + d] = record.ground_truth_ignores[match];
        record.detection_matches[t * num_dt + d] = record.ground_truth_ids[match];
        record.ground_truth_matches[t * num_gt + match] = detections[d].id;
      }
    }
  }

  // Unmatched detections outside the area range are ignored
  for (size_t d = 0; d < num_dt; ++d) {
    const bool outside = detections[d].area < area_range[0] || detections[d].area > area_range[1];
    for (size_t t = 0; t < num_thresholds; ++t) {
      const size_t idx = t * num_dt + d;
      record.detection_ignores[idx] = record.detection_ignores[idx] ||
        (record.detection_matches[idx] == 0 && outside);
    }
  }

  return record;
}

MatchRecord ImageEvaluator::evaluate_image(
  int64_t image_id,
  int64_t category_id,
  size_t area_range_index,
  const AnnotationStore & detections) const
{
  if (area_range_index >= params_.area_ranges.size()) {
    throw std::out_of_range("Area range index out of range: " + std::to_string(area_range_index));
  }

  const std::vector<Annotation> gts = ground_truth_->get_annotations(image_id, category_id);
  const std::vector<Annotation> dts = sorted_detections(image_id, category_id, detections);
  const cv::Mat ious = compute_ious(gts, dts);

  MatchRecord record = match(gts, dts, ious, params_.area_ranges[area_range_index]);
  record.image_id = image_id;
  record.category_id = category_id;
  record.area_range_index = area_range_index;
  record.max_dets = max_dets_;
  return record;
}

EvaluationTensor ImageEvaluator::evaluate(
  const std::vector<int64_t> & image_ids,
  const AnnotationStore & detections) const
{
  const size_t num_area_ranges = params_.area_ranges.size();
  EvaluationTensor tensor(category_ids_.size(), num_area_ranges, image_ids.size());

  for (size_t c = 0; c < category_ids_.size(); ++c) {
    for (size_t i = 0; i < image_ids.size(); ++i) {
      const std::vector<Annotation> gts = ground_truth_->get_annotations(image_ids[i], category_ids_[c]);
      const std::vector<Annotation> dts = sorted_detections(image_ids[i], category_ids_[c], detections);

      // One IoU matrix per (image, category), shared by all area ranges
      const cv::Mat ious = compute_ious(gts, dts);

      for (size_t a = 0; a < num_area_ranges; ++a) {
        MatchRecord & record = tensor.at(c, a, i);
        record = match(gts, dts, ious, params_.area_ranges[a]);
        record.image_id = image_ids[i];
        record.category_id = category_ids_[c];
        record.area_range_index = a;
        record.max_dets = max_dets_;
      }
    }
  }

  return tensor;
}

} // namespace detection_eval
