#include <stdexcept>
#include <string>

// Local includes
#include "detection_eval_torch/torch_adapter.hpp"


namespace detection_eval_torch
{

detection_eval::Prediction to_prediction(
  const torch::Tensor & boxes,
  const torch::Tensor & scores,
  const torch::Tensor & labels)
{
  const bool empty_boxes = boxes.numel() == 0;
  if (!empty_boxes && (boxes.dim() != 2 || boxes.size(1) != 4)) {
    throw std::invalid_argument("Boxes should be a N x 4 tensor, got " +
      std::to_string(boxes.dim()) + " dimensions");
  }
  if (scores.dim() != 1 || labels.dim() != 1) {
    throw std::invalid_argument("Scores and labels should be 1D tensors");
  }

  const int64_t num_boxes = empty_boxes ? 0 : boxes.size(0);
  if (num_boxes != scores.size(0) || num_boxes != labels.size(0)) {
    throw std::invalid_argument("Number of boxes, scores and labels should match: " +
      std::to_string(num_boxes) + ", " + std::to_string(scores.size(0)) + ", " +
      std::to_string(labels.size(0)));
  }

  detection_eval::Prediction prediction;
  if (num_boxes == 0) {
    return prediction;
  }

  auto boxes_cpu = boxes.to(torch::kCPU, torch::kFloat32).contiguous();
  auto scores_cpu = scores.to(torch::kCPU, torch::kFloat32).contiguous();
  auto labels_cpu = labels.to(torch::kCPU, torch::kInt64).contiguous();

  auto boxes_a = boxes_cpu.accessor<float, 2>();
  auto scores_a = scores_cpu.accessor<float, 1>();
  auto labels_a = labels_cpu.accessor<int64_t, 1>();

  prediction.boxes.reserve(num_boxes);
  prediction.scores.reserve(num_boxes);
  prediction.labels.reserve(num_boxes);
  for (int64_t i = 0; i < num_boxes; ++i) {
    prediction.boxes.emplace_back(boxes_a[i][0], boxes_a[i][1], boxes_a[i][2], boxes_a[i][3]);
    prediction.scores.push_back(scores_a[i]);
    prediction.labels.push_back(labels_a[i]);
  }
  return prediction;
}

detection_eval::Prediction to_prediction(
  const std::tuple<torch::Tensor, torch::Tensor, torch::Tensor> & output)
{
  return to_prediction(std::get<0>(output), std::get<1>(output), std::get<2>(output));
}

detection_eval::Target to_target(const torch::Tensor & image_id)
{
  if (image_id.numel() != 1) {
    throw std::invalid_argument("Image id should be a scalar tensor");
  }
  return detection_eval::Target{image_id.item<int64_t>()};
}

} // namespace detection_eval_torch
