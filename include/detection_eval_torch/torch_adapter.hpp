#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <tuple>

// Torch includes
#include <torch/torch.h>

// Local includes
#include "detection_eval/detection_types.hpp"


namespace detection_eval_torch
{

/**
 * @brief Convert detector output tensors into an evaluation prediction
 * @param boxes N x 4 corner-format boxes
 * @param scores N scores
 * @param labels N contiguous class indices
 * @throws std::invalid_argument on unexpected shapes
 */
detection_eval::Prediction to_prediction(
  const torch::Tensor & boxes,
  const torch::Tensor & scores,
  const torch::Tensor & labels);

// Same for the (boxes, scores, labels) tuple a TorchScript detector returns
detection_eval::Prediction to_prediction(
  const std::tuple<torch::Tensor, torch::Tensor, torch::Tensor> & output);

// Target from a scalar image id tensor
detection_eval::Target to_target(const torch::Tensor & image_id);

} // namespace detection_eval_torch
