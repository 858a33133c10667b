#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

// Local includes
#include "detection_eval/detection_utils.hpp"


namespace detection_eval
{

namespace utils
{

BoundingBox xyxy_to_xywh(const cv::Vec4f & box)
{
  // Width and height are taken in float, matching a float32 tensor conversion
  const float width = box[2] - box[0];
  const float height = box[3] - box[1];
  return BoundingBox(
    static_cast<double>(box[0]), static_cast<double>(box[1]),
    static_cast<double>(width), static_cast<double>(height));
}

cv::Vec4d xywh_to_xyxy(const BoundingBox & box)
{
  return cv::Vec4d(box.x, box.y, box.x + box.width, box.y + box.height);
}

std::string format_float(double value, int digits)
{
  if (std::isnan(value)) {
    return "nan";
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(digits) << value;
  return oss.str();
}

namespace
{

std::string pad_cell(const std::string & cell, size_t width, Align align)
{
  if (cell.size() >= width) {
    return cell;
  }
  const size_t padding = width - cell.size();
  if (align == Align::kLeft) {
    return cell + std::string(padding, ' ');
  }
  const size_t left = padding / 2;
  return std::string(left, ' ') + cell + std::string(padding - left, ' ');
}

} // namespace

std::string format_pipe_table(
  const std::vector<std::string> & headers,
  const std::vector<std::vector<std::string>> & rows,
  Align align)
{
  std::vector<size_t> widths(headers.size(), 0);
  for (size_t c = 0; c < headers.size(); ++c) {
    widths[c] = headers[c].size();
  }
  for (const auto & row : rows) {
    for (size_t c = 0; c < row.size() && c < widths.size(); ++c) {
      widths[c] = std::max(widths[c], row[c].size());
    }
  }

  auto write_row = [&](std::ostringstream & oss, const std::vector<std::string> & row) {
      oss << "|";
      for (size_t c = 0; c < widths.size(); ++c) {
        const std::string cell = c < row.size() ? row[c] : std::string();
        oss << " " << pad_cell(cell, widths[c], align) << " |";
      }
    };

  std::ostringstream oss;
  write_row(oss, headers);
  oss << "\n|";
  for (size_t c = 0; c < widths.size(); ++c) {
    if (align == Align::kLeft) {
      oss << ":" << std::string(widths[c] + 1, '-') << "|";
    } else {
      oss << ":" << std::string(widths[c], '-') << ":|";
    }
  }
  for (const auto & row : rows) {
    oss << "\n";
    write_row(oss, row);
  }
  return oss.str();
}

std::string create_small_table(const std::vector<std::pair<std::string, double>> & metrics)
{
  std::vector<std::string> headers;
  std::vector<std::string> values;
  for (const auto & metric : metrics) {
    headers.push_back(metric.first);
    values.push_back(format_float(metric.second));
  }
  return format_pipe_table(headers, {values}, Align::kCenter);
}

std::string create_per_category_table(
  const std::vector<std::pair<std::string, double>> & results_per_category)
{
  const size_t num_cols = std::min<size_t>(6, results_per_category.size() * 2);
  if (num_cols == 0) {
    return std::string();
  }

  std::vector<std::string> flatten;
  for (const auto & result : results_per_category) {
    flatten.push_back(result.first);
    flatten.push_back(format_float(result.second));
  }

  std::vector<std::string> headers;
  for (size_t c = 0; c < num_cols / 2; ++c) {
    headers.push_back("category");
    headers.push_back("AP");
  }

  std::vector<std::vector<std::string>> rows;
  for (size_t start = 0; start < flatten.size(); start += num_cols) {
    const size_t end = std::min(start + num_cols, flatten.size());
    rows.emplace_back(flatten.begin() + start, flatten.begin() + end);
  }
  return format_pipe_table(headers, rows, Align::kLeft);
}

namespace
{

// Block size of the pairwise summation
constexpr size_t kPairwiseBlock = 128;

// Pairwise summation with the blocking and unrolling of numpy's add.reduce
double pairwise_sum(const double * values, size_t n)
{
  if (n < 8) {
    double res = 0.;
    for (size_t i = 0; i < n; ++i) {
      res += values[i];
    }
    return res;
  } else if (n <= kPairwiseBlock) {
    double r[8];
    for (size_t j = 0; j < 8; ++j) {
      r[j] = values[j];
    }
    size_t i = 8;
    for (; i < n - (n % 8); i += 8) {
      for (size_t j = 0; j < 8; ++j) {
        r[j] += values[i + j];
      }
    }
    double res = ((r[0] + r[1]) + (r[2] + r[3])) + ((r[4] + r[5]) + (r[6] + r[7]));
    for (; i < n; ++i) {
      res += values[i];
    }
    return res;
  }

  size_t n2 = n / 2;
  n2 -= n2 % 8;
  return pairwise_sum(values, n2) + pairwise_sum(values + n2, n - n2);
}

} // namespace

double pairwise_mean(const std::vector<double> & values)
{
  if (values.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  // The reduction starts from 0 and sums every element pairwise
  return pairwise_sum(values.data(), values.size()) / static_cast<double>(values.size());
}

} // namespace utils

} // namespace detection_eval
