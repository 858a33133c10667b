#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// JSON includes
#include <nlohmann/json.hpp>

// Local includes
#include "detection_eval/detection_types.hpp"


namespace detection_eval
{

/**
 * @brief In-memory COCO dataset: images, categories and annotations
 * @details Holds either ground truth read from a COCO annotation file or
 *          detections loaded with load_results(). The store is a value type,
 *          copying it yields an independent deep copy.
 */
class AnnotationStore
{
public:
  AnnotationStore() = default;

  /**
   * @brief Read a COCO-format annotation file
   * @param annotation_file Path to the JSON file
   * @throws ConfigurationError if the file cannot be read or parsed
   */
  explicit AnnotationStore(const std::string & annotation_file);

  /**
   * @brief Build a store from a parsed COCO dataset
   * @throws ConfigurationError on missing or mistyped fields
   */
  static AnnotationStore from_json(const nlohmann::json & dataset);

  /**
   * @brief Create a detection store sharing this store's images and categories
   * @param records Detections in annotation space
   * @return Store whose annotations are the records, with ids starting at 1
   * @throws std::invalid_argument if a record refers to an unknown image
   */
  AnnotationStore load_results(const std::vector<DetectionRecord> & records) const;

  // Building blocks for in-memory datasets
  void add_image(const ImageInfo & image);
  void add_category(const Category & category);
  void add_annotation(const Annotation & annotation);

  // Category ids in dataset order
  std::vector<int64_t> get_cat_ids() const;

  // Image ids in dataset order
  std::vector<int64_t> get_img_ids() const;

  // Annotations of one (image, category) pair in dataset order
  std::vector<Annotation> get_annotations(int64_t image_id, int64_t category_id) const;

  bool has_image(int64_t image_id) const;

  const std::vector<ImageInfo> & images() const { return images_; }
  const std::vector<Category> & categories() const { return categories_; }
  const std::vector<Annotation> & annotations() const { return annotations_; }

private:
  std::vector<ImageInfo> images_;
  std::vector<Category> categories_;
  std::vector<Annotation> annotations_;

  // image id -> positions in annotations_
  std::unordered_map<int64_t, std::vector<size_t>> image_to_annotations_;
  std::unordered_map<int64_t, size_t> image_index_;
};

/**
 * @brief Read a COCO result file (a JSON list of detections)
 * @throws ConfigurationError if the file cannot be read or parsed
 */
std::vector<DetectionRecord> load_detection_records(const std::string & result_file);

} // namespace detection_eval
