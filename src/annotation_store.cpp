#include <fstream>
#include <stdexcept>

// Local includes
#include "detection_eval/annotation_store.hpp"
#include "detection_eval/exception.hpp"


namespace detection_eval
{

namespace
{

nlohmann::json read_json_file(const std::string & path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigurationError("Failed to open annotation file: " + path);
  }

  try {
    return nlohmann::json::parse(file);
  } catch (const nlohmann::json::exception & e) {
    throw ConfigurationError("Failed to parse " + path + ": " + std::string(e.what()));
  }
}

BoundingBox parse_bbox(const nlohmann::json & bbox)
{
  if (!bbox.is_array() || bbox.size() != 4) {
    throw ConfigurationError("Expected bbox to have 4 elements [x, y, width, height]");
  }
  return BoundingBox(
    bbox[0].get<double>(), bbox[1].get<double>(),
    bbox[2].get<double>(), bbox[3].get<double>());
}

} // namespace

AnnotationStore::AnnotationStore(const std::string & annotation_file)
{
  *this = from_json(read_json_file(annotation_file));
}

AnnotationStore AnnotationStore::from_json(const nlohmann::json & dataset)
{
  AnnotationStore store;
  try {
    if (dataset.contains("images")) {
      for (const auto & image : dataset.at("images")) {
        store.add_image(ImageInfo{
            image.at("id").get<int64_t>(),
            image.value("width", 0),
            image.value("height", 0),
            image.value("file_name", std::string())});
      }
    }

    if (dataset.contains("categories")) {
      for (const auto & category : dataset.at("categories")) {
        store.add_category(Category{
            category.at("id").get<int64_t>(),
            category.value("name", std::string()),
            category.value("supercategory", std::string())});
      }
    }

    if (dataset.contains("annotations")) {
      for (const auto & ann : dataset.at("annotations")) {
        BoundingBox bbox = parse_bbox(ann.at("bbox"));
        // Missing area falls back to the box area
        const double area = ann.contains("area") ?
          ann.at("area").get<double>() : bbox.width * bbox.height;
        const bool iscrowd = ann.contains("iscrowd") && ann.at("iscrowd").get<int>() != 0;

        store.add_annotation(Annotation{
            ann.at("id").get<int64_t>(),
            ann.at("image_id").get<int64_t>(),
            ann.at("category_id").get<int64_t>(),
            bbox,
            area,
            iscrowd,
            ann.value("score", 0.0)});
      }
    }
  } catch (const nlohmann::json::exception & e) {
    throw ConfigurationError("Malformed COCO dataset: " + std::string(e.what()));
  }

  return store;
}

AnnotationStore AnnotationStore::load_results(const std::vector<DetectionRecord> & records) const
{
  AnnotationStore results;
  for (const auto & image : images_) {
    results.add_image(image);
  }
  for (const auto & category : categories_) {
    results.add_category(category);
  }

  for (size_t i = 0; i < records.size(); ++i) {
    const auto & record = records[i];
    if (!has_image(record.image_id)) {
      throw std::invalid_argument(
        "Results do not correspond to current coco set: unknown image id " +
        std::to_string(record.image_id));
    }
    results.add_annotation(Annotation{
        static_cast<int64_t>(i + 1),
        record.image_id,
        record.category_id,
        record.bbox,
        record.bbox.width * record.bbox.height,
        false,
        record.score});
  }

  return results;
}

void AnnotationStore::add_image(const ImageInfo & image)
{
  image_index_[image.id] = images_.size();
  images_.push_back(image);
}

void AnnotationStore::add_category(const Category & category)
{
  categories_.push_back(category);
}

void AnnotationStore::add_annotation(const Annotation & annotation)
{
  image_to_annotations_[annotation.image_id].push_back(annotations_.size());
  annotations_.push_back(annotation);
}

std::vector<int64_t> AnnotationStore::get_cat_ids() const
{
  std::vector<int64_t> ids;
  ids.reserve(categories_.size());
  for (const auto & category : categories_) {
    ids.push_back(category.id);
  }
  return ids;
}

std::vector<int64_t> AnnotationStore::get_img_ids() const
{
  std::vector<int64_t> ids;
  ids.reserve(images_.size());
  for (const auto & image : images_) {
    ids.push_back(image.id);
  }
  return ids;
}

std::vector<Annotation> AnnotationStore::get_annotations(
  int64_t image_id, int64_t category_id) const
{
  std::vector<Annotation> result;
  auto it = image_to_annotations_.find(image_id);
  if (it == image_to_annotations_.end()) {
    return result;
  }
  for (size_t idx : it->second) {
    if (annotations_[idx].category_id == category_id) {
      result.push_back(annotations_[idx]);
    }
  }
  return result;
}

bool AnnotationStore::has_image(int64_t image_id) const
{
  return image_index_.count(image_id) > 0;
}

std::vector<DetectionRecord> load_detection_records(const std::string & result_file)
{
  const nlohmann::json results = read_json_file(result_file);
  if (!results.is_array()) {
    throw ConfigurationError("Result file must contain a list of detections: " + result_file);
  }

  std::vector<DetectionRecord> records;
  records.reserve(results.size());
  try {
    for (const auto & result : results) {
      records.push_back(DetectionRecord{
          result.at("image_id").get<int64_t>(),
          result.at("category_id").get<int64_t>(),
          parse_bbox(result.at("bbox")),
          result.at("score").get<double>()});
    }
  } catch (const nlohmann::json::exception & e) {
    throw ConfigurationError("Malformed result file " + result_file + ": " + std::string(e.what()));
  }
  return records;
}

} // namespace detection_eval
