#pragma once

// C++ standard library includes
#include <cstdint>
#include <string>
#include <vector>

// Local includes
#include "detection_eval/annotation_store.hpp"
#include "detection_eval/detection_types.hpp"


namespace test_utils
{

// Store with images 1..num_images and the given categories ("cat<id>")
inline detection_eval::AnnotationStore make_store(
  int num_images, const std::vector<int64_t> & category_ids)
{
  detection_eval::AnnotationStore store;
  for (int i = 1; i <= num_images; ++i) {
    store.add_image(detection_eval::ImageInfo{i, 640, 480, "image_" + std::to_string(i) + ".jpg"});
  }
  for (int64_t id : category_ids) {
    store.add_category(detection_eval::Category{id, "cat" + std::to_string(id), "thing"});
  }
  return store;
}

inline void add_ground_truth(
  detection_eval::AnnotationStore & store, int64_t id, int64_t image_id,
  int64_t category_id, const detection_eval::BoundingBox & box, bool iscrowd = false)
{
  store.add_annotation(detection_eval::Annotation{
      id, image_id, category_id, box, box.width * box.height, iscrowd, 0.0});
}

inline detection_eval::DetectionRecord make_record(
  int64_t image_id, int64_t category_id, const detection_eval::BoundingBox & box, double score)
{
  return detection_eval::DetectionRecord{image_id, category_id, box, score};
}

} // namespace test_utils
