#include <algorithm>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Local includes
#include "detection_eval/annotation_store.hpp"
#include "detection_eval/coco_evaluator.hpp"
#include "detection_eval/communicator.hpp"
#include "detection_eval/exception.hpp"


namespace
{

constexpr size_t kBatchSize = 16;

// Class names ordered like the evaluator's category axis (ascending ids)
std::vector<std::string> sorted_class_names(const detection_eval::AnnotationStore & store)
{
  std::map<int64_t, std::string> names;
  for (const auto & category : store.categories()) {
    names.emplace(category.id, category.name);
  }
  std::vector<std::string> class_names;
  for (const auto & name : names) {
    class_names.push_back(name.second);
  }
  return class_names;
}

// Feed this worker's share of the images batch by batch
void run_worker(
  detection_eval::COCOEvaluator & evaluator,
  const std::vector<int64_t> & image_ids,
  const std::map<int64_t, std::vector<detection_eval::DetectionRecord>> & records_per_image,
  int rank, int world_size)
{
  std::vector<int64_t> batch_ids;
  std::vector<detection_eval::DetectionRecord> batch_records;

  for (size_t i = static_cast<size_t>(rank); i < image_ids.size(); i += world_size) {
    batch_ids.push_back(image_ids[i]);
    auto it = records_per_image.find(image_ids[i]);
    if (it != records_per_image.end()) {
      batch_records.insert(batch_records.end(), it->second.begin(), it->second.end());
    }
    if (batch_ids.size() == kBatchSize) {
      evaluator.update(batch_records, batch_ids);
      batch_ids.clear();
      batch_records.clear();
    }
  }
  if (!batch_ids.empty()) {
    evaluator.update(batch_records, batch_ids);
  }
}

} // namespace


int main(int argc, char* argv[])
{
  // Parse command line arguments
  if (argc < 3 || argc > 4) {
    std::cerr << "Usage: " << argv[0] << " <annotation_json> <results_json> [num_workers]" << std::endl;
    return -1;
  }

  const std::string annotation_path = argv[1];
  const std::string results_path = argv[2];

  try {
    const int num_workers = argc == 4 ? std::stoi(argv[3]) : 1;
    if (num_workers <= 0) {
      std::cerr << "Error: num_workers must be positive" << std::endl;
      return -1;
    }

    // Load ground truth and results
    detection_eval::AnnotationStore ground_truth(annotation_path);
    const auto records = detection_eval::load_detection_records(results_path);

    std::map<int64_t, std::vector<detection_eval::DetectionRecord>> records_per_image;
    for (const auto & record : records) {
      records_per_image[record.image_id].push_back(record);
    }

    std::vector<int64_t> image_ids = ground_truth.get_img_ids();
    std::sort(image_ids.begin(), image_ids.end());
    const std::vector<std::string> class_names = sorted_class_names(ground_truth);

    std::cout << "Evaluating " << records.size() << " detections on " << image_ids.size()
      << " images with " << num_workers << " worker(s)" << std::endl;

    auto group = std::make_shared<detection_eval::ThreadGroup>(num_workers);

    // One evaluator per worker, each sees the merged result after compute()
    std::vector<std::unique_ptr<detection_eval::COCOEvaluator>> evaluators;
    for (int rank = 0; rank < num_workers; ++rank) {
      detection_eval::COCOEvaluator::Config config;
      config.log_level = rank == 0 ?
        detection_eval::Logger::Severity::kVERBOSE : detection_eval::Logger::Severity::kERROR;
      evaluators.push_back(std::make_unique<detection_eval::COCOEvaluator>(
        ground_truth, config,
        std::make_shared<detection_eval::ThreadGroupCommunicator>(group, rank)));
    }

    std::vector<detection_eval::SummaryMetrics> results(num_workers);
    // First failure, later GatherAborted errors of the released workers are not kept
    std::mutex error_mutex;
    std::exception_ptr first_error;
    std::vector<std::thread> workers;
    for (int rank = 0; rank < num_workers; ++rank) {
      workers.emplace_back([&, rank]() {
          try {
            run_worker(*evaluators[rank], image_ids, records_per_image, rank, num_workers);
            results[rank] = evaluators[rank]->compute(class_names);
          } catch (const std::exception & e) {
            std::cerr << "Worker " << rank << " failed: " << e.what() << std::endl;
            {
              std::lock_guard<std::mutex> lock(error_mutex);
              if (!first_error) {
                first_error = std::current_exception();
              }
            }
            // Release the workers waiting for this one in the gather
            group->abort();
          }
        });
    }
    for (auto & worker : workers) {
      worker.join();
    }
    if (first_error) {
      std::rethrow_exception(first_error);
    }

    const auto & summary = results.front();
    std::cout << "\n=== Evaluation Results ===" << std::endl;
    std::cout << summary.table << std::endl;
    if (!summary.per_category_table.empty()) {
      std::cout << "\n=== Per-category AP ===" << std::endl;
      std::cout << summary.per_category_table << std::endl;
    }

  } catch (const detection_eval::ConfigurationError & e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return -1;
  } catch (const std::exception & e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return -1;
  }

  return 0;
}
