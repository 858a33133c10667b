// C++ standard library includes
#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

// Google Test includes
#include <gtest/gtest.h>

// Local includes
#include "detection_eval/communicator.hpp"
#include "detection_eval/distributed_merger.hpp"
#include "detection_eval/exception.hpp"

using detection_eval::EvaluationTensor;
using detection_eval::MergedEvaluation;
using detection_eval::PartialResult;


namespace
{

// Partial result over 2 categories and 4 area ranges; every cell carries the
// image id and the contributing process as a detection id
PartialResult make_part(const std::vector<int64_t> & image_ids, int64_t process)
{
  PartialResult part;
  part.image_ids = image_ids;
  part.tensor = EvaluationTensor(2, 4, image_ids.size());
  for (size_t c = 0; c < 2; ++c) {
    for (size_t a = 0; a < 4; ++a) {
      for (size_t i = 0; i < image_ids.size(); ++i) {
        auto & record = part.tensor.at(c, a, i);
        record.image_id = image_ids[i];
        record.category_id = static_cast<int64_t>(c) + 1;
        record.area_range_index = a;
        record.detection_ids = {process};
      }
    }
  }
  return part;
}

int64_t contributor(const MergedEvaluation & merged, size_t image)
{
  return merged.tensor.at(0, 0, image).detection_ids.front();
}

} // namespace


TEST(DistributedMergerTest, SortsImageAxis)
{
  const auto merged = detection_eval::merge({make_part({5, 1}, 0), make_part({4, 2, 3}, 1)});

  ASSERT_EQ(merged.image_ids, (std::vector<int64_t>{1, 2, 3, 4, 5}));
  ASSERT_EQ(merged.tensor.num_images(), 5u);
  for (size_t c = 0; c < 2; ++c) {
    for (size_t a = 0; a < 4; ++a) {
      for (size_t i = 0; i < merged.image_ids.size(); ++i) {
        EXPECT_EQ(merged.tensor.at(c, a, i).image_id, merged.image_ids[i]);
      }
    }
  }
}

TEST(DistributedMergerTest, InvariantToProcessOrder)
{
  const auto a = make_part({3, 9}, 0);
  const auto b = make_part({1, 7}, 0);
  const auto c = make_part({4}, 0);

  const auto reference = detection_eval::merge({a, b, c});
  EXPECT_EQ(detection_eval::merge({c, a, b}).tensor, reference.tensor);
  EXPECT_EQ(detection_eval::merge({b, c, a}).image_ids, reference.image_ids);
}

TEST(DistributedMergerTest, FirstOccurrenceWins)
{
  const auto merged = detection_eval::merge({make_part({10, 42}, 0), make_part({42, 11}, 1)});

  ASSERT_EQ(merged.image_ids, (std::vector<int64_t>{10, 11, 42}));
  EXPECT_EQ(contributor(merged, 2), 0);
  EXPECT_EQ(contributor(merged, 1), 1);

  const auto swapped = detection_eval::merge({make_part({42, 11}, 1), make_part({10, 42}, 0)});
  EXPECT_EQ(contributor(swapped, 2), 1);
}

TEST(DistributedMergerTest, DeduplicatesWithinOneProcess)
{
  auto part = make_part({8, 8, 2}, 0);
  part.tensor.at(0, 0, 1).detection_ids = {99};

  const auto merged = detection_eval::merge({part});
  ASSERT_EQ(merged.image_ids, (std::vector<int64_t>{2, 8}));
  EXPECT_EQ(contributor(merged, 1), 0);
}

TEST(DistributedMergerTest, EmptyContributions)
{
  const auto none = detection_eval::merge({});
  EXPECT_TRUE(none.image_ids.empty());
  EXPECT_EQ(none.tensor.num_images(), 0u);

  // A process that saw no images still contributes its layout
  const auto merged = detection_eval::merge({make_part({}, 0), make_part({6}, 1)});
  ASSERT_EQ(merged.image_ids, (std::vector<int64_t>{6}));
  EXPECT_EQ(merged.tensor.num_categories(), 2u);
  EXPECT_EQ(merged.tensor.num_area_ranges(), 4u);
  EXPECT_EQ(contributor(merged, 0), 1);
}

TEST(DistributedMergerTest, RejectsLayoutMismatch)
{
  PartialResult other;
  other.image_ids = {3};
  other.tensor = EvaluationTensor(3, 4, 1);

  EXPECT_THROW(
    detection_eval::merge({make_part({1}, 0), other}),
    detection_eval::ConfigurationError);
}

TEST(DistributedMergerTest, RejectsImageCountMismatch)
{
  auto part = make_part({1, 2}, 0);
  part.image_ids.push_back(3);

  EXPECT_THROW(detection_eval::merge({part}), detection_eval::ConfigurationError);
}

TEST(CommunicatorTest, LocalGatherIsIdentity)
{
  detection_eval::LocalCommunicator communicator;
  EXPECT_EQ(communicator.rank(), 0);
  EXPECT_EQ(communicator.world_size(), 1);

  const auto part = make_part({4, 1}, 0);
  const auto gathered = communicator.all_gather(part);
  ASSERT_EQ(gathered.size(), 1u);
  EXPECT_EQ(gathered[0].image_ids, part.image_ids);
  EXPECT_EQ(gathered[0].tensor, part.tensor);

  const auto merged = detection_eval::gather_and_merge(communicator, part);
  EXPECT_EQ(merged.image_ids, (std::vector<int64_t>{1, 4}));
}

TEST(CommunicatorTest, ThreadGroupGathersInRankOrder)
{
  constexpr int world_size = 3;
  constexpr int rounds = 2;
  auto group = std::make_shared<detection_eval::ThreadGroup>(world_size);

  std::vector<std::vector<std::vector<PartialResult>>> gathered(
    world_size, std::vector<std::vector<PartialResult>>(rounds));
  std::vector<std::exception_ptr> errors(world_size);
  std::vector<std::thread> workers;

  for (int rank = 0; rank < world_size; ++rank) {
    workers.emplace_back([&, rank]() {
        try {
          detection_eval::ThreadGroupCommunicator communicator(group, rank);
          for (int round = 0; round < rounds; ++round) {
            const int64_t image_id = 100 * round + rank;
            gathered[rank][round] = communicator.all_gather(make_part({image_id}, rank));
          }
        } catch (...) {
          errors[rank] = std::current_exception();
          group->abort();
        }
      });
  }
  for (auto & worker : workers) {
    worker.join();
  }

  for (int rank = 0; rank < world_size; ++rank) {
    if (errors[rank]) {
      std::rethrow_exception(errors[rank]);
    }
    for (int round = 0; round < rounds; ++round) {
      const auto & parts = gathered[rank][round];
      ASSERT_EQ(parts.size(), static_cast<size_t>(world_size));
      for (int r = 0; r < world_size; ++r) {
        EXPECT_EQ(parts[r].image_ids, (std::vector<int64_t>{100 * round + r}));
      }
    }
  }
}

TEST(CommunicatorTest, ThreadGroupMergeAgreesAcrossRanks)
{
  constexpr int world_size = 2;
  auto group = std::make_shared<detection_eval::ThreadGroup>(world_size);
  std::vector<MergedEvaluation> merged(world_size);

  std::thread other([&]() {
      detection_eval::ThreadGroupCommunicator communicator(group, 1);
      merged[1] = detection_eval::gather_and_merge(communicator, make_part({2, 3}, 1));
    });
  detection_eval::ThreadGroupCommunicator communicator(group, 0);
  merged[0] = detection_eval::gather_and_merge(communicator, make_part({3, 1}, 0));
  other.join();

  EXPECT_EQ(merged[0].image_ids, (std::vector<int64_t>{1, 2, 3}));
  EXPECT_EQ(merged[0].tensor, merged[1].tensor);
  EXPECT_EQ(contributor(merged[0], 2), 0);
}

TEST(CommunicatorTest, AbortReleasesWaitingRanks)
{
  auto group = std::make_shared<detection_eval::ThreadGroup>(3);
  std::vector<std::exception_ptr> errors(2);
  std::vector<std::thread> waiters;

  for (int rank = 0; rank < 2; ++rank) {
    waiters.emplace_back([&, rank]() {
        try {
          detection_eval::ThreadGroupCommunicator communicator(group, rank);
          communicator.all_gather(make_part({rank}, rank));
        } catch (...) {
          errors[rank] = std::current_exception();
        }
      });
  }

  // Rank 2 fails before reaching the gather
  detection_eval::ThreadGroupCommunicator failed(group, 2);
  failed.abort();
  for (auto & waiter : waiters) {
    waiter.join();
  }

  EXPECT_TRUE(group->aborted());
  for (const auto & error : errors) {
    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), detection_eval::GatherAborted);
  }
  EXPECT_THROW(failed.all_gather(make_part({2}, 2)), detection_eval::GatherAborted);
}

TEST(CommunicatorTest, AbortAfterCompletedRound)
{
  auto group = std::make_shared<detection_eval::ThreadGroup>(1);
  detection_eval::ThreadGroupCommunicator communicator(group, 0);
  EXPECT_EQ(communicator.all_gather(make_part({5}, 0)).size(), 1u);

  communicator.abort();
  EXPECT_THROW(communicator.all_gather(make_part({5}, 0)), detection_eval::GatherAborted);

  // Aborting a local gather has nothing to release
  detection_eval::LocalCommunicator local;
  local.abort();
  EXPECT_EQ(local.all_gather(make_part({5}, 0)).size(), 1u);
}

TEST(CommunicatorTest, RejectsInvalidRank)
{
  EXPECT_THROW(detection_eval::ThreadGroup(0), std::invalid_argument);

  auto group = std::make_shared<detection_eval::ThreadGroup>(2);
  EXPECT_THROW(detection_eval::ThreadGroupCommunicator(group, 2), std::out_of_range);
  EXPECT_THROW(detection_eval::ThreadGroupCommunicator(nullptr, 0), std::invalid_argument);
}
