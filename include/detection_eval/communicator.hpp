#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

// Local includes
#include "detection_eval/distributed_merger.hpp"


namespace detection_eval
{

/**
 * @brief Collective exchange between evaluation participants
 * @details all_gather() is a barrier: it returns once every participant has
 *          contributed, with the contributions ordered by rank.
 */
class Communicator
{
public:
  virtual ~Communicator() = default;

  virtual int rank() const = 0;
  virtual int world_size() const = 0;

  virtual std::vector<PartialResult> all_gather(const PartialResult & local) = 0;

  // Release every participant blocked in all_gather() with GatherAborted
  virtual void abort() = 0;
};

// Single participant, the gather is the identity
class LocalCommunicator : public Communicator
{
public:
  int rank() const override { return 0; }
  int world_size() const override { return 1; }

  std::vector<PartialResult> all_gather(const PartialResult & local) override;
  void abort() override {}
};

/**
 * @brief Shared state of a group of worker threads taking part in a gather
 * @details The barrier is reusable, the group may gather any number of times.
 */
class ThreadGroup
{
public:
  explicit ThreadGroup(int world_size);

  ThreadGroup(const ThreadGroup &) = delete;
  ThreadGroup & operator=(const ThreadGroup &) = delete;

  int world_size() const { return world_size_; }

  /**
   * @brief Contribute and wait for the other participants
   * @throws GatherAborted if the group is or gets aborted before the round completes
   */
  std::vector<PartialResult> all_gather(int rank, const PartialResult & local);

  // Fail the pending round and every later one
  void abort();

  bool aborted() const;

private:
  const int world_size_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<PartialResult> slots_;
  std::vector<PartialResult> gathered_;
  int arrived_;
  uint64_t generation_;
  bool aborted_;
};

// One worker thread's view of a ThreadGroup
class ThreadGroupCommunicator : public Communicator
{
public:
  ThreadGroupCommunicator(std::shared_ptr<ThreadGroup> group, int rank);

  int rank() const override { return rank_; }
  int world_size() const override { return group_->world_size(); }

  std::vector<PartialResult> all_gather(const PartialResult & local) override;
  void abort() override { group_->abort(); }

private:
  std::shared_ptr<ThreadGroup> group_;
  const int rank_;
};

// Gather through the communicator, then merge
MergedEvaluation gather_and_merge(Communicator & communicator, const PartialResult & local);

} // namespace detection_eval
