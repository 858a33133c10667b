#include <stdexcept>
#include <string>
#include <utility>

// Local includes
#include "detection_eval/communicator.hpp"
#include "detection_eval/exception.hpp"


namespace detection_eval
{

std::vector<PartialResult> LocalCommunicator::all_gather(const PartialResult & local)
{
  return {local};
}

ThreadGroup::ThreadGroup(int world_size)
: world_size_(world_size), arrived_(0), generation_(0), aborted_(false)
{
  if (world_size_ <= 0) {
    throw std::invalid_argument("ThreadGroup needs at least one participant, got " +
      std::to_string(world_size_));
  }
  slots_.resize(world_size_);
}

std::vector<PartialResult> ThreadGroup::all_gather(int rank, const PartialResult & local)
{
  if (rank < 0 || rank >= world_size_) {
    throw std::out_of_range("Rank " + std::to_string(rank) + " outside group of size " +
      std::to_string(world_size_));
  }

  std::unique_lock<std::mutex> lock(mutex_);
  if (aborted_) {
    throw GatherAborted("Gather of rank " + std::to_string(rank) + " on an aborted group");
  }
  slots_[rank] = local;
  const uint64_t generation = generation_;

  if (++arrived_ == world_size_) {
    // Last participant publishes the round and releases the others
    gathered_ = std::move(slots_);
    slots_.assign(world_size_, PartialResult());
    arrived_ = 0;
    ++generation_;
    cv_.notify_all();
  } else {
    cv_.wait(lock, [this, generation] {return generation_ != generation || aborted_;});
    if (generation_ == generation) {
      throw GatherAborted("Gather aborted while rank " + std::to_string(rank) +
        " waited for " + std::to_string(world_size_ - arrived_) + " participant(s)");
    }
  }

  // Nobody can start the next round before every participant copied this one
  return gathered_;
}

void ThreadGroup::abort()
{
  std::lock_guard<std::mutex> lock(mutex_);
  aborted_ = true;
  cv_.notify_all();
}

bool ThreadGroup::aborted() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return aborted_;
}

ThreadGroupCommunicator::ThreadGroupCommunicator(std::shared_ptr<ThreadGroup> group, int rank)
: group_(std::move(group)), rank_(rank)
{
  if (!group_) {
    throw std::invalid_argument("ThreadGroupCommunicator requires a group");
  }
  if (rank_ < 0 || rank_ >= group_->world_size()) {
    throw std::out_of_range("Rank " + std::to_string(rank_) + " outside group of size " +
      std::to_string(group_->world_size()));
  }
}

std::vector<PartialResult> ThreadGroupCommunicator::all_gather(const PartialResult & local)
{
  return group_->all_gather(rank_, local);
}

MergedEvaluation gather_and_merge(Communicator & communicator, const PartialResult & local)
{
  return merge(communicator.all_gather(local));
}

} // namespace detection_eval
