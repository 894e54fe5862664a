#include "mailbox.hpp"

namespace dbtarget::target {

bool Mailbox::Post(TargetMessage message) {
  {
    std::lock_guard lock(mutex_);
    if (sealed_) return false;
    queue_.push_back(std::move(message));
  }
  cv_.notify_one();
  return true;
}

std::vector<TargetMessage> Mailbox::TakeBatch(std::size_t max_batch) {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return sealed_ || !queue_.empty(); });

  std::vector<TargetMessage> batch;
  if (max_batch == 0) max_batch = 1;

  while (!queue_.empty() && batch.size() < max_batch) {
    batch.push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  return batch;
}

void Mailbox::Seal() {
  {
    std::lock_guard lock(mutex_);
    sealed_ = true;
  }
  cv_.notify_all();
}

std::size_t Mailbox::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace dbtarget::target
