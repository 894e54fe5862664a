#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "internal/target/target_message.hpp"

namespace dbtarget::target {

/*
  Unbounded thread-safe FIFO feeding the single writer.

  Many producers Post(); exactly one consumer takes batches. Once Seal()ed
  the mailbox refuses new messages but still hands out what it holds.
*/
class Mailbox {
 public:
  // false when sealed; the message is not queued
  bool Post(TargetMessage message);

  // Blocks until at least one message is available or the mailbox is sealed
  // and drained (then returns empty). Returns at most max_batch messages.
  std::vector<TargetMessage> TakeBatch(std::size_t max_batch);

  void Seal();

  std::size_t Depth() const;

 private:
  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::deque<TargetMessage> queue_;
  bool                      sealed_ = false;
};

} // namespace dbtarget::target
