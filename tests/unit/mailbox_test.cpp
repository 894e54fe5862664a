#include "internal/target/mailbox.hpp"

#include <assert.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

using dbtarget::target::FlushRequest;
using dbtarget::target::Mailbox;
using dbtarget::target::RowFamily;
using dbtarget::target::TargetMessage;
using dbtarget::target::WriteRow;

WriteRow Numbered(std::int64_t n) {
  WriteRow write{RowFamily::kMetrics, {}};
  write.row.Set("Seq", n);
  return write;
}

std::int64_t SeqOf(const TargetMessage& message) {
  const auto& write = std::get<WriteRow>(message);
  return std::get<std::int64_t>(*write.row.Find("Seq"));
}

void TestBatchesRespectLimitAndOrder() {
  Mailbox mailbox;
  for (std::int64_t i = 0; i < 5; ++i) assert(mailbox.Post(Numbered(i)));
  assert(mailbox.Depth() == 5);

  auto first = mailbox.TakeBatch(2);
  assert(first.size() == 2);
  assert(SeqOf(first[0]) == 0);
  assert(SeqOf(first[1]) == 1);

  auto rest = mailbox.TakeBatch(10);
  assert(rest.size() == 3);
  assert(SeqOf(rest[2]) == 4);
  assert(mailbox.Depth() == 0);

  // zero is treated as one
  assert(mailbox.Post(Numbered(9)));
  assert(mailbox.TakeBatch(0).size() == 1);
}

void TestSealRefusesNewMessagesButDrains() {
  Mailbox mailbox;
  assert(mailbox.Post(Numbered(1)));
  assert(mailbox.Post(FlushRequest{std::make_shared<std::promise<dbtarget::db::Result>>()}));
  mailbox.Seal();

  assert(!mailbox.Post(Numbered(2)));

  auto batch = mailbox.TakeBatch(8);
  assert(batch.size() == 2);
  assert(std::holds_alternative<FlushRequest>(batch[1]));

  assert(mailbox.TakeBatch(8).empty());
}

void TestTakeBlocksUntilPostOrSeal() {
  Mailbox           mailbox;
  std::atomic<bool> got{false};

  std::thread consumer([&] {
    auto batch = mailbox.TakeBatch(4);
    assert(batch.size() == 1);
    got = true;
    assert(mailbox.TakeBatch(4).empty());
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!got.load());

  assert(mailbox.Post(Numbered(1)));
  while (!got.load()) std::this_thread::yield();

  mailbox.Seal();
  consumer.join();
}

void TestManyProducersKeepPerProducerOrder() {
  constexpr int kProducers   = 4;
  constexpr int kPerProducer = 250;

  Mailbox                  mailbox;
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&mailbox, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        assert(mailbox.Post(Numbered(p * 1'000'000 + i)));
      }
    });
  }
  for (auto& t : producers) t.join();
  mailbox.Seal();

  std::vector<std::int64_t> last(kProducers, -1);
  std::size_t               total = 0;
  for (;;) {
    auto batch = mailbox.TakeBatch(64);
    if (batch.empty()) break;
    for (const auto& message : batch) {
      const auto seq      = SeqOf(message);
      const auto producer = static_cast<std::size_t>(seq / 1'000'000);
      assert(seq % 1'000'000 > last[producer] % 1'000'000 || last[producer] < 0);
      last[producer] = seq;
      ++total;
    }
  }
  assert(total == static_cast<std::size_t>(kProducers * kPerProducer));
}

} // namespace

int main() {
  TestBatchesRespectLimitAndOrder();
  TestSealRefusesNewMessagesButDrains();
  TestTakeBlocksUntilPostOrSeal();
  TestManyProducersKeepPerProducerOrder();

  std::cout << "dbtarget_unit_mailbox: pass\n";
  return 0;
}
