#include "asynckit/stream/stream.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

typedef asynckit::stream::Stream<int> IntStream;

std::vector<int> Range(int begin, int end) {
  std::vector<int> out;
  for (int i = begin; i < end; ++i) out.push_back(i);
  return out;
}

// Never ends on its own; counts how many items were produced.
IntStream Endless(std::atomic<int>* produced, std::size_t capacity) {
  asynckit::stream::StreamOptions opt;
  opt.buffer_capacity = capacity;
  return IntStream::FromGenerator(
      [produced](int* out) -> asynckit::api::Status {
        *out = produced->fetch_add(1);
        return asynckit::api::Status::Ok();
      },
      opt);
}

bool SameGroups(const std::vector<std::vector<int> >& got,
                const std::vector<std::vector<int> >& want) {
  if (got.size() != want.size()) return false;
  for (std::size_t i = 0; i < got.size(); ++i) {
    if (got[i] != want[i]) return false;
  }
  return true;
}

}  // namespace

bool TestMapFilterMatchesSequential() {
  const std::vector<int> source = Range(0, 1000);
  std::vector<std::string> expected;
  for (std::size_t i = 0; i < source.size(); ++i) {
    const int mapped = source[i] * 3;
    if (mapped % 2 == 0) expected.push_back(std::to_string(mapped));
  }

  asynckit::stream::StreamOptions opt;
  opt.buffer_capacity = 4;
  asynckit::api::Result<std::vector<std::string> > got =
      IntStream::FromVector(source, opt)
          .Map([](int x) { return x * 3; })
          .Filter([](const int& x) { return x % 2 == 0; })
          .Map([](int x) { return std::to_string(x); })
          .Collect();
  return got.ok() && got.value() == expected;
}

bool TestEmptySource() {
  asynckit::api::Result<std::vector<int> > got =
      IntStream::FromVector(std::vector<int>()).Map([](int x) { return x + 1; }).Collect();
  return got.ok() && got.value().empty();
}

bool TestBatchKeepsPartialTail() {
  asynckit::api::Result<std::vector<std::vector<int> > > got =
      IntStream::FromVector(Range(1, 8)).Batch(3).Collect();
  std::vector<std::vector<int> > want;
  want.push_back(Range(1, 4));
  want.push_back(Range(4, 7));
  want.push_back(Range(7, 8));
  return got.ok() && SameGroups(got.value(), want);
}

bool TestWindowSlides() {
  asynckit::api::Result<std::vector<std::vector<int> > > got =
      IntStream::FromVector(Range(1, 6)).Window(3).Collect();
  std::vector<std::vector<int> > want;
  want.push_back(Range(1, 4));
  want.push_back(Range(2, 5));
  want.push_back(Range(3, 6));
  if (!got.ok() || !SameGroups(got.value(), want)) return false;

  got = IntStream::FromVector(Range(1, 7)).Window(3, 2).Collect();
  want.clear();
  want.push_back(Range(1, 4));
  want.push_back(Range(3, 6));
  if (!got.ok() || !SameGroups(got.value(), want)) return false;

  // Too few items for one window.
  got = IntStream::FromVector(Range(1, 3)).Window(3).Collect();
  return got.ok() && got.value().empty();
}

bool TestReduceAndCount() {
  asynckit::api::Result<long long> sum = IntStream::FromVector(Range(1, 101))
                                             .Reduce(0LL, [](long long acc, const int& x) {
                                               return acc + x;
                                             });
  if (!sum.ok() || sum.value() != 5050) return false;
  asynckit::api::Result<std::size_t> count =
      IntStream::FromVector(Range(0, 50)).Filter([](const int& x) { return x % 5 == 0; }).Count();
  return count.ok() && count.value() == 10;
}

bool TestNextPullsInOrder() {
  IntStream s = IntStream::FromVector(Range(10, 13));
  int value = 0;
  for (int want = 10; want < 13; ++want) {
    if (!s.Next(&value).ok() || value != want) return false;
  }
  const asynckit::api::Status end = s.Next(&value);
  return asynckit::stream::IsEndOfStream(end) && asynckit::stream::IsEndOfStream(s.Next(&value));
}

bool TestBackpressureBoundsProducer() {
  std::atomic<int> produced(0);
  IntStream s = Endless(&produced, 2);
  int value = 0;
  if (!s.Next(&value).ok() || value != 0) return false;
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  // One handed out, two buffered, one blocked in Push.
  const int ahead = produced.load();
  s.Cancel();
  return ahead <= 4;
}

bool TestBackpressureThroughStages() {
  std::atomic<int> produced(0);
  IntStream s = Endless(&produced, 2).Map([](int x) { return x; }).Filter([](const int&) {
    return true;
  });
  int value = 0;
  if (!s.Next(&value).ok()) return false;
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  const int ahead = produced.load();
  s.Cancel();
  return ahead <= 12;
}

bool TestCancelUnblocksConsumer() {
  std::atomic<int> produced(0);
  IntStream s = Endless(&produced, 4).Filter([](const int&) -> bool {
    // Drops everything so the consumer blocks.
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return false;
  });
  std::thread canceller([&s]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    s.Cancel();
  });
  int value = 0;
  const asynckit::api::Status st = s.Next(&value);
  canceller.join();
  return st.code() == asynckit::api::StatusCode::kCancelled;
}

bool TestCancelRacesCollect() {
  IntStream s;
  std::atomic<bool> done(false);
  std::thread canceller([&s, &done]() {
    while (!done.load()) {
      s.Cancel();
      std::this_thread::yield();
    }
  });
  bool ok = true;
  for (int round = 0; round < 200 && ok; ++round) {
    s = IntStream::FromVector(Range(0, 8)).Map([](int x) -> int { return x + 1; });
    asynckit::api::Result<std::vector<int> > items = s.Collect();
    if (items.ok()) {
      ok = items.value().size() == 8 && items.value().back() == 8;
    } else {
      ok = items.status().code() == asynckit::api::StatusCode::kCancelled;
    }
    if (!s.consumed()) ok = false;
  }
  done.store(true);
  canceller.join();
  return ok;
}

bool TestStageErrorEndsStream() {
  IntStream s = IntStream::FromVector(Range(0, 10)).Map([](int x) -> int {
    if (x == 3) throw std::runtime_error("bad record");
    return x * 10;
  });
  int value = 0;
  for (int want = 0; want < 3; ++want) {
    if (!s.Next(&value).ok() || value != want * 10) return false;
  }
  const asynckit::api::Status st = s.Next(&value);
  if (st.code() != asynckit::api::StatusCode::kInternalError) return false;
  if (st.hex_code() != 0x80500001u) return false;
  if (st.message().find("bad record") == std::string::npos) return false;

  asynckit::api::Result<std::vector<int> > collected =
      IntStream::FromVector(Range(0, 10)).Map([](int x) -> int {
        if (x == 7) throw std::runtime_error("late failure");
        return x;
      }).Collect();
  return collected.status().code() == asynckit::api::StatusCode::kInternalError;
}

bool TestSourceErrorPropagates() {
  std::shared_ptr<int> next = std::make_shared<int>(0);
  asynckit::api::Result<std::vector<int> > got =
      IntStream::FromGenerator([next](int* out) -> asynckit::api::Status {
        if (*next == 2) {
          return asynckit::api::Status(asynckit::api::StatusCode::kIoError, "disk gone");
        }
        *out = (*next)++;
        return asynckit::api::Status::Ok();
      }).Map([](int x) { return x + 1; }).Collect();
  return got.status().code() == asynckit::api::StatusCode::kIoError &&
         got.status().message() == "disk gone";
}

bool TestFromChannel() {
  std::shared_ptr<asynckit::concurrent::BoundedChannel<int> > channel =
      std::make_shared<asynckit::concurrent::BoundedChannel<int> >(2);
  std::thread producer([channel]() {
    for (int i = 0; i < 20; ++i) {
      if (!channel->Push(i).ok()) return;
    }
    channel->Close();
  });
  asynckit::api::Result<std::size_t> count =
      IntStream::FromChannel(channel).Map([](int x) { return x * 2; }).Count();
  producer.join();
  return count.ok() && count.value() == 20;
}

bool TestConsumedStream() {
  IntStream source = IntStream::FromVector(Range(0, 5));
  IntStream doubled = source.Map([](int x) { return x * 2; });
  if (!source.consumed() || doubled.consumed()) return false;

  const asynckit::api::Status reused = source.Collect().status();
  if (reused.code() != asynckit::api::StatusCode::kInvalidArgument) return false;
  if (reused.hex_code() != asynckit::stream::StreamConsumedStatus().hex_code()) return false;
  // Composing a consumed stream yields a stream that reports the same error.
  if (source.Filter([](const int&) { return true; }).Collect().status().hex_code() !=
      reused.hex_code()) {
    return false;
  }

  asynckit::api::Result<std::vector<int> > first = doubled.Collect();
  if (!first.ok() || first.value().size() != 5) return false;
  return doubled.consumed() && !doubled.Collect().ok();
}

bool TestDestroyWhileRunning() {
  std::atomic<int> produced(0);
  {
    IntStream s = Endless(&produced, 8).Map([](int x) { return x + 1; });
    int value = 0;
    if (!s.Next(&value).ok() || value != 1) return false;
  }
  // Every stage thread was joined, so the producer is stopped for good.
  const int after = produced.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  return produced.load() == after;
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"map_filter_matches_sequential", TestMapFilterMatchesSequential},
      {"empty_source", TestEmptySource},
      {"batch_keeps_partial_tail", TestBatchKeepsPartialTail},
      {"window_slides", TestWindowSlides},
      {"reduce_and_count", TestReduceAndCount},
      {"next_pulls_in_order", TestNextPullsInOrder},
      {"backpressure_bounds_producer", TestBackpressureBoundsProducer},
      {"backpressure_through_stages", TestBackpressureThroughStages},
      {"cancel_unblocks_consumer", TestCancelUnblocksConsumer},
      {"cancel_races_collect", TestCancelRacesCollect},
      {"stage_error_ends_stream", TestStageErrorEndsStream},
      {"source_error_propagates", TestSourceErrorPropagates},
      {"from_channel", TestFromChannel},
      {"consumed_stream", TestConsumedStream},
      {"destroy_while_running", TestDestroyWhileRunning},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
