// ============================================================================
// writer_pool.hpp -- Worker pool running page write tasks
//
// The WriterPool is the completion synchronizer of a dump run. The consumer
// hands it one task per page; tasks are queued without bound so submit()
// never waits for a write, and a fixed set of writer threads runs them in
// any order. wait() is called once, after the stream is exhausted: it lets
// the queue drain, joins every writer and returns one aggregate summary.
//
// Task outcomes are only ever recorded through atomics and a mutex-guarded
// list of failed paths, so concurrent writers never race on shared status.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace solrdump {

/// Performs one write and returns the number of bytes written. Throws on
/// failure.
using WriteFn = std::function<std::size_t()>;

struct WriteTask {
  std::string path;   // reported on failure
  WriteFn     fn;
};

struct WriterPoolConfig {
  unsigned writer_threads{0};   // 0 => use hardware_concurrency()
};

struct WriteSummary {
  uint64_t                 succeeded{0};
  uint64_t                 failed{0};
  std::vector<std::string> failed_paths;   // sorted

  bool ok() const noexcept { return failed == 0; }
};

// ============================================================================
// `WriterPool` class
// ============================================================================
class WriterPool {
public:
  explicit WriterPool(WriterPoolConfig cfg = {});
  ~WriterPool();

  WriterPool(const WriterPool&) = delete;
  WriterPool& operator=(const WriterPool&) = delete;

  /// Queue a task. Starts the writers on first use.
  /// @return False if wait() was already called.
  bool submit(WriteTask task);

  /// Block until every submitted task has finished.
  WriteSummary wait();

  struct Stats {
    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> succeeded{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> bytes{0};
  };
  const Stats& stats() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace solrdump
