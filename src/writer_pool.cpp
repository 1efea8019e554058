// ============================================================================
// writer_pool.cpp -- implementation of the WriterPool class
// ============================================================================
#include "solrdump/writer_pool.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <mutex>
#include <thread>

#include "solrdump/channel.hpp"

namespace solrdump {

// ============================================================================
// `Impl` class
// ============================================================================
struct WriterPool::Impl {
  explicit Impl(WriterPoolConfig cfg_) : cfg(cfg_) {}

  WriterPoolConfig         cfg;
  Channel<WriteTask>       queue;      // unbounded
  std::vector<std::thread> workers;
  std::once_flag           started;
  std::atomic<bool>        closed{false};

  std::mutex               failed_mtx;
  std::vector<std::string> failed_paths;

  Stats                    stats_;

  void start() {
    unsigned n = cfg.writer_threads;
    if (n == 0) {
      n = std::max(1u, std::thread::hardware_concurrency());
    }
    workers.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
      workers.emplace_back([this]{ worker_loop(); });
    }
  }

  void record_failure(const std::string& path, const char* what) {
    std::fprintf(stderr, "WRITER: %s\n", what);
    stats_.failed.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(failed_mtx);
    failed_paths.push_back(path);
  }

  /// Run tasks until the queue is closed and empty
  void worker_loop() {
    WriteTask task;
    while (queue.pop(task)) {
      try {
        const std::size_t n = task.fn();
        stats_.bytes.fetch_add(n, std::memory_order_relaxed);
        stats_.succeeded.fetch_add(1, std::memory_order_relaxed);
      } catch (const std::exception& e) {
        record_failure(task.path, e.what());
      }
      task = WriteTask{};
    }
  }

  void join() {
    queue.close();
    for (auto& t : workers) {
      if (t.joinable()) t.join();
    }
    workers.clear();
  }
};

// ============================================================================
// `WriterPool` class
// ============================================================================
WriterPool::WriterPool(WriterPoolConfig cfg)
: impl_(std::make_unique<Impl>(cfg)) {}

WriterPool::~WriterPool() { impl_->join(); }

bool WriterPool::submit(WriteTask task) {
  if (impl_->closed.load(std::memory_order_acquire)) return false;
  std::call_once(impl_->started, [this]{ impl_->start(); });
  if (!impl_->queue.push(std::move(task))) return false;
  impl_->stats_.submitted.fetch_add(1, std::memory_order_relaxed);
  return true;
}

WriteSummary WriterPool::wait() {
  impl_->closed.store(true, std::memory_order_release);
  impl_->join();

  WriteSummary s;
  s.succeeded = impl_->stats_.succeeded.load();
  s.failed    = impl_->stats_.failed.load();
  {
    std::lock_guard<std::mutex> lk(impl_->failed_mtx);
    s.failed_paths = impl_->failed_paths;
  }
  std::sort(s.failed_paths.begin(), s.failed_paths.end());
  return s;
}

const WriterPool::Stats& WriterPool::stats() const noexcept {
  return impl_->stats_;
}

} // namespace solrdump
