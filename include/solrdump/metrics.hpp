// ============================================================================
// metrics.hpp -- simple metrics for Solr cursor -> Consumer -> Writer runs
// ============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>

namespace solrdump {

// ============================================================================
// `DumpMetricsSnapshot` struct
// Snapshot of metrics at a point in time, with derived rates.
// ============================================================================
struct DumpMetricsSnapshot {
  double        elapsed_sec{0.0};

  // raw counters
  std::uint64_t pages_received{0};
  std::uint64_t docs_received{0};
  std::uint64_t stream_errors{0};

  std::uint64_t files_written{0};
  std::uint64_t bytes_written{0};
  std::uint64_t write_errors{0};

  // derived rates (per second)
  double pages_per_sec{0.0};
  double docs_per_sec{0.0};
  double write_mibps{0.0};   // bytes/sec / 1024^2
};

// ============================================================================
// `DumpMetrics` class
// Thread-safe: all increments are atomic.
// ============================================================================
class DumpMetrics {
public:
  DumpMetrics();

  void mark_page(std::uint64_t docs);
  void mark_stream_error(std::uint64_t n = 1);

  void mark_file_written(std::uint64_t n = 1);
  void mark_bytes_written(std::uint64_t bytes);
  void mark_write_error(std::uint64_t n = 1);

  DumpMetricsSnapshot snapshot() const;

  // Pretty-print snapshot to a FILE* (stdout by default).
  void print(std::FILE* out = stdout) const;

private:
  using clock = std::chrono::steady_clock;

  clock::time_point start_;

  std::atomic<std::uint64_t> pages_received_;
  std::atomic<std::uint64_t> docs_received_;
  std::atomic<std::uint64_t> stream_errors_;

  std::atomic<std::uint64_t> files_written_;
  std::atomic<std::uint64_t> bytes_written_;
  std::atomic<std::uint64_t> write_errors_;
};

} // namespace solrdump
