// ============================================================================
// metrics.cpp -- implementation of DumpMetrics
//
// DumpMetrics tracks the following counters for a dump run:
//
// pages_received_ : Pages pulled from the result stream (one file each).
// docs_received_  : Documents contained in those pages.
// stream_errors_  : Error results pulled from the stream.
// files_written_  : Page files written successfully.
// bytes_written_  : Total bytes written to page files.
// write_errors_   : Page files that could not be encoded or written.
// ============================================================================
#include "solrdump/metrics.hpp"

namespace solrdump {

DumpMetrics::DumpMetrics()
  : start_(clock::now()),
    pages_received_(0),
    docs_received_(0),
    stream_errors_(0),
    files_written_(0),
    bytes_written_(0),
    write_errors_(0)
{}

void DumpMetrics::mark_page(std::uint64_t docs) {
  pages_received_.fetch_add(1, std::memory_order_relaxed);
  docs_received_.fetch_add(docs, std::memory_order_relaxed);
}
void DumpMetrics::mark_stream_error(std::uint64_t n) {
  stream_errors_.fetch_add(n, std::memory_order_relaxed);
}

void DumpMetrics::mark_file_written(std::uint64_t n) {
  files_written_.fetch_add(n, std::memory_order_relaxed);
}
void DumpMetrics::mark_bytes_written(std::uint64_t bytes) {
  bytes_written_.fetch_add(bytes, std::memory_order_relaxed);
}
void DumpMetrics::mark_write_error(std::uint64_t n) {
  write_errors_.fetch_add(n, std::memory_order_relaxed);
}

DumpMetricsSnapshot DumpMetrics::snapshot() const {
  DumpMetricsSnapshot s{};

  s.elapsed_sec = std::chrono::duration<double>(clock::now() - start_).count();
  if (s.elapsed_sec <= 0.0) s.elapsed_sec = 1e-9; // avoid div-by-zero

  s.pages_received = pages_received_.load(std::memory_order_relaxed);
  s.docs_received  = docs_received_.load(std::memory_order_relaxed);
  s.stream_errors  = stream_errors_.load(std::memory_order_relaxed);

  s.files_written  = files_written_.load(std::memory_order_relaxed);
  s.bytes_written  = bytes_written_.load(std::memory_order_relaxed);
  s.write_errors   = write_errors_.load(std::memory_order_relaxed);

  const double dt = s.elapsed_sec;
  s.pages_per_sec = s.pages_received / dt;
  s.docs_per_sec  = s.docs_received / dt;
  s.write_mibps   = (s.bytes_written / dt) / (1024.0 * 1024.0);

  return s;
}

void DumpMetrics::print(std::FILE* out) const {
  DumpMetricsSnapshot s = snapshot();

  std::fprintf(out,
    "\n=== Dump Stats ===\n"
    "STREAM: pages=%llu  docs=%llu  errors=%llu\n"
    "WRITER: files=%llu  bytes=%llu  errors=%llu\n"
    "\n=== Throughput ===\n"
    "Elapsed: %.3f s\n"
    "STREAM:  %.1f pages/s | %.1f docs/s\n"
    "WRITER:  %.3f MiB/s\n",
    (unsigned long long)s.pages_received,
    (unsigned long long)s.docs_received,
    (unsigned long long)s.stream_errors,
    (unsigned long long)s.files_written,
    (unsigned long long)s.bytes_written,
    (unsigned long long)s.write_errors,
    s.elapsed_sec,
    s.pages_per_sec,
    s.docs_per_sec,
    s.write_mibps
  );
}

} // namespace solrdump
