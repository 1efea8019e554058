// ============================================================================
// consumer.hpp -- Result stream consumer
//
// The Consumer drains a ResultStream on the calling thread and turns every
// Page into a page file inside the dump directory:
//
//   Draining  : pull the next result.
//               Page  -> assign the next file index (1, 2, ...), name the
//                        file "<pattern><index>.json" and hand a write task
//                        to the WriterPool without waiting for it.
//               Error -> report it and keep pulling. Errors take no index.
//   Finishing : the stream is closed; wait for outstanding writes.
//   Done      : every write finished; the report is final.
//
// File indices follow pull order exactly, whatever order the writes
// complete in.
// ============================================================================
#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "solrdump/result.hpp"
#include "solrdump/writer_pool.hpp"

namespace solrdump {

class DumpMetrics;

/// Writes one page; write_page() by default.
using PageWriteFn = std::function<std::size_t(const std::filesystem::path&,
                                              const Page&, bool strip)>;

struct ConsumerConfig {
  std::filesystem::path dump_dir;
  std::string           name_pattern;
  bool                  strip_reserved{true};
  PageWriteFn           write_fn;        // empty => write_page
};

struct DumpReport {
  uint64_t                 pages{0};           // == last file index
  uint64_t                 stream_errors{0};
  uint64_t                 files_written{0};
  std::vector<std::string> failed_files;       // sorted

  /// No page write failed. Stream errors are counted apart and mapped to
  /// the process status by exit_code().
  bool ok() const noexcept { return failed_files.empty(); }
};

// ============================================================================
// `Consumer` class
// ============================================================================
class Consumer {
public:
  enum class State { Draining, Finishing, Done };

  /// @param cfg     Output location and transformation mode.
  /// @param pool    Pool that runs the write tasks.
  /// @param metrics Optional counters, updated as results arrive.
  Consumer(ConsumerConfig cfg, WriterPool& pool, DumpMetrics* metrics = nullptr);

  Consumer(const Consumer&) = delete;
  Consumer& operator=(const Consumer&) = delete;

  /// Drain `stream` to completion and wait for every write. Call once.
  DumpReport run(ResultStream& stream);

  State state() const noexcept { return state_.load(std::memory_order_acquire); }

  /// Target path of the page with the given index.
  std::filesystem::path file_path(uint64_t index) const;

private:
  void on_page(Page&& page);
  void on_error(const StreamError& err);

  ConsumerConfig     cfg_;
  WriterPool&        pool_;
  DumpMetrics*       metrics_;
  std::atomic<State> state_{State::Draining};
  uint64_t           next_index_{1};
  DumpReport         report_;
};

} // namespace solrdump
