// ============================================================================
// consumer.cpp -- implementation of the Consumer class
// ============================================================================
#include "solrdump/consumer.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <type_traits>
#include <variant>

#include "solrdump/metrics.hpp"
#include "solrdump/page_writer.hpp"

namespace solrdump {

Consumer::Consumer(ConsumerConfig cfg, WriterPool& pool, DumpMetrics* metrics)
: cfg_(std::move(cfg)), pool_(pool), metrics_(metrics) {
  if (!cfg_.write_fn) {
    cfg_.write_fn = [](const std::filesystem::path& p, const Page& page,
                       bool strip) {
      return write_page(p, page, strip);
    };
  }
}

std::filesystem::path Consumer::file_path(uint64_t index) const {
  return cfg_.dump_dir / (cfg_.name_pattern + std::to_string(index) + ".json");
}

void Consumer::on_page(Page&& page) {
  const uint64_t index = next_index_++;
  const auto path = file_path(index);
  ++report_.pages;
  if (metrics_) metrics_->mark_page(page.size());

  // std::function needs a copyable callable; share the page instead of
  // copying it.
  auto shared = std::make_shared<const Page>(std::move(page));
  WriteTask task;
  task.path = path.string();
  task.fn = [write = cfg_.write_fn, path, shared, strip = cfg_.strip_reserved,
             metrics = metrics_]() {
    const std::size_t n = write(path, *shared, strip);
    if (metrics) {
      metrics->mark_file_written();
      metrics->mark_bytes_written(n);
    }
    return n;
  };

  if (!pool_.submit(std::move(task))) {
    std::fprintf(stderr, "DUMP: writer pool closed, page %llu not written\n",
                 (unsigned long long)index);
    report_.failed_files.push_back(path.string());
  }
}

void Consumer::on_error(const StreamError& err) {
  std::fprintf(stderr, "DUMP: query error. %s\n", err.message.c_str());
  ++report_.stream_errors;
  if (metrics_) metrics_->mark_stream_error();
}

DumpReport Consumer::run(ResultStream& stream) {
  Result res;
  while (stream.next(res)) {
    std::visit([this](auto&& v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Page>) {
        on_page(std::move(v));
      } else {
        static_assert(std::is_same_v<T, StreamError>, "unhandled Result");
        on_error(v);
      }
    }, res);
  }

  state_.store(State::Finishing, std::memory_order_release);
  const WriteSummary ws = pool_.wait();

  report_.files_written = ws.succeeded;
  report_.failed_files.insert(report_.failed_files.end(),
                              ws.failed_paths.begin(), ws.failed_paths.end());
  std::sort(report_.failed_files.begin(), report_.failed_files.end());
  if (metrics_) metrics_->mark_write_error(ws.failed);

  state_.store(State::Done, std::memory_order_release);
  return report_;
}

} // namespace solrdump
