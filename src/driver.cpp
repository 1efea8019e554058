// ============================================================================
// `driver.cpp` -- End-to-end driver for Solr cursor -> Consumer -> Writers
//
// Usage:
//   ./solrdump -c <collection link> -s <sort> [options] [--config dump.toml]
//
//  - Validates the collection link and parameters.
//  - Sends the first query; Solr rejecting it stops the run here.
//  - Creates <dst>/<host>.<port>.<collection>.<yyyymmdd-hhmmss>.
//  - Pages through the collection with cursorMark on a fetch thread and
//    writes every page to <prefix><n>.json while the next one is fetched.
//  - Waits for every write, prints stats and exits with a status code.
//
// Exit status:
//   0  success
//   11 wrong arguments or configuration
//   3  query rejected, or the stream ended on a query error
//   2  dump directory could not be created
//   10 at least one page file failed
// ============================================================================
#include <cstdio>
#include <filesystem>
#include <string>

#include <curl/curl.h>

#include "solrdump/channel.hpp"
#include "solrdump/cli.hpp"
#include "solrdump/config.hpp"
#include "solrdump/consumer.hpp"
#include "solrdump/dump_dir.hpp"
#include "solrdump/endpoint.hpp"
#include "solrdump/metrics.hpp"
#include "solrdump/params.hpp"
#include "solrdump/solr_cursor.hpp"
#include "solrdump/writer_pool.hpp"

using solrdump::Config;
using solrdump::ConfigError;
using solrdump::Consumer;
using solrdump::ConsumerConfig;
using solrdump::DirectoryCreationError;
using solrdump::DumpMetrics;
using solrdump::EndpointError;
using solrdump::ResultChannel;
using solrdump::SolrCursor;
using solrdump::StreamSetupError;
using solrdump::WriterPool;
using solrdump::WriterPoolConfig;

namespace {

/// curl_global_init / curl_global_cleanup for the lifetime of main()
struct CurlGlobal {
  CURLcode rc;
  CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
  ~CurlGlobal() { if (rc == CURLE_OK) curl_global_cleanup(); }
};

} // namespace

// ============================================================================
// Main
// ============================================================================
int main(int argc, char** argv) {
  // ==========================================================================
  // Configuration: defaults <- --config files <- flags
  // ==========================================================================
  Config cfg;
  solrdump::Params params;
  solrdump::Endpoint endpoint;
  try {
    const solrdump::CliArgs args = solrdump::parse_args(argc, argv);
    if (args.help) {
      solrdump::print_usage(argv[0]);
      return solrdump::EXIT_OK;
    }
    cfg      = solrdump::resolve_config(args);
    params   = solrdump::make_params(cfg);
    endpoint = solrdump::parse_endpoint(params.link);
  } catch (const ConfigError& e) {
    std::fprintf(stderr, "MAIN: %s\n", e.what());
    solrdump::print_usage(argv[0]);
    return solrdump::EXIT_ARGS;
  } catch (const EndpointError& e) {
    std::fprintf(stderr, "MAIN: %s\n", e.what());
    return solrdump::EXIT_ARGS;
  }

  CurlGlobal curl_global;
  if (curl_global.rc != CURLE_OK) {
    std::fprintf(stderr, "MAIN: wrong query. curl_global_init: %s\n",
                 curl_easy_strerror(curl_global.rc));
    return solrdump::EXIT_QUERY;
  }

  // ==========================================================================
  // Query setup: sort check and first request, then the dump directory
  // ==========================================================================
  DumpMetrics metrics;
  ResultChannel results(cfg.QUEUE_DEPTH);
  SolrCursor cursor(endpoint.base_url(), params,
                    solrdump::build_query_params(params), results);
  try {
    cursor.start();
  } catch (const StreamSetupError& e) {
    std::fprintf(stderr, "MAIN: %s\n", e.what());
    return solrdump::EXIT_QUERY;
  }

  const std::string pattern = solrdump::name_pattern(endpoint);
  std::filesystem::path dump_dir;
  try {
    dump_dir = solrdump::make_dump_dir(params.dst_dir, pattern, params.dir_perms);
  } catch (const DirectoryCreationError& e) {
    std::fprintf(stderr, "MAIN: %s\n", e.what());
    return solrdump::EXIT_OUTPUT;
  }
  std::printf("MAIN: Dumping %s into %s\n", endpoint.base_url().c_str(),
              dump_dir.c_str());
  if (params.strip_reserved()) {
    std::printf("MAIN: No field list given, removing %s from documents\n",
                solrdump::RESERVED_FIELD);
  }

  // ==========================================================================
  // Run pipeline
  // ==========================================================================
  WriterPool writers(WriterPoolConfig{cfg.WRITER_THREADS});

  ConsumerConfig ccfg;
  ccfg.dump_dir       = dump_dir;
  ccfg.name_pattern   = pattern;
  ccfg.strip_reserved = params.strip_reserved();

  Consumer consumer(ccfg, writers, &metrics);
  const auto report = consumer.run(results);
  cursor.stop();

  // ==========================================================================
  // Stats
  // ==========================================================================
  if (cfg.PRINT_METRICS) {
    metrics.print(stdout);
  }
  std::printf("\nMAIN: %llu page(s), %llu file(s) written, %llu query error(s)\n",
              (unsigned long long)report.pages,
              (unsigned long long)report.files_written,
              (unsigned long long)report.stream_errors);

  if (!report.ok()) {
    std::fprintf(stderr, "MAIN: %zu file(s) failed:\n", report.failed_files.size());
    for (const auto& f : report.failed_files) {
      std::fprintf(stderr, "  %s\n", f.c_str());
    }
  }
  if (report.stream_errors > 0) {
    std::fprintf(stderr, "MAIN: The dump is incomplete, the query stream "
                         "stopped on an error.\n");
  }

  const int status = solrdump::exit_code(report);
  if (status == solrdump::EXIT_OK) {
    std::puts("MAIN: Dump completed OK.");
  }
  return status;
}
