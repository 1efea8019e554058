// ============================================================================
// solr_cursor.hpp -- Solr cursorMark producer
//
// SolrCursor walks a Solr collection with deep paging: it starts from
// cursorMark=*, requests `<collection>/select` with the query parameters and
// the current mark, pushes the returned documents into a ResultChannel as a
// Page, and continues with `nextCursorMark` until Solr returns the mark it
// was given (end of results).
//
// Fetching happens on a dedicated thread so the next request overlaps with
// the writes of the previous page. The channel is bounded, which keeps the
// producer at most `capacity` pages ahead of the consumer.
//
// The first request (cursorMark=*) runs inside start(), so a query Solr
// rejects or an unreachable host is a setup error. Later on, a transport
// failure, a non-200 answer or an unparsable body ends the walk: a
// StreamError is pushed and the channel is closed, because the cursor cannot
// advance without a response. Retrying is left to the caller.
// ============================================================================
#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "solrdump/channel.hpp"
#include "solrdump/params.hpp"
#include "solrdump/result.hpp"

namespace solrdump {

inline constexpr const char* PROGRAM_NAME    = "solrdump";
inline constexpr const char* PROGRAM_VERSION = "0.1";

/// Raised when the cursor cannot be set up (bad sort, curl init failure).
class StreamSetupError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct HttpResponse {
  long        status{0};
  std::string body;
};

/// Performs one GET. Throws std::runtime_error on transport failure.
using HttpGetFn = std::function<HttpResponse(const std::string& url)>;

/// One decoded select response.
struct CursorPage {
  Page        docs;
  std::string next_mark;
  uint64_t    num_found{0};
};

/// Check that `sort` is a comma separated list of "<field> asc|desc".
/// @throws StreamSetupError otherwise.
void validate_sort(const std::string& sort);

/// `<base>/select?<k=v&...>&wt=json&cursorMark=<mark>`, values URL-encoded.
std::string build_select_url(const std::string& base, const QueryParams& qp,
                             const std::string& cursor_mark);

/// Decode a select response.
/// @throws std::runtime_error on a non-200 status or a malformed body.
CursorPage parse_select_response(const HttpResponse& resp);

// ============================================================================
// `SolrCursor` class
// ============================================================================
class SolrCursor {
public:
  /// @param base_url Collection URL, e.g. http://host:8983/solr/books
  /// @param params   Validated run parameters (credentials, timeout).
  /// @param qp       Query parameters from build_query_params().
  /// @param out      Channel receiving the results; closed when done.
  /// @param http_get Transport override; libcurl when empty.
  SolrCursor(std::string base_url, Params params, QueryParams qp,
             ResultChannel& out, HttpGetFn http_get = {});
  ~SolrCursor();

  SolrCursor(const SolrCursor&) = delete;
  SolrCursor& operator=(const SolrCursor&) = delete;

  /// Validate the sort, fetch the first page and start the fetch thread.
  /// @throws StreamSetupError if the sort is malformed or the first request
  ///         fails; the channel is closed in that case.
  void start();

  /// Join the fetch thread.
  void stop();

  struct Stats {
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> pages{0};
    std::atomic<uint64_t> docs{0};
    std::atomic<uint64_t> errors{0};
  };
  const Stats& stats() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace solrdump
