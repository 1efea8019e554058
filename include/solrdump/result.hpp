// ============================================================================
// result.hpp -- Page / Result types flowing from the producer to the consumer
//
// A producer (e.g. the Solr cursor) yields, in order, either a Page of
// documents or a StreamError. The consumer pulls them through the
// ResultStream interface and never looks at how pages were fetched.
//
// Types and interfaces defined:
// - Document: one Solr document, field order preserved as received.
// - Page: ordered documents of one fetch. No identity of its own.
// - StreamError: a page-level failure reported by the producer.
// - Result: Page | StreamError.
// - ResultStream: blocking pull interface over Results.
// ============================================================================
#pragma once
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace solrdump {

/// Internal bookkeeping field maintained by Solr.
inline constexpr const char* RESERVED_FIELD = "_version_";

using Document = nlohmann::ordered_json;
using Page     = std::vector<Document>;

struct StreamError {
  std::string message;
};

using Result = std::variant<Page, StreamError>;

// ============================================================================
// `ResultStream` interface
// ============================================================================
class ResultStream {
public:
  virtual ~ResultStream() = default;

  /// Block until the next result is available.
  /// @param out Receives the result.
  /// @return False once the stream is closed and drained.
  virtual bool next(Result& out) = 0;
};

} // namespace solrdump
