// ============================================================================
// endpoint.hpp -- Solr collection link parsing and dump name pattern
//
// A collection link has the form
//
//     http[s]://host[:port]/solr/<collection>[/]
//
// parse_endpoint() splits it into a typed Endpoint and reports each way a
// link can be malformed with its own EndpointError::Kind. name_pattern()
// derives the filesystem-safe prefix shared by the dump directory and every
// page file: "<host>[.<port>].<collection>.".
// ============================================================================
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace solrdump {

struct Endpoint {
  std::string scheme;       // "http" | "https"
  std::string host;
  uint16_t    port{0};      // 0 = not given in the link
  std::string collection;

  /// Base URL of the collection, without trailing slash.
  std::string base_url() const;
};

class EndpointError : public std::runtime_error {
public:
  enum class Kind {
    MissingScheme,
    UnsupportedScheme,
    MissingHost,
    InvalidHost,
    InvalidPort,
    MissingSolrPath,
    MissingCollection,
    InvalidCollection,
  };

  EndpointError(Kind kind, const std::string& link);

  Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

const char* to_string(EndpointError::Kind kind) noexcept;

/// Parse a collection link.
/// @throws EndpointError describing the first problem found.
Endpoint parse_endpoint(std::string_view link);

/// "<host>[.<port>].<collection>."
std::string name_pattern(const Endpoint& ep);

} // namespace solrdump
