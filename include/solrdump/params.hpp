// ============================================================================
// params.hpp -- Validated run parameters and the Solr query builder
//
// Params is the immutable, validated form of a Config. build_query_params
// turns it into the canonical key-ordered parameter set the cursor producer
// sends with every request.
// ============================================================================
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <sys/types.h>

#include "solrdump/config.hpp"

namespace solrdump {

/// Environment variables consulted when no credentials were given.
inline constexpr const char* USER_ENV  = "SOLRUSER";
inline constexpr const char* PASSW_ENV = "SOLRPASSW";

struct Params {
  std::string link;
  std::string query;
  std::string field_list;
  std::string sort;
  int64_t     rows{0};
  std::string user;
  std::string password;
  int64_t     http_timeout{0};   // seconds
  std::string dst_dir;
  mode_t      dir_perms{0755};

  /// The reserved field is stripped only when all fields were requested.
  bool strip_reserved() const noexcept { return field_list.empty(); }
};

using QueryParams = std::map<std::string, std::string>;

/// Parse an octal permission string such as "0755".
/// @throws ConfigError on an empty string, a non-octal digit or a value
///         above 07777.
mode_t parse_dir_perms(const std::string& s);

/// Validate a Config and freeze it into Params. Empty credentials are
/// resolved from SOLRUSER / SOLRPASSW.
/// @throws ConfigError if a value is missing or out of range.
Params make_params(const Config& cfg);

/// Build q / sort / [fl] / rows.
QueryParams build_query_params(const Params& p);

} // namespace solrdump
