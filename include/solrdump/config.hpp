// ============================================================================
// config.hpp -- Configuration structure for solrdump
//
// This header defines the Config struct that holds all configuration values
// for a dump run. Values start at their defaults, can be loaded from a TOML
// configuration file and are finally overridden by command line flags.
// ============================================================================
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace solrdump {

inline constexpr uint32_t MAX_WRITER_THREADS = 1024;   // -w / WRITER_THREADS bound

// ============================================================================
// Configuration structure
// ============================================================================
struct Config {
  // ========================================================================
  // Solr query
  // ========================================================================
  std::string LINK;                            // http[s]://host[:port]/solr/collection
  std::string QUERY          { "*:*" };
  std::string FIELD_LIST;                      // empty = all fields
  std::string SORT;                            // must include the unique key
  int64_t     ROWS           { 100000 };       // docs per request and per file
  std::string USER;
  std::string PASSWORD;
  int64_t     HTTP_TIMEOUT   { 180 };          // seconds

  // ========================================================================
  // Dump output
  // ========================================================================
  std::string DST_DIR        { "." };
  std::string DIR_PERMS      { "0755" };       // octal string
  uint32_t    WRITER_THREADS { 0 };            // 0 => hardware_concurrency()
  uint32_t    QUEUE_DEPTH    { 2 };            // pages fetched ahead of the consumer
  bool        PRINT_METRICS  { true };
};

/// Raised for unreadable config files and invalid option values.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// ============================================================================
// Load configuration from TOML file on top of `base`
// ============================================================================
Config load_config(const std::string& config_path, Config base = {});

} // namespace solrdump
