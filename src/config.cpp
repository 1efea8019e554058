// ============================================================================
// config.cpp -- Configuration loading implementation
//
// This file implements the load_config function that reads configuration
// values from a TOML file and applies them on top of a Config struct.
// ============================================================================
#include "solrdump/config.hpp"
#include <toml++/toml.hpp>
#include <cstdio>

namespace solrdump {

// ============================================================================
// Load configuration from TOML file
// ============================================================================
Config load_config(const std::string& config_path, Config base) {
  Config cfg = std::move(base);

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path);
  } catch (const toml::parse_error& err) {
    throw ConfigError("error parsing config file '" + config_path + "': " +
                      std::string(err.description()));
  }

  // Solr config
  if (auto v = tbl["solr"]["LINK"].value<std::string>()) cfg.LINK = *v;
  if (auto v = tbl["solr"]["QUERY"].value<std::string>()) cfg.QUERY = *v;
  if (auto v = tbl["solr"]["FIELD_LIST"].value<std::string>()) cfg.FIELD_LIST = *v;
  if (auto v = tbl["solr"]["SORT"].value<std::string>()) cfg.SORT = *v;
  if (auto v = tbl["solr"]["ROWS"].value<int64_t>()) cfg.ROWS = *v;
  if (auto v = tbl["solr"]["USER"].value<std::string>()) cfg.USER = *v;
  if (auto v = tbl["solr"]["PASSWORD"].value<std::string>()) cfg.PASSWORD = *v;
  if (auto v = tbl["solr"]["HTTP_TIMEOUT"].value<int64_t>()) cfg.HTTP_TIMEOUT = *v;

  // Dump config
  if (auto v = tbl["dump"]["DST_DIR"].value<std::string>()) cfg.DST_DIR = *v;
  if (auto v = tbl["dump"]["DIR_PERMS"].value<std::string>()) cfg.DIR_PERMS = *v;
  if (auto v = tbl["dump"]["WRITER_THREADS"].value<uint32_t>()) cfg.WRITER_THREADS = *v;
  if (auto v = tbl["dump"]["QUEUE_DEPTH"].value<uint32_t>()) cfg.QUEUE_DEPTH = *v;
  if (auto v = tbl["dump"]["PRINT_METRICS"].value<bool>()) cfg.PRINT_METRICS = *v;

  std::printf("Loaded configuration from: %s\n", config_path.c_str());
  return cfg;
}

} // namespace solrdump
