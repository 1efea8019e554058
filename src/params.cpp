// ============================================================================
// params.cpp -- Params validation and query parameter builder
// ============================================================================
#include "solrdump/params.hpp"

#include <cstdlib>

namespace solrdump {

mode_t parse_dir_perms(const std::string& s) {
  if (s.empty()) {
    throw ConfigError("wrong directory permissions: empty string");
  }
  unsigned long v = 0;
  for (char c : s) {
    if (c < '0' || c > '7') {
      throw ConfigError("wrong directory permissions \"" + s + "\"");
    }
    v = v * 8 + static_cast<unsigned long>(c - '0');
    if (v > 07777) {
      throw ConfigError("wrong directory permissions \"" + s + "\"");
    }
  }
  return static_cast<mode_t>(v);
}

static std::string from_env(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

Params make_params(const Config& cfg) {
  if (cfg.LINK.empty()) {
    throw ConfigError("the collection link is required (-c/--colllink)");
  }
  if (cfg.SORT.empty()) {
    throw ConfigError("the sort parameter is required (-s/--sort)");
  }
  if (cfg.ROWS <= 0) {
    throw ConfigError("rows must be positive, got " + std::to_string(cfg.ROWS));
  }
  if (cfg.HTTP_TIMEOUT <= 0) {
    throw ConfigError("http timeout must be positive, got " +
                      std::to_string(cfg.HTTP_TIMEOUT));
  }
  if (cfg.WRITER_THREADS > MAX_WRITER_THREADS) {
    throw ConfigError("writer threads must be at most " +
                      std::to_string(MAX_WRITER_THREADS) + ", got " +
                      std::to_string(cfg.WRITER_THREADS));
  }

  Params p;
  p.link         = cfg.LINK;
  p.query        = cfg.QUERY.empty() ? std::string("*:*") : cfg.QUERY;
  p.field_list   = cfg.FIELD_LIST;
  p.sort         = cfg.SORT;
  p.rows         = cfg.ROWS;
  p.user         = cfg.USER.empty() ? from_env(USER_ENV) : cfg.USER;
  p.password     = cfg.PASSWORD.empty() ? from_env(PASSW_ENV) : cfg.PASSWORD;
  p.http_timeout = cfg.HTTP_TIMEOUT;
  p.dst_dir      = cfg.DST_DIR.empty() ? std::string(".") : cfg.DST_DIR;
  p.dir_perms    = parse_dir_perms(cfg.DIR_PERMS);
  return p;
}

QueryParams build_query_params(const Params& p) {
  QueryParams qp;
  qp["q"]    = p.query;
  qp["sort"] = p.sort;
  if (!p.field_list.empty()) {
    qp["fl"] = p.field_list;
  }
  qp["rows"] = std::to_string(p.rows);
  return qp;
}

} // namespace solrdump
