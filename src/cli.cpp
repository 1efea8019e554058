// ============================================================================
// cli.cpp -- implementation of the command line layer
// ============================================================================
#include "solrdump/cli.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <stdexcept>

#include "solrdump/params.hpp"
#include "solrdump/solr_cursor.hpp"

namespace solrdump {

namespace {

int64_t parse_int(const std::string& flag, const std::string& v) {
  try {
    std::size_t pos = 0;
    const long long n = std::stoll(v, &pos, 10);
    if (pos != v.size()) throw std::invalid_argument(v);
    return n;
  } catch (const std::exception&) {
    throw ConfigError("wrong value for " + flag + ": \"" + v + "\"");
  }
}

/// Long form of a value-taking flag, empty if unknown
std::string canonical(const std::string& arg) {
  if (arg == "-c" || arg == "--colllink")    return "--colllink";
  if (arg == "-q" || arg == "--query")       return "--query";
  if (arg == "-f" || arg == "--fieldlist")   return "--fieldlist";
  if (arg == "-s" || arg == "--sort")        return "--sort";
  if (arg == "-r" || arg == "--rows")        return "--rows";
  if (arg == "-d" || arg == "--dst")         return "--dst";
  if (arg == "-u" || arg == "--user")        return "--user";
  if (arg == "-p" || arg == "--password")    return "--password";
  if (arg == "-t" || arg == "--httpTimeout") return "--httpTimeout";
  if (arg == "-m" || arg == "--perms")       return "--perms";
  if (arg == "-w" || arg == "--writers")     return "--writers";
  if (arg == "--config")                     return "--config";
  return {};
}

} // namespace

CliArgs parse_args(int argc, const char* const* argv) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.help = true;
      return args;
    }
    const std::string flag = canonical(arg);
    if (flag.empty()) throw ConfigError("unknown argument: " + arg);
    if (i + 1 >= argc) throw ConfigError(arg + " requires a value");

    std::string value = argv[++i];
    if (flag == "--config") {
      args.config_files.push_back(std::move(value));
    } else {
      args.settings.emplace_back(flag, std::move(value));
    }
  }
  return args;
}

void apply_args(const CliArgs& args, Config& cfg) {
  for (const auto& [flag, value] : args.settings) {
    if      (flag == "--colllink")    cfg.LINK = value;
    else if (flag == "--query")       cfg.QUERY = value;
    else if (flag == "--fieldlist")   cfg.FIELD_LIST = value;
    else if (flag == "--sort")        cfg.SORT = value;
    else if (flag == "--rows")        cfg.ROWS = parse_int(flag, value);
    else if (flag == "--dst")         cfg.DST_DIR = value;
    else if (flag == "--user")        cfg.USER = value;
    else if (flag == "--password")    cfg.PASSWORD = value;
    else if (flag == "--httpTimeout") cfg.HTTP_TIMEOUT = parse_int(flag, value);
    else if (flag == "--perms")       cfg.DIR_PERMS = value;
    else if (flag == "--writers") {
      const int64_t n = parse_int(flag, value);
      if (n < 0 || n > MAX_WRITER_THREADS) {
        throw ConfigError("wrong value for " + flag + ": \"" + value +
                          "\" (0.." + std::to_string(MAX_WRITER_THREADS) + ")");
      }
      cfg.WRITER_THREADS = static_cast<uint32_t>(n);
    }
    else throw ConfigError("unknown argument: " + flag);
  }
}

Config resolve_config(const CliArgs& args) {
  Config cfg;
  for (const auto& path : args.config_files) {
    cfg = load_config(path, cfg);
  }
  apply_args(args, cfg);
  return cfg;
}

int exit_code(const DumpReport& report) noexcept {
  if (!report.ok()) return EXIT_PAGE_FAILED;
  if (report.stream_errors > 0) return EXIT_QUERY;
  return EXIT_OK;
}

void print_usage(const char* argv0) {
  std::fprintf(stderr,
    "usage: %s -c <link> -s <sort> [options]\n"
    "\n"
    "%s dumps and saves documents from a Solr collection in json format\n"
    "\n"
    "  -c, --colllink     http link to a Solr collection like\n"
    "                     http[s]://address[:port]/solr/collection (required)\n"
    "  -s, --sort         sort field with asc|desc, must include the unique key (required)\n"
    "  -q, --query        Q parameter (default \"*:*\")\n"
    "  -f, --fieldlist    fields list. All fields of documents are exported by default\n"
    "  -r, --rows         docs requested by one query and saved in one file (default 100000)\n"
    "  -d, --dst          path to place the dump directory (default \".\")\n"
    "  -u, --user         user name. Can also be set by %s\n"
    "  -p, --password     user password. Can also be set by %s\n"
    "  -t, --httpTimeout  http timeout in seconds (default 180)\n"
    "  -m, --perms        permissions for the dump directory (default \"0755\")\n"
    "  -w, --writers      writer threads, 0..%u (default: hardware concurrency)\n"
    "      --config       TOML file with [solr] and [dump] settings\n"
    "  -h, --help         print this help\n",
    argv0, PROGRAM_NAME, USER_ENV, PASSW_ENV, MAX_WRITER_THREADS);
}

} // namespace solrdump
