// ============================================================================
// test_cli.cpp -- Test flag parsing, config precedence and exit status
// ============================================================================
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

#include "solrdump/cli.hpp"
#include "solrdump/params.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_EQ(a,b) do{ \
  auto _va=(a); auto _vb=(b); \
  if(!((_va)==(_vb))){ \
    std::fprintf(stderr,"EXPECT_EQ failed: %s=%lld %s=%lld @ %s:%d\n", \
                 #a,(long long)_va,#b,(long long)_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_STR_EQ(a,b) do{ \
  std::string _va=(a); std::string _vb=(b); \
  if(_va!=_vb){ \
    std::fprintf(stderr,"EXPECT_STR_EQ failed: %s=\"%s\" %s=\"%s\" @ %s:%d\n", \
                 #a,_va.c_str(),#b,_vb.c_str(),__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using solrdump::CliArgs;
using solrdump::Config;
using solrdump::ConfigError;
using solrdump::DumpReport;

namespace fs = std::filesystem;

/// Parse a command line given without the program name
static CliArgs parse(std::initializer_list<const char*> args) {
  std::vector<const char*> argv{"solrdump"};
  argv.insert(argv.end(), args.begin(), args.end());
  return solrdump::parse_args(static_cast<int>(argv.size()), argv.data());
}

/// Parse and resolve a command line into a Config
static Config resolve(std::initializer_list<const char*> args) {
  return solrdump::resolve_config(parse(args));
}

template <class Fn>
static bool throws_config_error(Fn fn) {
  try {
    fn();
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

static void write_file(const fs::path& p, const std::string& text) {
  std::ofstream f(p);
  f << text;
}

// ============================================================================
// Test 1: short and long forms, --config values, --help
// ============================================================================
void test_parse_args() {
  CliArgs a = parse({"-c", "http://solr1:8983/solr/books", "--sort", "id asc",
                     "--config", "one.toml", "-q", "title:dune",
                     "--config", "two.toml"});
  EXPECT_TRUE(!a.help);
  EXPECT_EQ(a.config_files.size(), 2u);
  EXPECT_STR_EQ(a.config_files[0], "one.toml");
  EXPECT_STR_EQ(a.config_files[1], "two.toml");
  EXPECT_EQ(a.settings.size(), 3u);
  EXPECT_STR_EQ(a.settings[0].first, "--colllink");
  EXPECT_STR_EQ(a.settings[1].first, "--sort");
  EXPECT_STR_EQ(a.settings[1].second, "id asc");
  EXPECT_STR_EQ(a.settings[2].first, "--query");

  // a flag value that looks like --config is still a value
  a = parse({"-q", "--config", "-s", "id asc"});
  EXPECT_EQ(a.config_files.size(), 0u);
  EXPECT_STR_EQ(a.settings[0].first, "--query");
  EXPECT_STR_EQ(a.settings[0].second, "--config");

  a = parse({"-c", "x", "-h", "--bogus"});
  EXPECT_TRUE(a.help);

  EXPECT_TRUE(throws_config_error([]{ parse({"--bogus", "1"}); }));
  EXPECT_TRUE(throws_config_error([]{ parse({"-c", "x", "-s"}); }));
  EXPECT_TRUE(throws_config_error([]{ parse({"positional"}); }));
  std::puts("test_parse_args: OK");
}

// ============================================================================
// Test 2: numeric flags are range checked
// ============================================================================
void test_flag_values() {
  Config cfg = resolve({"-r", "500", "-t", "30", "-w", "8", "-m", "0700"});
  EXPECT_EQ(cfg.ROWS, 500);
  EXPECT_EQ(cfg.HTTP_TIMEOUT, 30);
  EXPECT_EQ(cfg.WRITER_THREADS, 8u);
  EXPECT_STR_EQ(cfg.DIR_PERMS, "0700");

  EXPECT_EQ(resolve({"-w", "1024"}).WRITER_THREADS, 1024u);
  EXPECT_EQ(resolve({"-w", "0"}).WRITER_THREADS, 0u);

  EXPECT_TRUE(throws_config_error([]{ resolve({"-r", "abc"}); }));
  EXPECT_TRUE(throws_config_error([]{ resolve({"-r", "12x"}); }));
  EXPECT_TRUE(throws_config_error([]{ resolve({"-t", ""}); }));
  EXPECT_TRUE(throws_config_error([]{ resolve({"-w", "-1"}); }));
  EXPECT_TRUE(throws_config_error([]{ resolve({"-w", "1025"}); }));
  // would wrap to 0 (hardware concurrency) if truncated to 32 bits
  EXPECT_TRUE(throws_config_error([]{ resolve({"-w", "4294967296"}); }));

  // a perms string that is not octal is rejected when params are built
  EXPECT_TRUE(throws_config_error([]{
    solrdump::make_params(resolve({"-c", "http://h/solr/c", "-s", "id asc",
                                   "-m", "rwxr-x"}));
  }));
  std::puts("test_flag_values: OK");
}

// ============================================================================
// Test 3: defaults <- config files in order <- flags
// ============================================================================
void test_precedence() {
  const fs::path dir = "cli_test";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);

  const fs::path one = dir / "one.toml";
  const fs::path two = dir / "two.toml";
  write_file(one, "[solr]\n"
                  "LINK = \"http://solr1:8983/solr/books\"\n"
                  "SORT = \"id desc\"\n"
                  "QUERY = \"from:one\"\n"
                  "ROWS = 250\n"
                  "[dump]\n"
                  "WRITER_THREADS = 3\n");
  write_file(two, "[solr]\n"
                  "QUERY = \"from:two\"\n");

  const std::string p1 = one.string();
  const std::string p2 = two.string();
  Config cfg = resolve({"--config", p1.c_str(), "-s", "id asc",
                        "--config", p2.c_str(), "-w", "5"});
  EXPECT_STR_EQ(cfg.LINK, "http://solr1:8983/solr/books");   // file
  EXPECT_STR_EQ(cfg.SORT, "id asc");                         // flag over file
  EXPECT_STR_EQ(cfg.QUERY, "from:two");                      // later file
  EXPECT_EQ(cfg.ROWS, 250);                                  // file over default
  EXPECT_EQ(cfg.WRITER_THREADS, 5u);                         // flag over file
  EXPECT_EQ(cfg.HTTP_TIMEOUT, 180);                          // default
  EXPECT_STR_EQ(cfg.DST_DIR, ".");

  // the flag wins whatever its position relative to --config
  cfg = resolve({"-q", "from:flag", "--config", p2.c_str()});
  EXPECT_STR_EQ(cfg.QUERY, "from:flag");

  EXPECT_TRUE(throws_config_error([&]{
    resolve({"--config", (dir / "missing.toml").string().c_str()});
  }));

  // a config file can carry an out of range thread count too
  const fs::path big = dir / "big.toml";
  write_file(big, "[solr]\n"
                  "LINK = \"http://solr1:8983/solr/books\"\n"
                  "SORT = \"id asc\"\n"
                  "[dump]\n"
                  "WRITER_THREADS = 100000\n");
  const std::string pb = big.string();
  EXPECT_TRUE(throws_config_error([&]{
    solrdump::make_params(resolve({"--config", pb.c_str()}));
  }));

  fs::remove_all(dir, ec);
  std::puts("test_precedence: OK");
}

// ============================================================================
// Test 4: dump outcome -> process status
// ============================================================================
void test_exit_code() {
  DumpReport r;
  EXPECT_EQ(solrdump::exit_code(r), solrdump::EXIT_OK);

  r.pages = 4;
  r.files_written = 4;
  EXPECT_EQ(solrdump::exit_code(r), solrdump::EXIT_OK);

  // stream cut short by a query error
  r.stream_errors = 1;
  EXPECT_EQ(solrdump::exit_code(r), solrdump::EXIT_QUERY);

  // a failed write wins over the query error
  r.failed_files.push_back("dump/h.c.2.json");
  EXPECT_EQ(solrdump::exit_code(r), solrdump::EXIT_PAGE_FAILED);

  r.stream_errors = 0;
  EXPECT_EQ(solrdump::exit_code(r), solrdump::EXIT_PAGE_FAILED);

  EXPECT_EQ(solrdump::EXIT_ARGS, 11);
  EXPECT_EQ(solrdump::EXIT_QUERY, 3);
  EXPECT_EQ(solrdump::EXIT_OUTPUT, 2);
  EXPECT_EQ(solrdump::EXIT_PAGE_FAILED, 10);
  std::puts("test_exit_code: OK");
}

// ============================================================================
// Main
// ============================================================================
int main() {
  std::puts("Running cli tests...");
  test_parse_args();
  test_flag_values();
  test_precedence();
  test_exit_code();
  std::puts("All cli tests PASSED.");
  return 0;
}
