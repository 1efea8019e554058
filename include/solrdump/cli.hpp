// ============================================================================
// cli.hpp -- Command line parsing and exit status mapping
//
// Flags are parsed once into CliArgs. The driver then loads the --config
// files in order and applies the flag settings on top:
//
//   defaults <- --config files <- flags
// ============================================================================
#pragma once
#include <string>
#include <utility>
#include <vector>

#include "solrdump/config.hpp"
#include "solrdump/consumer.hpp"

namespace solrdump {

// ============================================================================
// Exit status
// ============================================================================
inline constexpr int EXIT_OK          = 0;
inline constexpr int EXIT_OUTPUT      = 2;    // dump directory not created
inline constexpr int EXIT_QUERY       = 3;    // query rejected or stream cut short
inline constexpr int EXIT_PAGE_FAILED = 10;   // at least one page file failed
inline constexpr int EXIT_ARGS        = 11;   // arguments or configuration

struct CliArgs {
  bool                                             help{false};
  std::vector<std::string>                         config_files;
  std::vector<std::pair<std::string, std::string>> settings;   // flag, value
};

/// Split argv into --config files and flag settings, in order.
/// @throws ConfigError on an unknown flag or a missing value.
CliArgs parse_args(int argc, const char* const* argv);

/// Apply the flag settings of `args` on top of `cfg`.
/// @throws ConfigError on a malformed or out of range value.
void apply_args(const CliArgs& args, Config& cfg);

/// Defaults, then every --config file, then the flags.
/// @throws ConfigError
Config resolve_config(const CliArgs& args);

/// Process status for a finished dump. Write failures win over query errors.
int exit_code(const DumpReport& report) noexcept;

void print_usage(const char* argv0);

} // namespace solrdump
