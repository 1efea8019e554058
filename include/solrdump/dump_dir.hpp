// ============================================================================
// dump_dir.hpp -- Creation of the per-run dump directory
// ============================================================================
#pragma once
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <sys/types.h>

namespace solrdump {

class DirectoryCreationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Local time as "yyyymmdd-hhmmss".
std::string format_timestamp(std::chrono::system_clock::time_point tp);

/// Create `<dst>/<pattern><timestamp>` and any missing parents with mode
/// `perms` (umask applies). An existing directory is reused.
/// @return The path of the dump directory.
/// @throws DirectoryCreationError if a path component exists and is not a
///         directory, or mkdir fails.
std::filesystem::path make_dump_dir(const std::filesystem::path& dst,
                                    const std::string& pattern,
                                    mode_t perms,
                                    std::chrono::system_clock::time_point now =
                                      std::chrono::system_clock::now());

} // namespace solrdump
