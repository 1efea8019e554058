// ============================================================================
// dump_dir.cpp -- implementation of the dump directory initializer
// ============================================================================
#include "solrdump/dump_dir.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace solrdump {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf;
  localtime_r(&t, &tm_buf);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm_buf);
  return buf;
}

/// mkdir -p with an explicit mode for every created component
static void mkdir_all(const fs::path& dir, mode_t perms) {
  fs::path cur;
  for (const auto& part : dir) {
    cur /= part;
    if (part.empty() || part == "/") continue;

    struct stat st{};
    if (::stat(cur.c_str(), &st) == 0) {
      if (!S_ISDIR(st.st_mode)) {
        throw DirectoryCreationError("output error. " + cur.string() +
                                     " exists and is not a directory");
      }
      continue;
    }
    if (::mkdir(cur.c_str(), perms) != 0 && errno != EEXIST) {
      throw DirectoryCreationError("output error. mkdir " + cur.string() +
                                   ": " + std::strerror(errno));
    }
  }
}

fs::path make_dump_dir(const fs::path& dst, const std::string& pattern,
                       mode_t perms, std::chrono::system_clock::time_point now) {
  const fs::path full = dst / (pattern + format_timestamp(now));
  mkdir_all(full, perms);

  // mkdir may have lost a race against a regular file
  std::error_code ec;
  if (!fs::is_directory(full, ec)) {
    throw DirectoryCreationError("output error. " + full.string() +
                                 " is not a directory");
  }
  return full;
}

} // namespace solrdump
