// ============================================================================
// page_writer.cpp -- implementation of page encoding and file writing
// ============================================================================
#include "solrdump/page_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace solrdump {

bool strip_reserved(Document& doc) {
  if (!doc.is_object()) return false;
  return doc.erase(RESERVED_FIELD) > 0;
}

std::string encode_page(const Page& page, bool strip) {
  std::string data;
  try {
    // byte-identical to Document(page).dump()
    data.push_back('[');
    for (std::size_t n = 0; n < page.size(); ++n) {
      if (n > 0) data.push_back(',');
      if (strip) {
        Document doc = page[n];
        strip_reserved(doc);
        data += doc.dump();
      } else {
        data += page[n].dump();
      }
    }
    data += "]\n";
  } catch (const nlohmann::json::exception& e) {
    throw WriteError({}, std::string("error of Solr document processing. ") +
                         e.what());
  }
  return data;
}

std::size_t write_page(const std::filesystem::path& path, const Page& page,
                       bool strip) {
  std::string data;
  try {
    data = encode_page(page, strip);
  } catch (const WriteError& e) {
    throw WriteError(path.string(), e.what());
  }

  std::FILE* fp = std::fopen(path.c_str(), "wb");
  if (!fp) {
    throw WriteError(path.string(), "error of creating the file " +
                     path.string() + ". " + std::strerror(errno));
  }
  const auto n = std::fwrite(data.data(), 1, data.size(), fp);
  if (n != data.size()) {
    const int err = errno;
    std::fclose(fp);
    throw WriteError(path.string(), "error of writing to " + path.string() +
                     ". " + std::strerror(err));
  }
  if (std::fclose(fp) != 0) {
    throw WriteError(path.string(), "error of closing " + path.string() +
                     ". " + std::strerror(errno));
  }
  return n;
}

} // namespace solrdump
