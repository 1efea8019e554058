// ============================================================================
// page_writer.hpp -- Page serialization and per-page file writer
//
// Every page is stored as one self-contained JSON array, one element per
// document, in the order the service returned them, followed by a newline.
// When the dump requested all fields, Solr's internal `_version_` field is
// removed from each document before it is written; otherwise documents are
// written as received.
// ============================================================================
#pragma once
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "solrdump/result.hpp"

namespace solrdump {

/// Failure to encode or persist one page file. Scoped to that file.
class WriteError : public std::runtime_error {
public:
  WriteError(std::string path, const std::string& what)
    : std::runtime_error(what), path_(std::move(path)) {}

  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
};

/// Remove the reserved field if present.
/// @return True if the field was there.
bool strip_reserved(Document& doc);

/// Encode a page as "[doc,doc,...]\n".
/// @param strip Remove `_version_` from every document.
/// @throws WriteError (with an empty path) if a document cannot be encoded.
std::string encode_page(const Page& page, bool strip);

/// Create or truncate `path` and write the encoded page to it.
/// @return Number of bytes written.
/// @throws WriteError on encode, open, write or close failure.
std::size_t write_page(const std::filesystem::path& path, const Page& page,
                       bool strip);

} // namespace solrdump
