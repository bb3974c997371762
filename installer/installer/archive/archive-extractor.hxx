#pragma once

#include <memory>
#include <string>
#include <optional>
#include <functional>
#include <filesystem>

#include <installer/archive/archive-types.hxx>
#include <installer/archive/archive-reader.hxx>

namespace installer
{
  namespace fs = std::filesystem;

  // Produce a fresh reader positioned at the first entry.
  //
  using archive_reader_factory =
    std::function<std::unique_ptr<archive_reader> ()>;

  // Extract the archive described by the plan.
  //
  // The format is detected from the archive name. Flattening is decided by
  // a first pass over the entries; the second pass re-opens the archive and
  // writes. Bare gzip files have a single entry and are never flattened.
  //
  extraction_result
  extract_archive (const extraction_plan&);

  // Extract entries from whatever the factory opens into the destination,
  // creating it if necessary.
  //
  extraction_result
  extract_archive (const fs::path& destination,
                   flatten_mode,
                   const archive_reader_factory&);

  // Map an entry name onto the filesystem under root (absolute and
  // lexically normal). Return nullopt if it names root itself. Throw
  // path_traversal_error if it lands anywhere outside root.
  //
  // A leading slash does not make the name absolute.
  //
  std::optional<fs::path>
  resolve_entry_path (const fs::path& root, const std::string& entry);

  // First path segment of an entry name, skipping leading "./" and empty
  // segments. Empty if there is none.
  //
  std::string
  top_level_segment (const std::string& entry);

  // Entry name without its first segment. Empty if nothing remains.
  //
  std::string
  strip_top_level (const std::string& entry);
}
