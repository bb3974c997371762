#pragma once

#include <memory>
#include <ostream>
#include <optional>
#include <filesystem>

#include <installer/archive/archive-types.hxx>

namespace installer
{
  namespace fs = std::filesystem;

  // Sequential archive reader.
  //
  // Entries are visited once, in archive order. The data of the current
  // entry can be extracted before advancing; whatever is not consumed is
  // skipped by the next call to next().
  //
  class archive_reader
  {
  public:
    virtual
    ~archive_reader () = default;

    // Advance to the next entry. Return nullopt at the end of the archive.
    //
    virtual std::optional<archive_entry>
    next () = 0;

    // Write the data of the current entry to the stream.
    //
    virtual void
    extract (std::ostream&) = 0;
  };

  // Open a reader for the archive. Each call starts from the beginning, which
  // is how the extractor gets its second pass over compressed streams.
  //
  std::unique_ptr<archive_reader>
  open_archive (const fs::path&, archive_format);
}
