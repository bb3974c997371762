#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <filesystem>

namespace installer
{
  namespace fs = std::filesystem;

  // Supported archive formats.
  //
  enum class archive_format
  {
    zip,
    tar,
    tar_gz, // .tar.gz or .tgz
    gz      // Single gzip-compressed file.
  };

  std::string
  to_string (archive_format);

  inline std::ostream&
  operator<< (std::ostream& os, archive_format f)
  {
    return os << to_string (f);
  }

  // Determine the format from the file name suffix, case-insensitively.
  // Return nullopt if the name does not look like an archive.
  //
  std::optional<archive_format>
  archive_format_of (const fs::path&);

  // As above but throw unsupported_archive_error naming the extension.
  //
  archive_format
  detect_archive_format (const fs::path&);

  enum class entry_kind
  {
    file,
    directory,
    other // Symlink, hard link, device, FIFO, and the like.
  };

  inline std::ostream&
  operator<< (std::ostream& os, entry_kind k)
  {
    switch (k)
    {
    case entry_kind::file:      return os << "file";
    case entry_kind::directory: return os << "directory";
    case entry_kind::other:     return os << "other";
    }
    return os;
  }

  // Archive member as stored.
  //
  struct archive_entry
  {
    std::string   path; // Forward slash-separated, as stored.
    entry_kind    kind {entry_kind::file};
    std::uint32_t mode {0644};
    std::uint64_t size {0};

    bool
    directory () const noexcept {return kind == entry_kind::directory;}
  };

  // What to do with a single top-level wrapper directory.
  //
  enum class flatten_mode
  {
    never,
    always,
    auto_single_top // Flatten if there is exactly one top-level segment.
  };

  inline std::ostream&
  operator<< (std::ostream& os, flatten_mode m)
  {
    switch (m)
    {
    case flatten_mode::never:           return os << "never";
    case flatten_mode::always:          return os << "always";
    case flatten_mode::auto_single_top: return os << "auto";
    }
    return os;
  }

  struct extraction_plan
  {
    fs::path     archive;
    fs::path     destination;
    flatten_mode flatten {flatten_mode::auto_single_top};
  };

  struct extraction_result
  {
    std::size_t files {0};
    std::size_t directories {0};
    std::size_t skipped {0};
    bool        flattened {false};

    // Wrapper directory that was removed, if there was exactly one.
    //
    std::string flattened_directory;
  };

  // Corrupt, truncated, or otherwise unreadable archive.
  //
  class archive_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  class unsupported_archive_error: public archive_error
  {
  public:
    explicit
    unsupported_archive_error (const std::string& extension)
      : archive_error ("unsupported archive format '" + extension + "'"),
        extension_ (extension) {}

    const std::string&
    extension () const noexcept {return extension_;}

  private:
    std::string extension_;
  };

  // Entry that would land outside the destination.
  //
  class path_traversal_error: public archive_error
  {
  public:
    explicit
    path_traversal_error (const std::string& entry)
      : archive_error ("archive entry '" + entry +
                       "' escapes the destination directory"),
        entry_ (entry) {}

    const std::string&
    entry () const noexcept {return entry_;}

  private:
    std::string entry_;
  };
}
