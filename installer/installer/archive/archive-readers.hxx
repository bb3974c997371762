#pragma once

#include <memory>
#include <string>
#include <cstdint>
#include <optional>
#include <filesystem>

#include <miniz.h>

#include <installer/archive/archive-reader.hxx>

struct archive; // <archive.h>

namespace installer
{
  // ZIP via miniz. Reads the central directory up front, so this one is
  // random access underneath.
  //
  class zip_reader: public archive_reader
  {
  public:
    explicit
    zip_reader (const fs::path&);

    ~zip_reader () override;

    zip_reader (const zip_reader&) = delete;
    zip_reader& operator= (const zip_reader&) = delete;

    std::optional<archive_entry>
    next () override;

    void
    extract (std::ostream&) override;

  private:
    std::string
    last_error ();

    fs::path path_;
    mz_zip_archive zip_;
    mz_uint count_ = 0;
    mz_uint next_ = 0;
    std::optional<mz_uint> current_;
    std::string current_name_;
  };

  // TAR, gzip-compressed TAR, and bare gzip via libarchive. Each reader
  // owns its own libarchive handle, so re-opening starts a fresh
  // decompression from the beginning of the file.
  //
  // A bare gzip file yields a single entry named after the archive with
  // the .gz suffix removed.
  //
  class stream_reader: public archive_reader
  {
  public:
    stream_reader (const fs::path&, archive_format);

    ~stream_reader () override;

    stream_reader (const stream_reader&) = delete;
    stream_reader& operator= (const stream_reader&) = delete;

    std::optional<archive_entry>
    next () override;

    void
    extract (std::ostream&) override;

  private:
    [[noreturn]] void
    fail (const std::string& what);

    fs::path path_;
    archive_format format_;
    struct ::archive* a_ = nullptr;
    bool done_ = false;
  };

  // Name of the file inside a bare gzip archive.
  //
  std::string
  gzip_member_name (const fs::path& archive);
}
