#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <filesystem>

namespace installer
{
  namespace fs = std::filesystem;

  // Inclusive byte range of the resource fetched by one ranged request.
  //
  struct byte_range_chunk
  {
    std::uint64_t start;
    std::uint64_t end;   // Inclusive.
    std::size_t   index; // 0-based, contiguous.

    std::uint64_t
    size () const noexcept
    {
      return end - start + 1;
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const byte_range_chunk& c)
  {
    return os << "chunk " << c.index << " [" << c.start << '-' << c.end
              << ']';
  }

  // Partition [0, length-1] into contiguous chunks of chunk_size bytes (the
  // last one possibly shorter). Return an empty list for a zero length.
  //
  // Throw std::invalid_argument if chunk_size is zero.
  //
  std::vector<byte_range_chunk>
  plan_chunks (std::uint64_t length, std::uint64_t chunk_size);

  // One download invocation.
  //
  struct download_task
  {
    std::string   url;
    fs::path      target;
    std::uint64_t chunk_size  = 1024 * 1024;
    std::size_t   parallelism = 4;

    // Directory for chunk files. If empty, the target's directory is used
    // so that the final merge never crosses a filesystem boundary.
    //
    fs::path      temp_directory;

    download_task () = default;

    download_task (std::string u, fs::path t)
      : url (std::move (u)), target (std::move (t)) {}
  };

  // Download progress snapshot.
  //
  struct download_progress
  {
    std::uint64_t total_bytes {0}; // 0 if unknown.
    std::uint64_t downloaded_bytes {0};

    download_progress () = default;

    download_progress (std::uint64_t total, std::uint64_t downloaded)
      : total_bytes (total), downloaded_bytes (downloaded) {}

    double
    percent () const noexcept
    {
      return total_bytes > 0 ? downloaded_bytes * 100.0 / total_bytes : 0.0;
    }

    bool
    completed () const noexcept
    {
      return total_bytes > 0 && downloaded_bytes >= total_bytes;
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const download_progress& p)
  {
    return os << p.downloaded_bytes << '/' << p.total_bytes
              << " (" << p.percent () << "%)";
  }

  // Download failure. Carries the URL and, for ranged transfers, the index
  // of the chunk that failed.
  //
  class download_error: public std::runtime_error
  {
  public:
    download_error (const std::string& what,
                    std::string url,
                    std::optional<std::size_t> chunk = std::nullopt)
      : std::runtime_error (format (what, url, chunk)),
        url_ (std::move (url)),
        chunk_ (chunk) {}

    const std::string&
    url () const noexcept {return url_;}

    const std::optional<std::size_t>&
    chunk () const noexcept {return chunk_;}

  private:
    static std::string
    format (const std::string& what,
            const std::string& url,
            const std::optional<std::size_t>& chunk)
    {
      std::string r ("unable to download " + url);

      if (chunk)
        r += " (chunk " + std::to_string (*chunk) + ')';

      return r + ": " + what;
    }

    std::string url_;
    std::optional<std::size_t> chunk_;
  };
}
