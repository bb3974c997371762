#pragma once

#include <vector>
#include <cstdint>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>

#include <installer/download/download-types.hxx>
#include <installer/download/download-source.hxx>

namespace installer
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  // Parallel byte-range downloader.
  //
  // Probe the resource first. If the server advertises byte ranges and a
  // non-zero length, split it into chunks and fetch them with a fixed pool
  // of workers, each chunk into its own temporary file, then merge the files
  // in index order. Otherwise fall back to a single streamed request.
  //
  // Either way the bytes land in a staging file next to the target which is
  // only renamed onto the target once complete. On failure or cancellation
  // all temporary files are removed and the target is left untouched.
  //
  class chunked_downloader
  {
  public:
    using progress_observer = std::function<void (const download_progress&)>;

    explicit
    chunked_downloader (download_source& s): source_ (s) {}

    // Return the number of bytes written to the target.
    //
    asio::awaitable<std::uint64_t>
    download (const download_task&, progress_observer = nullptr);

  private:
    struct transfer_state;

    asio::awaitable<void>
    fetch_single (transfer_state&, const fs::path& staging);

    asio::awaitable<void>
    fetch_chunked (transfer_state&,
                   std::uint64_t length,
                   const fs::path& staging);

    asio::awaitable<void>
    run_worker (transfer_state&, const std::vector<byte_range_chunk>&);

    download_source& source_;
  };
}
