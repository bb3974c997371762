#pragma once

#include <chrono>
#include <string>
#include <cstdint>
#include <filesystem>

#include <boost/asio.hpp>

#include <installer/installer-config.hxx>
#include <installer/installer-options.hxx>

#include <installer/http/http-client.hxx>
#include <installer/path/path-types.hxx>
#include <installer/download/download-types.hxx>

namespace installer
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  // Settings that both commands resolve from transfer options and the
  // configuration.
  //
  struct transfer_settings
  {
    std::uint64_t chunk_size;
    std::size_t parallelism;
    std::chrono::seconds timeout;
  };

  transfer_settings
  resolve_transfer_settings (const transfer_options&, const installer_config&);

  // Create the requested output directory. If that fails for a system
  // directory, fall back to a writable directory found on PATH.
  //
  fs::path
  resolve_output_directory (const fs::path& requested,
                            const install_environment&);

  // Download with the chunked downloader and a progress display, giving up
  // (and cleaning up) once the timeout expires.
  //
  asio::awaitable<std::uint64_t>
  download_file (http_client&,
                 const std::string& url,
                 const fs::path& target,
                 const transfer_settings&);

  // The download command. Return the exit status.
  //
  asio::awaitable<int>
  run_download (http_client&,
                const std::string& url,
                const download_options&,
                const installer_config&);
}
