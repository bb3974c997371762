#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <optional>
#include <functional>

#include <boost/asio.hpp>

#include <installer/http/http-types.hxx>
#include <installer/http/http-client.hxx>

namespace installer
{
  namespace asio = boost::asio;

  // What a header-only probe tells us about a resource.
  //
  struct resource_info
  {
    std::optional<std::uint64_t> content_length;
    bool accept_ranges = false;
  };

  // Where the downloader gets its bytes from.
  //
  // The downloader only needs a probe and a (possibly ranged) streamed
  // fetch, so that is all a source has to provide. Besides HTTP this lets
  // tests serve bytes from memory with controlled timing and failures.
  //
  class download_source
  {
  public:
    // Called with the number of bytes written so far by this fetch.
    //
    using progress_callback = std::function<void (std::uint64_t)>;

    virtual
    ~download_source () = default;

    virtual asio::awaitable<resource_info>
    probe (const std::string& url) = 0;

    // Stream the resource (or the inclusive range of it) into the output
    // stream and return the number of bytes written. A ranged fetch that
    // the server answers with anything but 206 must throw.
    //
    virtual asio::awaitable<std::uint64_t>
    fetch (const std::string& url,
           std::ostream& out,
           progress_callback progress,
           std::optional<http_range> range) = 0;
  };

  // Source backed by the HTTP client.
  //
  class http_download_source: public download_source
  {
  public:
    explicit
    http_download_source (http_client& c): client_ (c) {}

    asio::awaitable<resource_info>
    probe (const std::string& url) override;

    asio::awaitable<std::uint64_t>
    fetch (const std::string& url,
           std::ostream& out,
           progress_callback progress,
           std::optional<http_range> range) override;

  private:
    http_client& client_;
  };
}
