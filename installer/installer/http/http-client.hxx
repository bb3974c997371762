#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <installer/http/http-types.hxx>
#include <installer/http/http-request.hxx>
#include <installer/http/http-response.hxx>

namespace installer
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // Thrown when the server answers with a status we cannot use (4xx, 5xx, or
  // 200 where a 206 was required).
  //
  class http_status_error: public std::runtime_error
  {
  public:
    http_status_error (http_status s, std::string url)
      : std::runtime_error ("unexpected HTTP status " +
                            std::to_string (static_cast<std::uint16_t> (s)) +
                            " (" + to_string (s) + ") for " + url),
        status_ (s),
        url_ (std::move (url)) {}

    http_status
    status () const noexcept {return status_;}

    const std::string&
    url () const noexcept {return url_;}

  private:
    http_status status_;
    std::string url_;
  };

  // HTTP client configuration.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Inactivity timeout in milliseconds. It is re-armed before every read,
    // so a slow but steady transfer never trips it.
    //
    std::uint32_t request_timeout = 60000;

    std::uint8_t max_redirects = 10;
    bool follow_redirects = true;

    // Verify the peer certificate and host name. The certificate file, if
    // set, replaces the system trust store.
    //
    bool verify_ssl = true;
    string_type ssl_cert_file;

    string_type user_agent = string_type ("pyhub-installer");

    // Upper bound for bodies we keep in memory (API responses, checksum
    // files). Streamed transfers are not limited.
    //
    std::uint64_t buffered_body_limit = 16 * 1024 * 1024;
  };

  // State shared by all connections of a client: the io_context, the
  // configuration, and the TLS context.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tls_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept {return ioc_;}

    const traits_type&
    traits () const noexcept {return traits_;}

    ssl::context&
    ssl_context () noexcept {return ssl_ctx_;}

  private:
    void
    configure_ssl ();

    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // Asynchronous HTTP/1.1 client on top of Beast and coroutines.
  //
  // Every request uses a fresh connection. This keeps concurrent ranged
  // transfers independent of each other, which is exactly what the chunked
  // downloader wants.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // Progress callback: (bytes_transferred, total_bytes). The total is 0 if
    // the server did not announce a length.
    //
    using progress_callback =
      std::function<void (std::uint64_t, std::uint64_t)>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a request, following redirects, and buffer the body.
    //
    asio::awaitable<response_type>
    request (request_type req);

    asio::awaitable<response_type>
    get (const string_type& url);

    asio::awaitable<response_type>
    head (const string_type& url);

    // Stream the body of a GET into the output stream and return the number
    // of body bytes written.
    //
    // Without a range we require 200, with a range we require 206. Any other
    // final status throws http_status_error before a single byte is written.
    //
    asio::awaitable<std::uint64_t>
    download (const string_type& url,
              std::ostream& out,
              progress_callback progress = nullptr,
              std::optional<http_range> range = std::nullopt);

    session_type&
    session () noexcept {return *session_;}

  private:
    // Per-exchange output: where the body goes and what we expect.
    //
    struct sink
    {
      std::ostream* out = nullptr;
      http_status expected = http_status::ok;
      progress_callback progress;
      std::uint64_t written = 0;
    };

    // Drive one request through the redirect chain. With a sink the body is
    // streamed, otherwise buffered into the response.
    //
    asio::awaitable<response_type>
    perform (request_type req, sink* out);

    // One request/response exchange on an established stream.
    //
    template <typename Stream>
    asio::awaitable<response_type>
    exchange (Stream& s, const url_parts& p, const request_type& req,
              sink* out);

    template <typename Stream>
    asio::awaitable<void>
    stream_body (Stream& s, beast::flat_buffer& b,
                 beast::http::response_parser<beast::http::buffer_body>& p,
                 const request_type& req,
                 sink& out);

    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <installer/http/http-client.ixx>
#include <installer/http/http-client.txx>
