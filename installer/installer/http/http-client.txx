#include <chrono>
#include <limits>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace installer
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  // Convert Beast response headers into our response type. The body, if
  // any, is left for the caller.
  //
  template <typename R, typename M>
  inline R
  from_beast_response (const M& m)
  {
    using string_type = typename R::string_type;

    R r;
    r.status  = static_cast<http_status> (m.result_int ());
    r.version = http_version (m.version () / 10, m.version () % 10);
    r.reason  = string_type (m.reason ());

    for (const auto& h: m)
      r.headers.add (string_type (h.name_string ()),
                     string_type (h.value ()));

    return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  perform (request_type req, sink* out)
  {
    using namespace std::chrono;

    const auto& tr (session_->traits ());
    auto& ctx (session_->io_context ());

    for (std::uint8_t redirects (0);; ++redirects)
    {
      req.normalize (tr.user_agent);

      url_parts parts (parse_url (req.url));

      if (parts.scheme != "http" && parts.scheme != "https")
        throw std::invalid_argument ("unsupported URL scheme '" +
                                     parts.scheme + "' in " + req.url);

      if (parts.host.empty ())
        throw std::invalid_argument ("no host in URL " + req.url);

      tcp::resolver rslv (ctx);
      auto addrs (co_await rslv.async_resolve (parts.host,
                                               parts.port,
                                               asio::use_awaitable));

      response_type r;

      if (parts.secure ())
      {
        using stream_type = beast::ssl_stream<beast::tcp_stream>;

        stream_type s (ctx, session_->ssl_context ());

        // Without SNI most CDNs (the release asset host included) hand out
        // the wrong certificate or refuse the handshake outright.
        //
        if (!SSL_set_tlsext_host_name (s.native_handle (),
                                       parts.host.c_str ()))
        {
          beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                                asio::error::get_ssl_category ());
          throw beast::system_error (ec, "unable to set SNI host name");
        }

        if (tr.verify_ssl)
          s.set_verify_callback (ssl::host_name_verification (parts.host));

        auto& layer (beast::get_lowest_layer (s));

        layer.expires_after (milliseconds (tr.connect_timeout));
        co_await layer.async_connect (addrs, asio::use_awaitable);

        layer.expires_after (milliseconds (tr.request_timeout));
        co_await s.async_handshake (ssl::stream_base::client,
                                    asio::use_awaitable);

        r = co_await exchange (s, parts, req, out);

        // Skip the TLS close_notify dance: plenty of servers never answer it
        // and we would just sit there until the timeout fires.
        //
        beast::error_code ec;
        layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
      }
      else
      {
        beast::tcp_stream s (ctx);

        s.expires_after (milliseconds (tr.connect_timeout));
        co_await s.async_connect (addrs, asio::use_awaitable);

        r = co_await exchange (s, parts, req, out);

        beast::error_code ec;
        s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      }

      if (tr.follow_redirects &&
          r.is_redirection () &&
          r.status != http_status::not_modified)
      {
        auto l (r.location ());

        if (l && !l->empty ())
        {
          if (redirects + 1 >= tr.max_redirects)
            throw std::runtime_error ("maximum redirects exceeded for " +
                                      req.url);

          // The Host header belongs to the old location and must be
          // recomputed, otherwise the CDN answers with an error.
          //
          req.url = resolve_location (req.url, *l);
          req.headers.remove (string_type ("Host"));
          continue;
        }
      }

      // A redirect we could not follow is as useless as an error when we
      // were asked for the body.
      //
      if (out != nullptr && r.status != out->expected)
        throw http_status_error (r.status, req.url);

      co_return r;
    }
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (Stream& s,
            const url_parts& parts,
            const request_type& req,
            sink* out)
  {
    using namespace std::chrono;

    const auto& tr (session_->traits ());
    auto& layer (beast::get_lowest_layer (s));

    http::request<http::empty_body> br;
    br.method (req.method == http_method::head
               ? http::verb::head
               : http::verb::get);
    br.target (parts.target);
    br.version (req.version.beast_version ());

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    layer.expires_after (milliseconds (tr.request_timeout));
    co_await http::async_write (s, br, asio::use_awaitable);

    beast::flat_buffer b;

    // Buffered: read the whole thing into memory.
    //
    if (out == nullptr)
    {
      http::response_parser<http::string_body> p;
      p.body_limit (tr.buffered_body_limit);

      // A HEAD response announces a Content-Length without sending a body.
      //
      if (req.method == http_method::head)
        p.skip (true);

      layer.expires_after (milliseconds (tr.request_timeout));
      co_await http::async_read (s, b, p, asio::use_awaitable);

      const auto& m (p.get ());
      response_type r (from_beast_response<response_type> (m));

      if (!m.body ().empty ())
        r.body = string_type (m.body ());

      co_return r;
    }

    // Streamed: look at the header first so that nothing is written for a
    // redirect or an unexpected status.
    //
    http::response_parser<http::buffer_body> p;
    p.body_limit (std::numeric_limits<std::uint64_t>::max ());

    layer.expires_after (milliseconds (tr.request_timeout));
    co_await http::async_read_header (s, b, p, asio::use_awaitable);

    response_type r (from_beast_response<response_type> (p.get ()));

    if (tr.follow_redirects && r.is_redirection () && r.location ())
      co_return r;

    if (r.status != out->expected)
      throw http_status_error (r.status, req.url);

    co_await stream_body (s, b, p, req, *out);
    co_return r;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<void>
  basic_http_client<T>::
  stream_body (Stream& s,
               beast::flat_buffer& b,
               http::response_parser<http::buffer_body>& p,
               const request_type& req,
               sink& out)
  {
    using namespace std::chrono;

    const auto& tr (session_->traits ());
    auto& layer (beast::get_lowest_layer (s));

    std::uint64_t total (p.content_length () ? *p.content_length () : 0);
    char buf[8192];

    while (!p.is_done ())
    {
      p.get ().body ().data = buf;
      p.get ().body ().size = sizeof (buf);

      // Re-arm on every read so that only a stalled transfer times out.
      //
      layer.expires_after (milliseconds (tr.request_timeout));

      beast::error_code ec;
      co_await http::async_read (s, b, p,
                                 asio::redirect_error (asio::use_awaitable,
                                                       ec));

      // need_buffer just means our buffer is full.
      //
      if (ec == http::error::need_buffer)
        ec = {};

      if (ec)
        throw beast::system_error (ec);

      std::size_t n (sizeof (buf) - p.get ().body ().size);

      if (n != 0)
      {
        out.out->write (buf, static_cast<std::streamsize> (n));

        if (!*out.out)
          throw std::runtime_error ("unable to write response body of " +
                                    req.url);

        out.written += n;

        if (out.progress)
          out.progress (out.written, total);
      }
    }
  }

  template <typename T>
  asio::awaitable<std::uint64_t>
  basic_http_client<T>::
  download (const string_type& url,
            std::ostream& os,
            progress_callback progress,
            std::optional<http_range> range)
  {
    request_type req (http_method::get, url);

    sink s;
    s.out = &os;
    s.progress = std::move (progress);

    if (range)
    {
      req.set_range (*range);
      s.expected = http_status::partial_content;
    }

    co_await perform (std::move (req), &s);
    co_return s.written;
  }
}
