#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <optional>

#include <installer/http/http-types.hxx>

namespace installer
{
  // HTTP response.
  //
  // For buffered requests the body is held in memory. Streamed transfers
  // leave it empty and write straight to the caller's stream instead.
  //
  template <typename S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_status                status {http_status::ok};
    http_version               version;
    string_type                reason;
    headers_type               headers;
    std::optional<string_type> body;

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    bool
    is_error () const noexcept
    {
      return status_code () >= 400;
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    // Value of Content-Length, if present and well-formed.
    //
    std::optional<std::uint64_t>
    content_length () const;

    // True if the server advertises "Accept-Ranges: bytes".
    //
    bool
    accepts_byte_ranges () const;
  };

  using http_response = basic_http_response<std::string>;
}

#include <installer/http/http-response.ixx>
