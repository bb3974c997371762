#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <utility>
#include <optional>

namespace installer
{
  // HTTP method (verb).
  //
  // We only ever talk to download hosts and the GitHub REST API, so the set
  // is limited to what those conversations need.
  //
  enum class http_method
  {
    get,
    head
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    no_content            = 204,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    not_modified          = 304,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  // Return the reason phrase or, for codes we don't name, the number.
  //
  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // HTTP protocol version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t mj = 1, std::uint8_t mn = 1)
      : major (mj), minor (mn) {}

    unsigned
    beast_version () const noexcept
    {
      return major * 10u + minor;
    }
  };

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
      : name (std::move (n)), value (std::move (v)) {}
  };

  // HTTP headers collection.
  //
  // Field names are compared case-insensitively (RFC 7230). Order of
  // insertion is preserved since that is what goes out on the wire.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Replace all fields with this name by a single one.
    //
    void
    set (string_type name, string_type value);

    // Append a field, keeping any existing ones.
    //
    void
    add (string_type name, string_type value);

    // Value of the first field with this name.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const;

    void
    remove (const string_type& name);

    bool
    empty () const noexcept {return fields.empty ();}

    typename fields_type::const_iterator
    begin () const noexcept {return fields.begin ();}

    typename fields_type::const_iterator
    end () const noexcept {return fields.end ();}
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // Inclusive byte range as sent in the Range header.
  //
  struct http_range
  {
    std::uint64_t first;
    std::uint64_t last;

    std::string
    header_value () const
    {
      return "bytes=" + std::to_string (first) + '-' + std::to_string (last);
    }
  };

  // Components of an absolute http(s) URL.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // Path, query, and fragment. Never empty.

    bool
    secure () const noexcept {return scheme == "https";}
  };

  // Split an URL into its parts.
  //
  // This handles scheme://host[:port][/target]. A missing scheme is taken as
  // http. We don't bother with user info or IPv6 literals since neither shows
  // up in release asset URLs.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a Location header value against the URL that produced it. The
  // value may be absolute, scheme-relative (//host/x), or an absolute path.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);

  // Last non-empty path segment of the URL, without query or fragment, or
  // "download" if the URL has no usable path.
  //
  std::string
  url_file_name (const std::string&);
}

#include <installer/http/http-types.ixx>
