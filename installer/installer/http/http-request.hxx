#pragma once

#include <string>
#include <utility>
#include <optional>

#include <installer/http/http-types.hxx>

namespace installer
{
  // HTTP request.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method {http_method::get};
    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request () = default;

    basic_http_request (http_method m, string_type u)
      : method (m), url (std::move (u)) {}

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    // Restrict the transfer to an inclusive byte range.
    //
    void
    set_range (const http_range& r)
    {
      set_header (string_type ("Range"), r.header_value ());
    }

    // Fill in the headers every request must carry (Host, User-Agent) unless
    // the caller already set them.
    //
    void
    normalize (const string_type& user_agent)
    {
      if (!has_header (string_type ("Host")))
      {
        url_parts p (parse_url (url));
        bool dp ((p.secure () && p.port == "443") ||
                 (!p.secure () && p.port == "80"));

        set_header (string_type ("Host"), dp ? p.host : p.host + ':' + p.port);
      }

      if (!has_header (string_type ("User-Agent")))
        set_header (string_type ("User-Agent"), user_agent);
    }
  };

  using http_request = basic_http_request<std::string>;
}
