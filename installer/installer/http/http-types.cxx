#include <installer/http/http-types.hxx>

using namespace std;

namespace installer
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
    case http_method::get:  return "GET";
    case http_method::head: return "HEAD";
    }

    return "GET";
  }

  string
  to_string (http_status s)
  {
    switch (s)
    {
    case http_status::ok:                    return "OK";
    case http_status::no_content:            return "No Content";
    case http_status::partial_content:       return "Partial Content";
    case http_status::moved_permanently:     return "Moved Permanently";
    case http_status::found:                 return "Found";
    case http_status::see_other:             return "See Other";
    case http_status::not_modified:          return "Not Modified";
    case http_status::temporary_redirect:    return "Temporary Redirect";
    case http_status::permanent_redirect:    return "Permanent Redirect";
    case http_status::bad_request:           return "Bad Request";
    case http_status::unauthorized:          return "Unauthorized";
    case http_status::forbidden:             return "Forbidden";
    case http_status::not_found:             return "Not Found";
    case http_status::range_not_satisfiable: return "Range Not Satisfiable";
    case http_status::too_many_requests:     return "Too Many Requests";
    case http_status::internal_server_error: return "Internal Server Error";
    case http_status::bad_gateway:           return "Bad Gateway";
    case http_status::service_unavailable:   return "Service Unavailable";
    case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return std::to_string (static_cast<uint16_t> (s));
  }

  url_parts
  parse_url (const string& u)
  {
    url_parts r;
    size_t p (0);

    size_t s (u.find ("://"));
    if (s != string::npos)
    {
      r.scheme = u.substr (0, s);
      transform (r.scheme.begin (), r.scheme.end (), r.scheme.begin (),
                 [] (unsigned char c) {return static_cast<char> (tolower (c));});
      p = s + 3;
    }
    else
      r.scheme = "http";

    // The authority ends at the first of '/', '?', or '#'.
    //
    size_t e (u.find_first_of ("/?#", p));
    if (e == string::npos)
      e = u.size ();

    string a (u.substr (p, e - p));
    size_t c (a.rfind (':'));

    if (c != string::npos)
    {
      r.host = a.substr (0, c);
      r.port = a.substr (c + 1);
    }
    else
      r.host = a;

    if (r.port.empty ())
      r.port = r.secure () ? "443" : "80";

    r.target = e < u.size () ? u.substr (e) : string ("/");

    if (r.target[0] != '/')
      r.target.insert (0, 1, '/');

    return r;
  }

  string
  resolve_location (const string& base, const string& l)
  {
    if (l.find ("://") != string::npos)
      return l;

    url_parts b (parse_url (base));

    if (l.size () > 1 && l[0] == '/' && l[1] == '/')
      return b.scheme + ':' + l;

    string a (b.scheme + "://" + b.host);

    bool dp ((b.secure () && b.port == "443") ||
             (!b.secure () && b.port == "80"));
    if (!dp)
      a += ':' + b.port;

    if (!l.empty () && l[0] == '/')
      return a + l;

    // Relative reference: replace the last segment of the base path.
    //
    string t (b.target.substr (0, b.target.find_first_of ("?#")));
    return a + t.substr (0, t.rfind ('/') + 1) + l;
  }

  string
  url_file_name (const string& u)
  {
    url_parts p (parse_url (u));
    string t (p.target.substr (0, p.target.find_first_of ("?#")));

    while (!t.empty () && t.back () == '/')
      t.pop_back ();

    size_t s (t.rfind ('/'));
    string r (s == string::npos ? t : t.substr (s + 1));

    return r.empty () || r == "." || r == ".." ? string ("download") : r;
  }
}
