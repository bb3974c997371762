#include <installer/http/http-types.hxx>
#include <installer/http/http-request.hxx>
#include <installer/http/http-response.hxx>

#include <cassert>
#include <string>

using namespace std;
using namespace installer;

static void
test_parse_url ()
{
  url_parts p (parse_url ("https://github.com/owner/repo/releases?x=1"));
  assert (p.scheme == "https");
  assert (p.host == "github.com");
  assert (p.port == "443");
  assert (p.target == "/owner/repo/releases?x=1");
  assert (p.secure ());

  p = parse_url ("HTTP://127.0.0.1:8080");
  assert (p.scheme == "http");
  assert (p.host == "127.0.0.1");
  assert (p.port == "8080");
  assert (p.target == "/");

  p = parse_url ("example.org?q");
  assert (p.scheme == "http");
  assert (p.port == "80");
  assert (p.target == "/?q");
}

static void
test_resolve_location ()
{
  const string b ("https://api.example.org:8443/a/b/c?x");

  assert (resolve_location (b, "https://cdn.example.org/f") ==
          "https://cdn.example.org/f");
  assert (resolve_location (b, "//cdn.example.org/f") ==
          "https://cdn.example.org/f");
  assert (resolve_location (b, "/f") == "https://api.example.org:8443/f");
  assert (resolve_location (b, "d") == "https://api.example.org:8443/a/b/d");
  assert (resolve_location ("http://h/x", "/y") == "http://h/y");
}

static void
test_url_file_name ()
{
  assert (url_file_name ("https://h/dl/tool-1.0.tar.gz") == "tool-1.0.tar.gz");
  assert (url_file_name ("https://h/dl/tool.zip?token=1#f") == "tool.zip");
  assert (url_file_name ("https://h/dl/dir/") == "dir");
  assert (url_file_name ("https://h") == "download");
  assert (url_file_name ("https://h/") == "download");
}

static void
test_headers ()
{
  http_headers h;
  h.set ("Content-Length", "10");
  h.add ("X-A", "1");
  h.add ("x-a", "2");

  assert (h.get ("content-length") == "10");
  assert (h.get ("X-A") == "1");

  h.set ("X-a", "3");
  assert (h.get ("x-A") == "3");
  assert (h.fields.size () == 2);

  h.remove ("CONTENT-LENGTH");
  assert (!h.contains ("Content-Length"));
}

static void
test_request ()
{
  http_request r (http_method::get, "https://h.example:444/f");
  r.set_range (http_range {0, 1023});
  r.normalize ("agent/1");

  assert (r.get_header ("Range") == "bytes=0-1023");
  assert (r.get_header ("Host") == "h.example:444");
  assert (r.get_header ("User-Agent") == "agent/1");

  http_request d (http_method::head, "http://h.example/f");
  d.set_header ("User-Agent", "mine");
  d.normalize ("agent/1");

  assert (d.get_header ("Host") == "h.example");
  assert (d.get_header ("User-Agent") == "mine");
}

static void
test_response ()
{
  http_response r;
  r.status = http_status::partial_content;
  r.headers.set ("Content-Length", "12345");
  r.headers.set ("Accept-Ranges", "none, Bytes");

  assert (r.is_success ());
  assert (!r.is_redirection ());
  assert (r.content_length () == 12345u);
  assert (r.accepts_byte_ranges ());

  r.headers.set ("Accept-Ranges", "none");
  r.headers.set ("Content-Length", "12a");

  assert (!r.accepts_byte_ranges ());
  assert (!r.content_length ());

  r.status = http_status::found;
  r.headers.set ("location", "/x");

  assert (r.is_redirection ());
  assert (r.location () == "/x");
}

int
main ()
{
  test_parse_url ();
  test_resolve_location ();
  test_url_file_name ();
  test_headers ();
  test_request ();
  test_response ();
}
