#include <installer/http/http-client.hxx>
#include <installer/download/download-source.hxx>
#include <installer/download/chunked-download.hxx>

#include <cassert>
#include <random>
#include <string>
#include <fstream>
#include <sstream>
#include <iterator>
#include <exception>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

using namespace std;
using namespace installer;

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace fs    = std::filesystem;

using tcp = asio::ip::tcp;

static const string payload = []
{
  string r;
  for (size_t i (0); i != 100000; ++i)
    r += static_cast<char> ('a' + i * 7 % 26);
  return r;
} ();

// Serve /file (ranges supported), /plain (no ranges advertised),
// /redirect (to /file), /loop (to itself), and 404 for anything else.
//
static asio::awaitable<void>
session (tcp::socket s)
{
  beast::flat_buffer b;
  bhttp::request<bhttp::string_body> req;
  co_await bhttp::async_read (s, b, req, asio::use_awaitable);

  auto tv (req.target ());
  string t (tv.data (), tv.size ());
  bool head (req.method () == bhttp::verb::head);

  bhttp::response<bhttp::string_body> res;
  res.version (11);
  res.keep_alive (false);

  if (t == "/file" || t == "/plain")
  {
    if (t == "/file")
      res.set (bhttp::field::accept_ranges, "bytes");

    auto rv (req[bhttp::field::range]);
    string r (rv.data (), rv.size ());

    if (t == "/file" && r.compare (0, 6, "bytes=") == 0)
    {
      size_t d (r.find ('-'));
      size_t f (stoul (r.substr (6, d - 6)));
      size_t l (stoul (r.substr (d + 1)));

      res.result (bhttp::status::partial_content);
      res.set (bhttp::field::content_range,
               "bytes " + to_string (f) + '-' + to_string (l) + '/' +
               to_string (payload.size ()));
      res.body () = payload.substr (f, l - f + 1);
    }
    else
    {
      res.result (bhttp::status::ok);
      res.body () = payload;
    }
  }
  else if (t == "/redirect")
  {
    res.result (bhttp::status::found);
    res.set (bhttp::field::location, "/file");
  }
  else if (t == "/loop")
  {
    res.result (bhttp::status::moved_permanently);
    res.set (bhttp::field::location, "/loop");
  }
  else
  {
    res.result (bhttp::status::not_found);
    res.body () = "not found";
  }

  res.prepare_payload ();

  if (head)
  {
    bhttp::response<bhttp::empty_body> h (res.base ());
    h.content_length (res.body ().size ());
    co_await bhttp::async_write (s, h, asio::use_awaitable);
  }
  else
    co_await bhttp::async_write (s, res, asio::use_awaitable);

  beast::error_code ec;
  s.shutdown (tcp::socket::shutdown_both, ec);
}

static asio::awaitable<void>
serve (tcp::acceptor& a)
{
  for (;;)
  {
    tcp::socket s (co_await a.async_accept (asio::use_awaitable));
    asio::co_spawn (a.get_executor (), session (move (s)), asio::detached);
  }
}

// Run the test coroutine against a fresh server.
//
static void
run (asio::awaitable<void> (*f) (http_client&, string))
{
  asio::io_context ioc;

  tcp::acceptor a (ioc, tcp::endpoint (asio::ip::make_address ("127.0.0.1"),
                                       0));
  string base ("http://127.0.0.1:" + to_string (a.local_endpoint ().port ()));

  asio::co_spawn (ioc, serve (a), asio::detached);

  http_client c (ioc);
  exception_ptr ep;

  asio::co_spawn (ioc,
                  f (c, base),
                  [&ioc, &ep] (exception_ptr e)
                  {
                    ep = e;
                    ioc.stop ();
                  });

  ioc.run ();

  if (ep)
    rethrow_exception (ep);
}

static asio::awaitable<void>
test_head (http_client& c, string base)
{
  http_response r (co_await c.head (base + "/file"));

  assert (r.status == http_status::ok);
  assert (r.content_length () == payload.size ());
  assert (r.accepts_byte_ranges ());
  assert (!r.body);

  http_response p (co_await c.head (base + "/plain"));
  assert (!p.accepts_byte_ranges ());
}

static asio::awaitable<void>
test_get (http_client& c, string base)
{
  http_response r (co_await c.get (base + "/file"));

  assert (r.status == http_status::ok);
  assert (r.body && *r.body == payload);

  http_response n (co_await c.get (base + "/missing"));
  assert (n.status == http_status::not_found);
  assert (n.is_error ());
}

static asio::awaitable<void>
test_redirect (http_client& c, string base)
{
  http_response r (co_await c.head (base + "/redirect"));
  assert (r.status == http_status::ok);
  assert (r.content_length () == payload.size ());

  ostringstream os;
  uint64_t n (co_await c.download (base + "/redirect", os));

  assert (n == payload.size ());
  assert (os.str () == payload);

  bool thrown (false);
  try
  {
    co_await c.get (base + "/loop");
  }
  catch (const runtime_error& e)
  {
    thrown = string (e.what ()).find ("redirects") != string::npos;
  }
  assert (thrown);
}

static asio::awaitable<void>
test_range (http_client& c, string base)
{
  ostringstream os;
  uint64_t last (0);

  uint64_t n (co_await c.download (base + "/file",
                                   os,
                                   [&last] (uint64_t w, uint64_t t)
                                   {
                                     assert (w > last);
                                     assert (t == 1000);
                                     last = w;
                                   },
                                   http_range {500, 1499}));

  assert (n == 1000);
  assert (last == 1000);
  assert (os.str () == payload.substr (500, 1000));

  // The server ignores ranges here and answers 200, which must not be
  // taken for the requested part.
  //
  ostringstream ps;
  bool thrown (false);
  try
  {
    co_await c.download (base + "/plain", ps, nullptr, http_range {0, 9});
  }
  catch (const http_status_error& e)
  {
    thrown = true;
    assert (e.status () == http_status::ok);
  }
  assert (thrown);
  assert (ps.str ().empty ());
}

static asio::awaitable<void>
test_not_found (http_client& c, string base)
{
  ostringstream os;
  bool thrown (false);
  try
  {
    co_await c.download (base + "/missing", os);
  }
  catch (const http_status_error& e)
  {
    thrown = true;
    assert (e.status () == http_status::not_found);
    assert (e.url () == base + "/missing");
  }
  assert (thrown);
  assert (os.str ().empty ());
}

static fs::path
make_temp_dir ()
{
  random_device rd;
  fs::path d (fs::temp_directory_path () /
              ("installer-http-" + to_string (rd ())));
  fs::create_directories (d);
  return d;
}

static string
read_file (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  return string (istreambuf_iterator<char> (ifs), istreambuf_iterator<char> ());
}

static asio::awaitable<void>
test_chunked (http_client& c, string base)
{
  fs::path d (make_temp_dir ());

  http_download_source src (c);
  chunked_downloader dl (src);

  download_task t (base + "/file", d / "file");
  t.chunk_size = 16 * 1024;
  t.parallelism = 3;

  uint64_t n (co_await dl.download (t));
  assert (n == payload.size ());
  assert (read_file (d / "file") == payload);

  download_task p (base + "/plain", d / "plain");
  p.chunk_size = 16 * 1024;

  n = co_await dl.download (p);
  assert (n == payload.size ());
  assert (read_file (d / "plain") == payload);

  download_task m (base + "/missing", d / "missing");

  bool thrown (false);
  try
  {
    co_await dl.download (m);
  }
  catch (const download_error& e)
  {
    thrown = true;
    assert (!e.chunk ());
  }
  assert (thrown);
  assert (!fs::exists (d / "missing"));

  fs::remove_all (d);
}

int
main ()
{
  run (&test_head);
  run (&test_get);
  run (&test_redirect);
  run (&test_range);
  run (&test_not_found);
  run (&test_chunked);
}
