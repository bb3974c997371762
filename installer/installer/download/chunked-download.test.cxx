#include <installer/download/download-types.hxx>
#include <installer/download/download-source.hxx>
#include <installer/download/chunked-download.hxx>

#include <cassert>
#include <atomic>
#include <chrono>
#include <random>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <variant>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

using namespace std;
using namespace installer;
using namespace boost::asio::experimental::awaitable_operators;

namespace asio = boost::asio;
namespace fs = std::filesystem;

// Serve a string from memory with per-chunk delays and failures.
//
class memory_source: public download_source
{
public:
  string data;
  bool ranges = true;
  uint64_t chunk_size = 1;

  // Delay before serving the chunk with this index (whole body: index 0).
  //
  function<chrono::milliseconds (size_t)> delay;

  // Chunk index that fails after writing half of its bytes.
  //
  optional<size_t> fail;

  // Answer ranged requests with the whole body, like a server that does
  // not actually support ranges.
  //
  bool ignore_range = false;

  atomic<size_t> ranged_fetches {0};
  atomic<size_t> full_fetches {0};

  asio::awaitable<resource_info>
  probe (const string&) override
  {
    resource_info r;
    r.content_length = data.size ();
    r.accept_ranges = ranges;
    co_return r;
  }

  asio::awaitable<uint64_t>
  fetch (const string& url,
         ostream& out,
         progress_callback progress,
         optional<http_range> range) override
  {
    size_t i (range ? static_cast<size_t> (range->first / chunk_size) : 0);

    if (range)
      ++ranged_fetches;
    else
      ++full_fetches;

    if (delay)
    {
      asio::steady_timer t (co_await asio::this_coro::executor);
      t.expires_after (delay (i));
      co_await t.async_wait (asio::use_awaitable);
    }

    string b (range && !ignore_range
              ? data.substr (range->first, range->last - range->first + 1)
              : data);

    if (fail && *fail == i)
    {
      out.write (b.data (), static_cast<streamsize> (b.size () / 2));
      throw runtime_error ("connection reset by peer");
    }

    if (range && ignore_range)
      throw http_status_error (http_status::ok, url);

    out.write (b.data (), static_cast<streamsize> (b.size ()));

    if (progress)
      progress (b.size ());

    co_return b.size ();
  }
};

static string
make_data (size_t n)
{
  string r;
  r.reserve (n);

  mt19937 g (42);
  for (size_t i (0); i != n; ++i)
    r += static_cast<char> (g () & 0xff);

  return r;
}

static fs::path
make_temp_dir ()
{
  random_device rd;
  fs::path d (fs::temp_directory_path () /
              ("installer-download-" + to_string (rd ())));
  fs::create_directories (d);
  return d;
}

static string
read_file (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  return string (istreambuf_iterator<char> (ifs), istreambuf_iterator<char> ());
}

static size_t
count_entries (const fs::path& d)
{
  return static_cast<size_t> (distance (fs::directory_iterator (d),
                                        fs::directory_iterator ()));
}

template <typename T>
static T
run (asio::io_context& ioc, asio::awaitable<T> a)
{
  auto f (asio::co_spawn (ioc, move (a), asio::use_future));
  ioc.restart ();
  ioc.run ();
  return f.get ();
}

// Later chunks finish first. The merged file must still be in order.
//
static void
test_reverse_completion ()
{
  fs::path d (make_temp_dir ());

  memory_source s;
  s.data = make_data (7777);
  s.chunk_size = 1000;
  s.delay = [] (size_t i)
  {
    return chrono::milliseconds ((8 - i) * 15);
  };

  download_task t ("mem://file.bin", d / "file.bin");
  t.chunk_size = 1000;
  t.parallelism = 8;

  download_progress last;
  size_t calls (0);

  asio::io_context ioc;
  chunked_downloader dl (s);

  uint64_t n (run (ioc,
                   dl.download (t, [&last, &calls] (const download_progress& p)
                   {
                     assert (p.downloaded_bytes >= last.downloaded_bytes);
                     last = p;
                     ++calls;
                   })));

  assert (n == s.data.size ());
  assert (read_file (d / "file.bin") == s.data);
  assert (s.ranged_fetches == 8);
  assert (s.full_fetches == 0);
  assert (calls == 8);
  assert (last.total_bytes == s.data.size ());
  assert (last.completed ());
  assert (count_entries (d) == 1);

  fs::remove_all (d);
}

// Fewer workers than chunks: every chunk is fetched exactly once.
//
static void
test_bounded_pool ()
{
  fs::path d (make_temp_dir ());

  memory_source s;
  s.data = make_data (10 * 512 + 1);
  s.chunk_size = 512;

  download_task t ("mem://pool.bin", d / "pool.bin");
  t.chunk_size = 512;
  t.parallelism = 3;

  asio::io_context ioc;
  chunked_downloader dl (s);

  assert (run (ioc, dl.download (t)) == s.data.size ());
  assert (read_file (d / "pool.bin") == s.data);
  assert (s.ranged_fetches == 11);
  assert (count_entries (d) == 1);

  fs::remove_all (d);
}

static void
test_single_fetch ()
{
  fs::path d (make_temp_dir ());

  memory_source s;
  s.data = make_data (3000);
  s.ranges = false;
  s.chunk_size = 1000;

  download_task t ("mem://single.bin", d / "sub" / "single.bin");
  t.chunk_size = 1000;

  asio::io_context ioc;
  chunked_downloader dl (s);

  download_progress last;
  assert (run (ioc,
               dl.download (t, [&last] (const download_progress& p)
               {
                 last = p;
               })) == 3000);

  assert (read_file (d / "sub" / "single.bin") == s.data);
  assert (s.full_fetches == 1);
  assert (s.ranged_fetches == 0);
  assert (last.downloaded_bytes == 3000);
  assert (count_entries (d / "sub") == 1);

  fs::remove_all (d);
}

static void
test_empty_resource ()
{
  fs::path d (make_temp_dir ());

  memory_source s;

  download_task t ("mem://empty", d / "empty");

  asio::io_context ioc;
  chunked_downloader dl (s);

  assert (run (ioc, dl.download (t)) == 0);
  assert (fs::exists (d / "empty"));
  assert (fs::file_size (d / "empty") == 0);
  assert (s.full_fetches == 1);

  fs::remove_all (d);
}

// One chunk fails while another is still waiting. The download fails with
// the chunk's error and nothing is left behind.
//
static void
test_chunk_failure ()
{
  fs::path d (make_temp_dir ());

  memory_source s;
  s.data = make_data (4096);
  s.chunk_size = 1024;
  s.fail = 2;
  s.delay = [] (size_t i)
  {
    return chrono::milliseconds (i == 2 ? 10 : i == 3 ? 10000 : 0);
  };

  download_task t ("mem://fail.bin", d / "fail.bin");
  t.chunk_size = 1024;
  t.parallelism = 4;

  asio::io_context ioc;
  chunked_downloader dl (s);

  auto started (chrono::steady_clock::now ());

  bool thrown (false);
  try
  {
    run (ioc, dl.download (t));
  }
  catch (const download_error& e)
  {
    thrown = true;

    assert (e.chunk () == 2u);
    assert (e.url () == "mem://fail.bin");
    assert (string (e.what ()).find ("connection reset") != string::npos);
  }
  assert (thrown);

  // The slow chunk was cancelled rather than waited for.
  //
  assert (chrono::steady_clock::now () - started < chrono::seconds (5));

  assert (!fs::exists (d / "fail.bin"));
  assert (count_entries (d) == 0);

  fs::remove_all (d);
}

// A server that ignores the Range header fails the chunk.
//
static void
test_range_ignored ()
{
  fs::path d (make_temp_dir ());

  memory_source s;
  s.data = make_data (2048);
  s.chunk_size = 1024;
  s.ignore_range = true;

  download_task t ("mem://norange.bin", d / "norange.bin");
  t.chunk_size = 1024;
  t.parallelism = 1;

  asio::io_context ioc;
  chunked_downloader dl (s);

  bool thrown (false);
  try
  {
    run (ioc, dl.download (t));
  }
  catch (const download_error& e)
  {
    thrown = true;
    assert (e.chunk () == 0u);
  }
  assert (thrown);
  assert (count_entries (d) == 0);

  fs::remove_all (d);
}

// The caller gives up (a timeout) while every chunk is still in flight.
//
static void
test_cancellation ()
{
  fs::path d (make_temp_dir ());

  memory_source s;
  s.data = make_data (4096);
  s.chunk_size = 1024;
  s.delay = [] (size_t i)
  {
    return chrono::milliseconds (i == 0 ? 0 : 10000);
  };

  download_task t ("mem://cancel.bin", d / "cancel.bin");
  t.chunk_size = 1024;
  t.parallelism = 4;

  asio::io_context ioc;
  chunked_downloader dl (s);

  auto timeout = [&ioc] () -> asio::awaitable<void>
  {
    asio::steady_timer tm (ioc, chrono::milliseconds (100));
    co_await tm.async_wait (asio::use_awaitable);
  };

  auto started (chrono::steady_clock::now ());

  variant<uint64_t, monostate> r (
    run (ioc,
         [&dl, &t, &timeout] () -> asio::awaitable<variant<uint64_t,
                                                            monostate>>
         {
           co_return co_await (dl.download (t) || timeout ());
         } ()));

  assert (r.index () == 1);
  assert (chrono::steady_clock::now () - started < chrono::seconds (5));

  assert (!fs::exists (d / "cancel.bin"));
  assert (count_entries (d) == 0);

  fs::remove_all (d);
}

static void
test_invalid_task ()
{
  memory_source s;
  asio::io_context ioc;
  chunked_downloader dl (s);

  download_task t ("mem://x", fs::temp_directory_path () / "x");
  t.chunk_size = 0;

  bool thrown (false);
  try
  {
    run (ioc, dl.download (t));
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }
  assert (thrown);
}

int
main ()
{
  test_reverse_completion ();
  test_bounded_pool ();
  test_single_fetch ();
  test_empty_resource ();
  test_chunk_failure ();
  test_range_ignored ();
  test_cancellation ();
  test_invalid_task ();
}
