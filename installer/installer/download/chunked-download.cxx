#include <installer/download/chunked-download.hxx>

#include <mutex>
#include <atomic>
#include <random>
#include <string>
#include <fstream>
#include <utility>
#include <algorithm>
#include <exception>
#include <system_error>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

using namespace std;

namespace installer
{
  namespace
  {
    // Files that must not outlive the download, whatever way it ends.
    //
    class temp_files
    {
    public:
      temp_files () = default;

      temp_files (const temp_files&) = delete;
      temp_files& operator= (const temp_files&) = delete;

      ~temp_files ()
      {
        for (const fs::path& p: paths_)
        {
          error_code ec;
          fs::remove (p, ec); // Most are gone already.
        }
      }

      void
      add (const fs::path& p)
      {
        lock_guard<mutex> l (mutex_);
        paths_.push_back (p);
      }

    private:
      mutex mutex_;
      vector<fs::path> paths_;
    };

    string
    random_tag ()
    {
      static const char d[] = "0123456789abcdef";

      random_device rd;
      mt19937 g (rd ());
      uniform_int_distribution<int> u (0, 15);

      string r;
      for (size_t i (0); i != 8; ++i)
        r += d[u (g)];

      return r;
    }

    // Chunk that made it to disk.
    //
    struct chunk_result
    {
      size_t        index;
      fs::path      file;
      uint64_t      bytes;
    };
  }

  struct chunked_downloader::transfer_state
  {
    const download_task& task;
    fs::path target;
    fs::path temp_directory;
    progress_observer observer;
    temp_files& temps;

    uint64_t total {0};
    atomic<uint64_t> transferred {0};
    atomic<size_t> next {0};

    mutex results_mutex;
    vector<chunk_result> results;

    // Hidden file in the temporary directory, removed on exit.
    //
    fs::path
    temp_path (const string& what)
    {
      fs::path p (temp_directory /
                  ('.' + target.filename ().string () + '.' + what + '-' +
                   random_tag ()));
      temps.add (p);
      return p;
    }

    void
    report (uint64_t delta)
    {
      uint64_t n (transferred += delta);

      if (observer)
        observer (download_progress (total, n));
    }
  };

  asio::awaitable<uint64_t> chunked_downloader::
  download (const download_task& t, progress_observer obs)
  {
    if (t.url.empty ())
      throw invalid_argument ("empty download URL");

    if (t.target.empty ())
      throw invalid_argument ("empty download target for " + t.url);

    if (t.chunk_size == 0)
      throw invalid_argument ("chunk size must be positive");

    if (t.parallelism == 0)
      throw invalid_argument ("parallelism must be positive");

    fs::path target (fs::absolute (t.target));
    fs::path dir (target.parent_path ());
    fs::path tdir (t.temp_directory.empty ()
                   ? dir
                   : fs::absolute (t.temp_directory));

    for (const fs::path& d: {dir, tdir})
    {
      error_code ec;
      fs::create_directories (d, ec);

      if (ec)
        throw download_error ("unable to create directory " + d.string () +
                              ": " + ec.message (),
                              t.url);
    }

    resource_info ri;
    try
    {
      ri = co_await source_.probe (t.url);
    }
    catch (const download_error&)
    {
      throw;
    }
    catch (const exception& e)
    {
      throw download_error (e.what (), t.url);
    }

    temp_files temps;
    transfer_state st {t, target, tdir, move (obs), temps};

    // The staging file lives next to the target, not in the temporary
    // directory, so that the final rename stays on one filesystem.
    //
    fs::path staging (dir /
                      ('.' + target.filename ().string () + ".part-" +
                       random_tag ()));
    temps.add (staging);

    if (ri.accept_ranges && ri.content_length && *ri.content_length > 0)
      co_await fetch_chunked (st, *ri.content_length, staging);
    else
    {
      st.total = ri.content_length.value_or (0);
      co_await fetch_single (st, staging);
    }

    error_code ec;
    uint64_t n (fs::file_size (staging, ec));

    if (ec)
      throw download_error ("unable to stat " + staging.string () + ": " +
                            ec.message (),
                            t.url);

    fs::rename (staging, target, ec);

    if (ec)
      throw download_error ("unable to move " + staging.string () + " to " +
                            target.string () + ": " + ec.message (),
                            t.url);

    co_return n;
  }

  asio::awaitable<void> chunked_downloader::
  fetch_single (transfer_state& st, const fs::path& staging)
  {
    const string& url (st.task.url);

    ofstream ofs (staging, ios::binary | ios::trunc);
    if (!ofs)
      throw download_error ("unable to create " + staging.string (), url);

    uint64_t last (0);

    try
    {
      co_await source_.fetch (url,
                              ofs,
                              [&st, &last] (uint64_t n)
                              {
                                st.report (n - last);
                                last = n;
                              },
                              nullopt);
    }
    catch (const download_error&)
    {
      throw;
    }
    catch (const exception& e)
    {
      throw download_error (e.what (), url);
    }

    ofs.close ();

    if (!ofs)
      throw download_error ("unable to write " + staging.string (), url);
  }

  asio::awaitable<void> chunked_downloader::
  fetch_chunked (transfer_state& st, uint64_t length, const fs::path& staging)
  {
    using namespace asio::experimental;

    const download_task& t (st.task);

    vector<byte_range_chunk> cs (plan_chunks (length, t.chunk_size));
    size_t wn (min (t.parallelism, cs.size ()));

    st.total = length;

    // Fixed pool of workers pulling chunk indexes from a shared counter.
    // The first failure cancels the rest of the group.
    //
    auto ex (co_await asio::this_coro::executor);

    using op_type = decltype (
      asio::co_spawn (ex, run_worker (st, cs), asio::deferred));

    vector<op_type> ops;
    ops.reserve (wn);

    for (size_t i (0); i != wn; ++i)
      ops.push_back (asio::co_spawn (ex, run_worker (st, cs), asio::deferred));

    auto [order, exs] =
      co_await make_parallel_group (move (ops)).async_wait (
        wait_for_one_error (), asio::use_awaitable);

    // Report the error that happened first, not the cancellations it
    // caused.
    //
    for (size_t i: order)
    {
      if (exs[i])
        rethrow_exception (exs[i]);
    }

    if (st.results.size () != cs.size ())
      throw download_error ("only " + std::to_string (st.results.size ()) +
                            " of " + std::to_string (cs.size ()) +
                            " chunks completed",
                            t.url);

    // Completion order is whatever the network made of it.
    //
    sort (st.results.begin (), st.results.end (),
          [] (const chunk_result& x, const chunk_result& y)
          {
            return x.index < y.index;
          });

    ofstream out (staging, ios::binary | ios::trunc);
    if (!out)
      throw download_error ("unable to create " + staging.string (), t.url);

    vector<char> buf (64 * 1024);

    for (const chunk_result& r: st.results)
    {
      ifstream in (r.file, ios::binary);
      if (!in)
        throw download_error ("unable to open " + r.file.string (),
                              t.url,
                              r.index);

      while (in)
      {
        in.read (buf.data (), static_cast<streamsize> (buf.size ()));

        if (streamsize n = in.gcount ())
          out.write (buf.data (), n);
      }

      if (in.bad () || !out)
        throw download_error ("unable to merge " + r.file.string () +
                              " into " + staging.string (),
                              t.url,
                              r.index);

      in.close ();

      error_code ec;
      fs::remove (r.file, ec); // The guard retries on exit.
    }

    out.close ();

    if (!out)
      throw download_error ("unable to write " + staging.string (), t.url);
  }

  asio::awaitable<void> chunked_downloader::
  run_worker (transfer_state& st, const vector<byte_range_chunk>& cs)
  {
    const string& url (st.task.url);

    for (size_t i (st.next++); i < cs.size (); i = st.next++)
    {
      const byte_range_chunk& c (cs[i]);
      fs::path p (st.temp_path ("chunk-" + std::to_string (c.index)));

      ofstream ofs (p, ios::binary | ios::trunc);
      if (!ofs)
        throw download_error ("unable to create " + p.string (),
                              url,
                              c.index);

      uint64_t last (0);
      uint64_t n (0);

      try
      {
        n = co_await source_.fetch (url,
                                    ofs,
                                    [&st, &last] (uint64_t x)
                                    {
                                      st.report (x - last);
                                      last = x;
                                    },
                                    http_range {c.start, c.end});
      }
      catch (const download_error&)
      {
        throw;
      }
      catch (const exception& e)
      {
        throw download_error (e.what (), url, c.index);
      }

      ofs.close ();

      if (!ofs)
        throw download_error ("unable to write " + p.string (), url, c.index);

      if (n != c.size ())
        throw download_error ("received " + std::to_string (n) +
                              " bytes instead of " + std::to_string (c.size ()),
                              url,
                              c.index);

      lock_guard<mutex> l (st.results_mutex);
      st.results.push_back (chunk_result {c.index, move (p), n});
    }
  }
}
