#include <installer/installer-download.hxx>

#include <variant>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <boost/asio/experimental/awaitable_operators.hpp>

#include <installer/installer-progress.hxx>

#include <installer/http/http-types.hxx>
#include <installer/path/path-resolver.hxx>
#include <installer/verify/verify-checksum.hxx>
#include <installer/archive/archive-types.hxx>
#include <installer/archive/archive-extractor.hxx>
#include <installer/install/install-permissions.hxx>
#include <installer/download/download-source.hxx>
#include <installer/download/chunked-download.hxx>

using namespace std;

using namespace boost::asio::experimental::awaitable_operators;

namespace installer
{
  transfer_settings
  resolve_transfer_settings (const transfer_options& o,
                             const installer_config& c)
  {
    installer_config r (c);

    if (o.chunk_size_specified ())
      r.chunk_size = o.chunk_size ();

    if (o.jobs_specified ())
      r.parallelism = o.jobs ();

    if (o.timeout_specified ())
      r.timeout = o.timeout ();

    r.validate ();

    return transfer_settings {r.chunk_size,
                              r.parallelism,
                              chrono::seconds (r.timeout)};
  }

  fs::path
  resolve_output_directory (const fs::path& req,
                            const install_environment& env)
  {
    error_code ec;
    fs::create_directories (req, ec);

    if (!ec && probe_writable (req))
      return req;

    if (system_directory (req))
    {
      fs::path d (find_writable_install_path (env));

      cout << "permission denied for " << req.string ()
           << ", using writable directory " << d.string () << endl;

      return d;
    }

    if (ec)
      throw runtime_error ("unable to create output directory " +
                           req.string () + ": " + ec.message ());

    throw runtime_error ("output directory " + req.string () +
                         " is not writable");
  }

  asio::awaitable<uint64_t>
  download_file (http_client& c,
                 const string& url,
                 const fs::path& target,
                 const transfer_settings& s)
  {
    http_download_source src (c);
    chunked_downloader d (src);

    download_task t (url, target);
    t.chunk_size = s.chunk_size;
    t.parallelism = s.parallelism;

    progress_display pd (target.filename ().string ());

    asio::steady_timer timer (co_await asio::this_coro::executor);
    timer.expires_after (s.timeout);

    // Whichever finishes first cancels the other. A cancelled download
    // removes its temporary files on the way out.
    //
    variant<uint64_t, monostate> r (
      co_await (d.download (t, [&pd] (const download_progress& p)
                            {
                              pd.update (p);
                            }) ||
                timer.async_wait (asio::use_awaitable)));

    if (r.index () == 1)
      throw download_error ("timed out after " +
                            std::to_string (s.timeout.count ()) + " seconds",
                            url);

    pd.finish ();
    co_return get<0> (r);
  }

  asio::awaitable<int>
  run_download (http_client& c,
                const string& url,
                const download_options& o,
                const installer_config& cfg)
  {
    transfer_settings ts (resolve_transfer_settings (o, cfg));

    if (o.flatten () && o.no_flatten ())
      throw invalid_argument ("--flatten and --no-flatten are mutually "
                              "exclusive");

    fs::perms mode (parse_chmod (o.chmod_specified () ? o.chmod ()
                                                      : cfg.chmod));

    fs::path out (resolve_output_directory (fs::path (o.output ()),
                                            install_environment::current ()));

    fs::path f (out / url_file_name (url));

    cout << "downloading " << url << endl;

    co_await download_file (c, url, f, ts);

    cout << "downloaded to " << f.string () << endl;

    if (o.verify ())
    {
      if (o.signature ().empty ())
        cerr << "warning: --verify requires --signature, skipping "
             << "verification" << endl;
      else
      {
        cout << "verifying " << f.filename ().string () << endl;
        co_await verify_checksum_url (c, f, o.signature ());
        cout << "checksum OK" << endl;
      }
    }

    if (o.extract ())
    {
      extraction_plan p;
      p.archive = f;
      p.destination = out;
      p.flatten = o.flatten ()    ? flatten_mode::always :
                  o.no_flatten () ? flatten_mode::never  :
                                    flatten_mode::auto_single_top;

      cout << "extracting " << f.filename ().string () << endl;

      extraction_result r (extract_archive (p));

      cout << "extracted " << r.files << " file(s)";
      if (r.flattened)
        cout << " (stripped " << r.flattened_directory << "/)";
      cout << endl;

      if (o.remove_archive ())
      {
        error_code ec;
        fs::remove (f, ec);

        if (ec)
          cerr << "warning: unable to remove " << f.string () << ": "
               << ec.message () << endl;
        else
          cout << "removed " << f.string () << endl;
      }
    }
    else
      apply_permissions (f, mode);

    co_return 0;
  }
}
