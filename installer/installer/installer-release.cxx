#include <installer/installer-release.hxx>

#include <iostream>
#include <stdexcept>
#include <system_error>

#include <installer/installer-download.hxx>

#include <installer/path/path-types.hxx>
#include <installer/path/path-resolver.hxx>
#include <installer/github/github-api.hxx>
#include <installer/github/github-types.hxx>
#include <installer/verify/verify-checksum.hxx>
#include <installer/archive/archive-types.hxx>
#include <installer/archive/archive-extractor.hxx>
#include <installer/install/install-permissions.hxx>

using namespace std;

namespace installer
{
  // Pick the installation directory. An explicit --output is used as is,
  // otherwise we look for a writable directory on PATH before settling for
  // the configured default.
  //
  static fs::path
  resolve_install_directory (const install_options& o,
                             const installer_config& c)
  {
    fs::path d (o.output_specified () ? o.output () : c.install_path);

    if (!o.output_specified () || o.output () == c.install_path)
    {
      try
      {
        fs::path w (find_writable_install_path (
                      install_environment::current ()));

        if (w != d)
          cout << "using writable directory " << w.string () << endl;

        d = w;
      }
      catch (const no_install_path_error& e)
      {
        cerr << "warning: " << e.what () << ", trying " << d.string ()
             << endl;
      }
    }

    error_code ec;
    fs::create_directories (d, ec);

    if (ec)
      throw runtime_error ("unable to create output directory " +
                           d.string () + ": " + ec.message ());

    return d;
  }

  asio::awaitable<int>
  run_install (http_client& c,
               const string& repository,
               const install_options& o,
               const installer_config& cfg)
  {
    transfer_settings ts (resolve_transfer_settings (o, cfg));
    github_repository repo (parse_repository (repository));

    fs::path out (resolve_install_directory (o, cfg));

    cout << "installing " << repo << " from GitHub" << endl;

    github_api api (c);
    github_release rel (co_await api.get_release (repo, o.version ()));

    cout << "found release " << rel.tag_name << endl;

    const github_asset& a (select_platform_asset (rel, o.platform ()));

    cout << "found asset " << a.name << " (" << a.size << " bytes)"
         << endl;

    fs::path f (out / a.name);
    co_await download_file (c, a.browser_download_url, f, ts);

    // A bad checksum is reported but does not stop the installation.
    //
    if (optional<github_asset> s = find_signature_asset (rel, a.name))
    {
      cout << "verifying " << a.name << " against " << s->name << endl;

      try
      {
        co_await verify_checksum_url (c, f, s->browser_download_url);
        cout << "checksum OK" << endl;
      }
      catch (const exception& e)
      {
        cerr << "warning: checksum verification failed: " << e.what ()
             << endl;
      }
    }
    else
      cout << "no checksum published, skipping verification" << endl;

    const fs::perms mode (cfg.install_mode ());

    if (!archive_format_of (f))
    {
      apply_permissions (f, mode);
      cout << "installed " << f.string () << endl;
      co_return 0;
    }

    // Extract into a scratch directory and install from there so that every
    // file ends up with the same permissions no matter what the archive
    // stored.
    //
    fs::path stage (out / ('.' + a.name + ".extract"));
    {
      error_code ec;
      fs::remove_all (stage, ec);
    }

    struct stage_guard
    {
      fs::path p;

      ~stage_guard ()
      {
        error_code ec;
        fs::remove_all (p, ec);
      }
    } sg {stage};

    extraction_plan p;
    p.archive = f;
    p.destination = stage;
    p.flatten = flatten_mode::auto_single_top;

    extraction_result r (extract_archive (p));

    vector<fs::path> is (install_directory (stage, out, mode));

    cout << "installed " << is.size () << " file(s) to " << out.string ();
    if (r.flattened)
      cout << " (stripped " << r.flattened_directory << "/)";
    cout << endl;

    error_code ec;
    fs::remove (f, ec);

    if (ec)
      cerr << "warning: unable to remove " << f.string () << ": "
           << ec.message () << endl;

    co_return 0;
  }
}
