#include <string>
#include <vector>
#include <iostream>
#include <exception>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <installer/installer-config.hxx>
#include <installer/installer-options.hxx>
#include <installer/installer-release.hxx>
#include <installer/installer-download.hxx>

#include <installer/http/http-client.hxx>

#include <installer/version.hxx>

using namespace std;
namespace asio = boost::asio;

namespace installer
{
  // Parse command options, which may be interleaved with the arguments,
  // and return the arguments.
  //
  template <typename O>
  static vector<string>
  parse_command (cli::argv_scanner& s, O& o)
  {
    vector<string> r;

    while (s.more ())
    {
      o.parse (s, cli::unknown_mode::fail, cli::unknown_mode::stop);

      if (s.more ())
        r.push_back (s.next ());
    }

    return r;
  }

  static void
  print_usage (ostream& o)
  {
    o << "usage: installer [options] <command> [<args>]"          << "\n"
      << "commands:"                                              << "\n"
      << "  download <url>    Download (and optionally verify and extract)"
      << " a file"                                                << "\n"
      << "  install <repo>    Install the latest (or given) GitHub release"
                                                                  << "\n"
      << "options:"                                               << "\n";

    options::print_usage (o);
  }

  // Run the command on a fresh io_context and return its exit status.
  //
  template <typename O, typename F>
  static int
  run_command (F f, const string& arg, const O& o,
               const installer_config& cfg)
  {
    asio::io_context ioc;
    http_client c (ioc);

    int r (1);

    asio::co_spawn (
      ioc,
      f (c, arg, o, cfg),
      [&r] (exception_ptr ex, int v)
      {
        if (ex)
        {
          try {rethrow_exception (ex);}
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << endl;
            r = 1;
          }
        }
        else
          r = v;
      });

    ioc.run ();
    return r;
  }
}

int
main (int argc, char* argv[])
{
  using namespace installer;

  try
  {
    cli::argv_scanner s (argc, argv);
    options opt (s, cli::unknown_mode::stop, cli::unknown_mode::stop);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "installer " << INSTALLER_VERSION_ID << endl;
      return 0;
    }

    if (opt.help () || !s.more ())
    {
      print_usage (opt.help () ? cout : cerr);
      return opt.help () ? 0 : 1;
    }

    string cmd (s.next ());

    installer_config cfg;
    cfg.validate ();

    if (cmd == "download")
    {
      download_options o;
      vector<string> args (parse_command (s, o));

      if (o.help ())
      {
        cout << "usage: installer download <url> [options]" << "\n"
             << "options:"                                  << "\n";

        download_options::print_usage (cout);
        return 0;
      }

      if (args.size () != 1)
      {
        cerr << "error: download expects exactly one URL" << endl;
        return 1;
      }

      return run_command (&run_download, args[0], o, cfg);
    }

    if (cmd == "install")
    {
      install_options o;
      vector<string> args (parse_command (s, o));

      if (o.help ())
      {
        cout << "usage: installer install <repo> [options]" << "\n"
             << "options:"                                  << "\n";

        install_options::print_usage (cout);
        return 0;
      }

      if (args.size () != 1)
      {
        cerr << "error: install expects exactly one repository" << endl;
        return 1;
      }

      return run_command (&run_install, args[0], o, cfg);
    }

    cerr << "error: unknown command '" << cmd << "'" << endl
         << "  info: run 'installer --help' for usage" << endl;
    return 1;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << endl;
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << endl;
    return 1;
  }
}
