#include <installer/install/install-permissions.hxx>

#include <cctype>
#include <algorithm>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace installer
{
  fs::perms
  parse_chmod (const string& s)
  {
    if (s.size () == 3 &&
        all_of (s.begin (), s.end (),
                [] (char c) {return c >= '0' && c <= '7';}))
    {
      unsigned m ((s[0] - '0') << 6 | (s[1] - '0') << 3 | (s[2] - '0'));
      return static_cast<fs::perms> (m);
    }

    if (s.size () == 9)
    {
      static const char rwx[] = "rwx";
      unsigned m (0);

      for (size_t i (0); i != 9; ++i)
      {
        char c (s[i]);

        if (c == rwx[i % 3])
          m |= 1u << (8 - i);
        else if (c != '-')
          throw invalid_argument ("invalid permission character '" +
                                  string (1, c) + "' in '" + s + "'");
      }

      return static_cast<fs::perms> (m);
    }

    throw invalid_argument ("invalid permissions '" + s + "' (expected " +
                            "octal like 755 or symbolic like rwxr-xr-x)");
  }

  void
  apply_permissions (const fs::path& p, fs::perms m)
  {
#ifndef _WIN32
    error_code ec;
    fs::permissions (p, m, fs::perm_options::replace, ec);

    if (ec)
      throw runtime_error ("unable to set permissions on " + p.string () +
                           ": " + ec.message ());
#else
    (void) p;
    (void) m;
#endif
  }

  fs::path
  install_file (const fs::path& f, const fs::path& d, fs::perms m)
  {
    error_code ec;
    fs::create_directories (d, ec);

    if (ec)
      throw runtime_error ("unable to create directory " + d.string () +
                           ": " + ec.message ());

    fs::path t (d / f.filename ());

    fs::copy_file (f, t, fs::copy_options::overwrite_existing, ec);

    if (ec)
      throw runtime_error ("unable to install " + f.string () + " to " +
                           t.string () + ": " + ec.message ());

    apply_permissions (t, m);
    return t;
  }

  vector<fs::path>
  install_directory (const fs::path& src, const fs::path& dst, fs::perms m)
  {
    if (!fs::is_directory (src))
      throw runtime_error (src.string () + " is not a directory");

    vector<fs::path> r;

    for (auto i = fs::recursive_directory_iterator (src);
         i != fs::recursive_directory_iterator ();
         ++i)
    {
      fs::path rel (fs::relative (i->path (), src));

      if (i->is_directory ())
      {
        error_code ec;
        fs::create_directories (dst / rel, ec);

        if (ec)
          throw runtime_error ("unable to create directory " +
                               (dst / rel).string () + ": " + ec.message ());
      }
      else if (i->is_regular_file ())
        r.push_back (install_file (i->path (), (dst / rel).parent_path (), m));
    }

    sort (r.begin (), r.end ());
    return r;
  }

  bool
  executable_file (const fs::path& p)
  {
    error_code ec;
    fs::file_status s (fs::status (p, ec));

    if (ec || !fs::is_regular_file (s))
      return false;

#ifdef _WIN32
    string e (p.extension ().string ());
    transform (e.begin (), e.end (), e.begin (),
               [] (unsigned char c) {return static_cast<char> (tolower (c));});

    return e == ".exe" || e == ".bat" || e == ".cmd" || e == ".ps1";
#else
    const fs::perms x (fs::perms::owner_exec |
                       fs::perms::group_exec |
                       fs::perms::others_exec);

    return (s.permissions () & x) != fs::perms::none;
#endif
  }

  vector<fs::path>
  find_executables (const fs::path& d)
  {
    vector<fs::path> r;

    if (!fs::is_directory (d))
      return r;

    for (const auto& e: fs::recursive_directory_iterator (d))
    {
      if (executable_file (e.path ()))
        r.push_back (e.path ());
    }

    sort (r.begin (), r.end ());
    return r;
  }
}
