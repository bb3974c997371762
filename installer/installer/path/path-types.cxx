#include <installer/path/path-types.hxx>

#include <cstdlib>

using namespace std;

namespace installer
{
  static string
  getenv_string (const char* n)
  {
    const char* v (getenv (n));
    return v != nullptr ? string (v) : string ();
  }

  string
  current_os ()
  {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "darwin";
#else
    return "linux";
#endif
  }

  vector<string>
  split_path_list (const string& s, bool windows)
  {
    const char sep (windows ? ';' : ':');

    vector<string> r;
    for (size_t b (0);;)
    {
      size_t e (s.find (sep, b));
      r.push_back (s.substr (b, e == string::npos ? string::npos : e - b));

      if (e == string::npos)
        break;

      b = e + 1;
    }

    return r;
  }

  install_environment install_environment::
  current ()
  {
    install_environment r;
    r.os = current_os ();
    r.path_entries = split_path_list (getenv_string ("PATH"), r.windows ());

    if (r.windows ())
    {
      string up (getenv_string ("USERPROFILE"));
      string la (getenv_string ("LOCALAPPDATA"));

      r.home = up;

      if (!la.empty ())
        r.fallbacks.push_back (fs::path (la) / "Programs" / "pyhub-installer");

      if (!up.empty ())
        r.fallbacks.push_back (fs::path (up) / "bin");
    }
    else
    {
      r.home = getenv_string ("HOME");

      if (!r.home.empty ())
      {
        r.fallbacks.push_back (r.home / ".local" / "bin");
        r.fallbacks.push_back (r.home / "bin");
      }
    }

    return r;
  }
}
