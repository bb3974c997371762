#include <installer/path/path-resolver.hxx>

#include <set>
#include <cctype>
#include <random>
#include <string>
#include <fstream>
#include <system_error>

using namespace std;

namespace installer
{
  // Comparison key: forward slashes, no trailing slash, and lower case on
  // Windows.
  //
  static string
  path_key (const fs::path& p, bool windows)
  {
    string r (p.string ());

    for (char& c: r)
    {
      if (c == '\\')
        c = '/';
      else if (windows)
        c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }

    while (r.size () > 1 && r.back () == '/')
      r.pop_back ();

    return r;
  }

  static bool
  starts_with (const string& s, const string& p)
  {
    return s.size () >= p.size () && s.compare (0, p.size (), p) == 0;
  }

  // True if k is d or somewhere below it.
  //
  static bool
  within (const string& k, const string& d)
  {
    return k == d || starts_with (k, d + '/');
  }

  static bool
  absolute_entry (const string& s, bool windows)
  {
    if (!windows)
      return !s.empty () && s[0] == '/';

    // C:\x, C:/x, or \\server\share.
    //
    return (s.size () >= 3 &&
            isalpha (static_cast<unsigned char> (s[0])) &&
            s[1] == ':' &&
            (s[2] == '\\' || s[2] == '/')) ||
           starts_with (s, "\\\\");
  }

  // System directories. Anything that is not writable for ordinary users
  // and that a package manager or the OS owns.
  //
  static const char* const denied_posix[] = {
    "/bin",
    "/sbin",
    "/usr/bin",
    "/usr/sbin",
    "/usr/lib",
    "/usr/libexec",
    "/System",
    "/Library/Apple",
    "/snap",
    "/proc",
    "/sys"
  };

  // Ecosystem markers, matched against "/<lower-case path>/".
  //
  static const char* const low_markers[] = {
    "/site-packages/",
    "/dist-packages/",
    "/.venv/",
    "/venv/",
    "/virtualenvs/",
    "/.virtualenvs/",
    "/pipx/",
    "/conda",
    "/anaconda",
    "/miniconda",
    "/miniforge",
    "/mambaforge",
    "/.pyenv/",
    "/.nvm/",
    "/node_modules/",
    "/npm/",
    "/.npm",
    "/pnpm/",
    "/.yarn/",
    "/.cargo/",
    "/.rustup/",
    "/.rbenv/",
    "/.rvm/",
    "/gems/",
    "/.gem/",
    "/.goenv/",
    "/go/bin/",
    "/.sdkman/",
    "/.asdf/",
    "/.deno/",
    "/.bun/",
    "/windowsapps/"
  };

  // Conventional tool directories, already in lower case for Windows.
  //
  static const char* const preferred[] = {
    "/usr/local/bin",
    "/opt/homebrew/bin",
    "/opt/local/bin",
    "c:/programdata/chocolatey/bin"
  };

  bool
  is_denied_path (const fs::path& p, const install_environment& env)
  {
    bool w (env.windows ());
    string k (path_key (p, w));

    if (w)
    {
      // <drive>:/windows and everything below it.
      //
      return k.size () >= 10 &&
             k[1] == ':' &&
             within (k.substr (2), "/windows");
    }

    for (const char* d: denied_posix)
    {
      if (within (k, d))
        return true;
    }

    return false;
  }

  bool
  system_directory (const fs::path& p)
  {
    static const char* ds[] = {"/usr/local/bin", "/usr/bin", "/opt",
                               "/usr/local"};

    string k (path_key (p.lexically_normal (), false));

    for (const char* d: ds)
    {
      if (within (k, d))
        return true;
    }

    return false;
  }

  priority_class
  classify_path (const fs::path& p, const install_environment& env)
  {
    bool w (env.windows ());
    string k (path_key (p, w));

    string l ('/' + k + '/');
    for (char& c: l)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    for (const char* m: low_markers)
    {
      if (l.find (m) != string::npos)
        return priority_class::low;
    }

    if (!env.home.empty ())
    {
      string h (path_key (env.home, w));

      if (h != "/" && within (k, h))
        return priority_class::high;
    }

    for (const char* d: preferred)
    {
      if (k == d)
        return priority_class::high;
    }

    return priority_class::normal;
  }

  vector<candidate_path>
  candidate_paths (const install_environment& env)
  {
    bool w (env.windows ());

    vector<candidate_path> high, normal, low;
    set<string> seen;

    for (string s: env.path_entries)
    {
      if (w && s.size () >= 2 && s.front () == '"' && s.back () == '"')
        s = s.substr (1, s.size () - 2);

      if (s.empty ())
        continue;

      if (s[0] == '~' && (s.size () == 1 || s[1] == '/' || s[1] == '\\'))
      {
        if (env.home.empty ())
          continue;

        s = env.home.string () + s.substr (1);
      }

      // Relative entries (".", "bin") depend on the current directory.
      //
      if (!absolute_entry (s, w))
        continue;

      fs::path p (fs::path (s).lexically_normal ());

      if (!p.has_filename () && p.has_relative_path ())
        p = p.parent_path ();

      if (!seen.insert (path_key (p, w)).second)
        continue;

      if (is_denied_path (p, env))
        continue;

      switch (classify_path (p, env))
      {
      case priority_class::high:
        high.push_back (candidate_path {p, priority_class::high});
        break;
      case priority_class::normal:
        normal.push_back (candidate_path {p, priority_class::normal});
        break;
      case priority_class::low:
        low.push_back (candidate_path {p, priority_class::low});
        break;
      }
    }

    vector<candidate_path> r (move (high));
    r.insert (r.end (), normal.begin (), normal.end ());
    r.insert (r.end (), low.begin (), low.end ());
    return r;
  }

  bool
  probe_writable (const fs::path& d)
  {
    error_code ec;
    if (!fs::is_directory (d, ec))
      return false;

    random_device rd;
    fs::path f (d / (".installer-probe-" + std::to_string (rd ())));

    {
      ofstream o (f, ios::binary | ios::trunc);

      if (!o)
        return false;
    }

    fs::remove (f, ec);
    return !ec;
  }

  fs::path
  find_writable_install_path (const install_environment& env,
                              const writability_probe& probe)
  {
    for (const candidate_path& c: candidate_paths (env))
    {
      if (probe (c.path))
        return c.path;
    }

    for (const fs::path& f: env.fallbacks)
    {
      // A fallback we cannot even create is simply not an option.
      //
      error_code ec;
      fs::create_directories (f, ec);

      if (!ec && probe (f))
        return f;
    }

    throw no_install_path_error ();
  }
}
