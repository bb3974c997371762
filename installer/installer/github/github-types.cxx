#include <installer/github/github-types.hxx>

#include <map>
#include <cctype>
#include <stdexcept>
#include <algorithm>

using namespace std;

namespace installer
{
  optional<github_release::asset_type> github_release::
  find_asset (const std::string& n) const
  {
    auto i (find_if (assets.begin (),
                     assets.end (),
                     [&n] (const asset_type& a)
    {
      return a.name == n;
    }));

    return i != assets.end () ? optional<asset_type> (*i) : nullopt;
  }

  static string
  lower (string s)
  {
    transform (s.begin (), s.end (), s.begin (),
               [] (unsigned char c) {return static_cast<char> (tolower (c));});
    return s;
  }

  static bool
  ends_with (const string& s, const string& x)
  {
    return s.size () >= x.size () &&
           s.compare (s.size () - x.size (), x.size (), x) == 0;
  }

  github_repository
  parse_repository (const string& id)
  {
    string s (id);

    if (s.compare (0, 7, "github:") == 0)
      s.erase (0, 7);

    size_t p (s.find ("github.com/"));
    if (p != string::npos)
    {
      s.erase (0, p + 11);

      if (s.find ("github.com/") != string::npos)
        throw invalid_argument ("invalid GitHub URL: " + id);
    }

    size_t b (s.find_first_not_of ('/'));
    size_t e (s.find_last_not_of ('/'));
    s = b == string::npos ? string () : s.substr (b, e - b + 1);

    size_t sl (s.find ('/'));

    if (sl == string::npos ||
        sl == 0 ||
        sl + 1 == s.size () ||
        s.find ('/', sl + 1) != string::npos)
      throw invalid_argument ("invalid repository '" + id +
                              "' (expected owner/repo)");

    return github_repository {s.substr (0, sl), s.substr (sl + 1)};
  }

  github_asset
  parse_asset (const json::value& jv)
  {
    github_asset a;

    if (jv.is_object ())
    {
      const auto& obj (jv.as_object ());

      if (obj.contains ("name"))
        a.name = json::value_to<string> (obj.at ("name"));

      if (obj.contains ("browser_download_url"))
        a.browser_download_url =
          json::value_to<string> (obj.at ("browser_download_url"));

      if (obj.contains ("size"))
        a.size = json::value_to<uint64_t> (obj.at ("size"));
    }

    return a;
  }

  github_release
  parse_release (const json::value& jv)
  {
    github_release r;

    if (jv.is_object ())
    {
      const auto& obj (jv.as_object ());

      if (obj.contains ("tag_name"))
        r.tag_name = json::value_to<string> (obj.at ("tag_name"));

      if (obj.contains ("name") && !obj.at ("name").is_null ())
        r.name = json::value_to<string> (obj.at ("name"));

      if (obj.contains ("assets") && obj.at ("assets").is_array ())
      {
        for (const auto& a: obj.at ("assets").as_array ())
          r.assets.push_back (parse_asset (a));
      }
    }

    return r;
  }

  string
  current_platform_key ()
  {
#if defined(_WIN32)
    string os ("windows");
#elif defined(__APPLE__)
    string os ("darwin");
#else
    string os ("linux");
#endif

#if defined(__x86_64__) || defined(_M_X64)
    string arch ("amd64");
#elif defined(__aarch64__) || defined(_M_ARM64)
    string arch ("arm64");
#elif defined(__i386__) || defined(_M_IX86)
    string arch ("386");
#elif defined(__arm__) || defined(_M_ARM)
    string arch ("arm");
#else
    string arch ("unknown");
#endif

    return os + '-' + arch;
  }

  const vector<string>&
  platform_keywords (const string& p)
  {
    static const map<string, vector<string>> m {
      {"windows-amd64", {"windows", "win64", "amd64", "x86_64"}},
      {"windows-386",   {"windows", "win32", "386", "i386"}},
      {"darwin-amd64",  {"darwin", "macos", "osx", "amd64", "x86_64"}},
      {"darwin-arm64",  {"darwin", "macos", "osx", "arm64", "aarch64"}},
      {"linux-amd64",   {"linux", "amd64", "x86_64"}},
      {"linux-386",     {"linux", "386", "i386"}},
      {"linux-arm64",   {"linux", "arm64", "aarch64"}},
      {"linux-arm",     {"linux", "arm", "armv7"}}};

    static const vector<string> none;

    auto i (m.find (p));
    return i != m.end () ? i->second : none;
  }

  int
  score_asset (const string& name, const vector<string>& kw)
  {
    string n (lower (name));
    int r (0);

    for (const string& k: kw)
    {
      if (n.find (lower (k)) != string::npos)
        ++r;
    }

    if (ends_with (n, ".zip") || ends_with (n, ".tar.gz"))
      ++r;

    if (n.find ("source") != string::npos || n.find ("src") != string::npos)
      r -= 10;

    return r;
  }

  const github_asset&
  select_platform_asset (const github_release& r, const string& platform)
  {
    string p (platform.empty () ? current_platform_key () : platform);
    const vector<string>& kw (platform_keywords (p));

    if (kw.empty ())
      throw runtime_error ("unsupported platform: " + p);

    const github_asset* best (nullptr);
    int bs (0);

    for (const github_asset& a: r.assets)
    {
      int s (score_asset (a.name, kw));

      if (s > bs)
      {
        bs = s;
        best = &a;
      }
    }

    if (best == nullptr)
      throw runtime_error ("no asset found for platform " + p + " in " +
                           "release " + r.tag_name);

    return *best;
  }

  optional<github_asset>
  find_signature_asset (const github_release& r, const string& asset)
  {
    string base (asset);
    {
      size_t d (base.rfind ('.'));
      if (d != string::npos && d != 0)
        base.resize (d);
    }

    const string candidates[] = {
      asset + ".sha256",
      asset + ".sha256sum",
      asset + ".sig",
      base + ".sha256",
      base + ".sha256sum",
      "checksums.txt",
      "CHECKSUMS",
      "SHA256SUMS"};

    for (const string& c: candidates)
    {
      string lc (lower (c));

      for (const github_asset& a: r.assets)
      {
        if (lower (a.name) == lc)
          return a;
      }
    }

    return nullopt;
  }
}
