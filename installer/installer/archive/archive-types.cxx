#include <installer/archive/archive-types.hxx>

#include <cctype>
#include <algorithm>

using namespace std;

namespace installer
{
  string
  to_string (archive_format f)
  {
    switch (f)
    {
    case archive_format::zip:    return "zip";
    case archive_format::tar:    return "tar";
    case archive_format::tar_gz: return "tar.gz";
    case archive_format::gz:     return "gz";
    }

    return string ();
  }

  static bool
  ends_with (const string& s, const char* x)
  {
    size_t n (char_traits<char>::length (x));
    return s.size () >= n && s.compare (s.size () - n, n, x) == 0;
  }

  optional<archive_format>
  archive_format_of (const fs::path& p)
  {
    string n (p.filename ().string ());
    transform (n.begin (), n.end (), n.begin (),
               [] (unsigned char c) {return static_cast<char> (tolower (c));});

    // Order matters: .tar.gz before .gz.
    //
    if (ends_with (n, ".zip"))
      return archive_format::zip;

    if (ends_with (n, ".tar.gz") || ends_with (n, ".tgz"))
      return archive_format::tar_gz;

    if (ends_with (n, ".tar"))
      return archive_format::tar;

    if (ends_with (n, ".gz"))
      return archive_format::gz;

    return nullopt;
  }

  archive_format
  detect_archive_format (const fs::path& p)
  {
    if (optional<archive_format> f = archive_format_of (p))
      return *f;

    string e (p.extension ().string ());
    throw unsupported_archive_error (e.empty () ? p.filename ().string () : e);
  }
}
