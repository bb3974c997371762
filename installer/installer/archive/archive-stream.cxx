#include <installer/archive/archive-readers.hxx>

#include <cctype>

#include <archive.h>
#include <archive_entry.h>

using namespace std;

namespace installer
{
  string
  gzip_member_name (const fs::path& a)
  {
    string n (a.filename ().string ());

    if (n.size () > 3)
    {
      string s (n, n.size () - 3);
      for (char& c: s)
        c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

      if (s == ".gz")
        n.resize (n.size () - 3);
    }

    return n;
  }

  stream_reader::
  stream_reader (const fs::path& p, archive_format f)
    : path_ (p), format_ (f)
  {
    a_ = archive_read_new ();

    if (a_ == nullptr)
      throw archive_error ("unable to allocate archive reader for " +
                           p.string ());

    // Only enable what the suffix promised. A .tar that turns out to be
    // something else is an error, not a guess.
    //
    switch (f)
    {
    case archive_format::tar:
      {
        archive_read_support_format_tar (a_);
        break;
      }
    case archive_format::tar_gz:
      {
        archive_read_support_filter_gzip (a_);
        archive_read_support_format_tar (a_);
        break;
      }
    case archive_format::gz:
      {
        archive_read_support_filter_gzip (a_);
        archive_read_support_format_raw (a_);
        break;
      }
    case archive_format::zip:
      {
        archive_read_free (a_);
        throw archive_error ("ZIP archive " + p.string () +
                             " passed to the stream reader");
      }
    }

#ifdef _WIN32
    int r (archive_read_open_filename_w (a_, p.c_str (), 64 * 1024));
#else
    int r (archive_read_open_filename (a_, p.c_str (), 64 * 1024));
#endif

    if (r != ARCHIVE_OK)
    {
      string e (archive_error_string (a_) != nullptr
                ? archive_error_string (a_)
                : "unrecognized archive");

      archive_read_free (a_);
      throw archive_error ("unable to open " + p.string () + ": " + e);
    }
  }

  stream_reader::
  ~stream_reader ()
  {
    archive_read_free (a_);
  }

  void stream_reader::
  fail (const string& what)
  {
    const char* e (archive_error_string (a_));

    throw archive_error (what + " in " + path_.string () +
                         (e != nullptr ? string (": ") + e : string ()));
  }

  optional<archive_entry> stream_reader::
  next ()
  {
    if (done_)
      return nullopt;

    struct ::archive_entry* ae (nullptr);
    int r (archive_read_next_header (a_, &ae));

    if (r == ARCHIVE_EOF)
    {
      done_ = true;
      return nullopt;
    }

    // ARCHIVE_WARN covers things like unmappable owner names which do not
    // concern us.
    //
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN)
      fail ("unable to read entry header");

    archive_entry e;

    if (format_ == archive_format::gz)
    {
      // The raw format reads anything, so make sure there actually was a
      // gzip stream underneath.
      //
      if (archive_filter_code (a_, 0) != ARCHIVE_FILTER_GZIP)
        throw archive_error (path_.string () + " is not gzip-compressed");

      e.path = gzip_member_name (path_);
      e.kind = entry_kind::file;
      e.mode = 0644;
      return e;
    }

    const char* n (archive_entry_pathname (ae));

    if (n == nullptr)
      fail ("entry with unreadable name");

    e.path = n;
    e.mode = static_cast<uint32_t> (archive_entry_perm (ae));
    e.size = static_cast<uint64_t> (archive_entry_size (ae));

    // A hard link is reported as a regular file with a link target.
    //
    if (archive_entry_hardlink (ae) != nullptr)
      e.kind = entry_kind::other;
    else
    {
      switch (archive_entry_filetype (ae))
      {
      case AE_IFREG: e.kind = entry_kind::file;      break;
      case AE_IFDIR: e.kind = entry_kind::directory; break;
      default:       e.kind = entry_kind::other;     break;
      }
    }

    return e;
  }

  void stream_reader::
  extract (ostream& os)
  {
    char b[64 * 1024];

    for (;;)
    {
      la_ssize_t n (archive_read_data (a_, b, sizeof (b)));

      if (n == 0)
        break;

      if (n < 0)
        fail ("unable to read entry data");

      os.write (b, static_cast<streamsize> (n));

      if (!os)
        throw runtime_error ("unable to write data extracted from " +
                             path_.string ());
    }
  }
}
