#include <installer/archive/archive-extractor.hxx>

#include <map>
#include <set>
#include <vector>
#include <utility>
#include <iterator>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace installer
{
  // Position of the first real segment: past any run of '/' and "./".
  //
  static size_t
  segment_start (const string& s)
  {
    size_t p (0);

    while (p < s.size ())
    {
      if (s[p] == '/')
        ++p;
      else if (s[p] == '.' && (p + 1 == s.size () || s[p + 1] == '/'))
        p += 1;
      else
        break;
    }

    return p;
  }

  string
  top_level_segment (const string& s)
  {
    size_t b (segment_start (s));
    size_t e (s.find ('/', b));

    return s.substr (b, e == string::npos ? string::npos : e - b);
  }

  string
  strip_top_level (const string& s)
  {
    size_t b (segment_start (s));
    size_t e (s.find ('/', b));

    return e == string::npos ? string () : s.substr (e + 1);
  }

  optional<fs::path>
  resolve_entry_path (const fs::path& root, const string& entry)
  {
    const char sep (fs::path::preferred_separator);

    size_t b (entry.find_first_not_of ('/'));
    string n (b == string::npos ? string () : entry.substr (b));

    string t (n.empty ()
              ? root.string ()
              : (root / fs::path (n)).lexically_normal ().string ());

    string r (root.string ());

    while (t.size () > r.size () && (t.back () == sep || t.back () == '/'))
      t.pop_back ();

    if (t == r)
      return nullopt;

    if (r.back () != sep)
      r += sep;

    if (t.compare (0, r.size (), r) != 0)
      throw path_traversal_error (entry);

    return fs::path (t);
  }

  static void
  set_mode (const fs::path& p, uint32_t m)
  {
#ifndef _WIN32
    error_code ec;
    fs::permissions (p,
                     static_cast<fs::perms> (m & 07777),
                     fs::perm_options::replace,
                     ec);

    if (ec)
      throw runtime_error ("unable to set permissions of " + p.string () +
                           ": " + ec.message ());
#else
    (void) p;
    (void) m;
#endif
  }

  // Create the missing directories leading up to and including d, each with
  // mode 0755.
  //
  static void
  create_parents (const fs::path& d)
  {
    if (d.empty () || fs::is_directory (d))
      return;

    create_parents (d.parent_path ());

    error_code ec;
    fs::create_directory (d, ec);

    if (ec)
      throw runtime_error ("unable to create directory " + d.string () +
                           ": " + ec.message ());

    set_mode (d, 0755);
  }

  // Directory modes are applied once everything has been written, deepest
  // first, so that a read-only directory does not stop us from populating
  // it.
  //
  using directory_modes = map<fs::path, uint32_t>;

  static void
  make_directory (const fs::path& d, uint32_t m, directory_modes& ms)
  {
    if (fs::is_directory (d))
    {
      // Left over from a previous extraction, possibly read-only.
      //
#ifndef _WIN32
      error_code ec;
      fs::permissions (d, fs::perms::owner_all, fs::perm_options::add, ec);

      if (ec)
        throw runtime_error ("unable to make " + d.string () +
                             " writable: " + ec.message ());
#endif
    }
    else
    {
      create_parents (d.parent_path ());

      error_code ec;
      fs::create_directory (d, ec);

      if (ec)
        throw runtime_error ("unable to create directory " + d.string () +
                             ": " + ec.message ());

      set_mode (d, 0755);
    }

    ms[d] = m != 0 ? m : 0755;
  }

  static void
  apply_directory_modes (const directory_modes& ms)
  {
    vector<pair<fs::path, uint32_t>> v (ms.begin (), ms.end ());

    auto depth = [] (const fs::path& p)
    {
      return distance (p.begin (), p.end ());
    };

    stable_sort (v.begin (), v.end (),
                 [&depth] (const auto& x, const auto& y)
                 {
                   return depth (x.first) > depth (y.first);
                 });

    for (const auto& d: v)
      set_mode (d.first, d.second);
  }

  // Remove the file unless released. Keeps a failed entry from looking like
  // a complete one.
  //
  struct partial_file
  {
    fs::path path;
    bool released = false;

    ~partial_file ()
    {
      if (!released)
      {
        error_code ec;
        fs::remove (path, ec);
      }
    }
  };

  static void
  write_file (const fs::path& f, uint32_t m, archive_reader& r)
  {
    create_parents (f.parent_path ());

    // Replace rather than write through: the old file may be read-only or
    // a symlink pointing who knows where.
    //
    error_code ec;
    if (fs::exists (fs::symlink_status (f, ec)))
    {
      fs::remove (f, ec);

      if (ec)
        throw runtime_error ("unable to replace " + f.string () + ": " +
                             ec.message ());
    }

    partial_file pf {f};

    // Declared after the guard so that it is closed before the removal.
    //
    ofstream ofs (f, ios::binary | ios::trunc);
    if (!ofs)
      throw runtime_error ("unable to create " + f.string ());

    r.extract (ofs);

    ofs.close ();
    if (!ofs)
      throw runtime_error ("unable to write " + f.string ());

    set_mode (f, m != 0 ? m : 0644);
    pf.released = true;
  }

  extraction_result
  extract_archive (const fs::path& dest,
                   flatten_mode fm,
                   const archive_reader_factory& open)
  {
    fs::path root (fs::absolute (dest).lexically_normal ());

    if (!root.has_filename () && root.has_relative_path ())
      root = root.parent_path ();

    {
      error_code ec;
      fs::create_directories (root, ec);

      if (ec)
        throw runtime_error ("unable to create directory " + root.string () +
                             ": " + ec.message ());
    }

    extraction_result r;

    // First pass: collect the distinct top-level segments.
    //
    if (fm != flatten_mode::never)
    {
      set<string> tops;

      unique_ptr<archive_reader> rd (open ());
      while (optional<archive_entry> e = rd->next ())
      {
        string s (top_level_segment (e->path));

        if (!s.empty ())
          tops.insert (move (s));
      }

      r.flattened = fm == flatten_mode::always || tops.size () == 1;

      if (r.flattened && tops.size () == 1)
        r.flattened_directory = *tops.begin ();
    }

    // Second pass: write.
    //
    directory_modes dms;

    unique_ptr<archive_reader> rd (open ());
    while (optional<archive_entry> e = rd->next ())
    {
      string n (r.flattened ? strip_top_level (e->path) : e->path);

      optional<fs::path> p;
      if (!n.empty ())
        p = resolve_entry_path (root, n);

      // The wrapper directory itself, or the root's own marker.
      //
      if (!p)
      {
        ++r.skipped;
        continue;
      }

      switch (e->kind)
      {
      case entry_kind::directory:
        {
          make_directory (*p, e->mode, dms);
          ++r.directories;
          break;
        }
      case entry_kind::file:
        {
          write_file (*p, e->mode, *rd);
          ++r.files;
          break;
        }
      case entry_kind::other:
        {
          ++r.skipped;
          break;
        }
      }
    }

    apply_directory_modes (dms);

    return r;
  }

  extraction_result
  extract_archive (const extraction_plan& p)
  {
    archive_format f (detect_archive_format (p.archive));

    flatten_mode fm (f == archive_format::gz
                     ? flatten_mode::never
                     : p.flatten);

    return extract_archive (p.destination,
                            fm,
                            [&p, f] () {return open_archive (p.archive, f);});
  }
}
