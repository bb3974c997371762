#include <installer/archive/archive-readers.hxx>

#include <cstring>

using namespace std;

namespace installer
{
  // Unix file type bits as stored in the upper half of the external
  // attributes by Info-ZIP and friends.
  //
  static const mz_uint32 unix_type_mask (0170000);
  static const mz_uint32 unix_symlink   (0120000);

  zip_reader::
  zip_reader (const fs::path& p)
    : path_ (p)
  {
    memset (&zip_, 0, sizeof (zip_));

    if (!mz_zip_reader_init_file (&zip_, p.string ().c_str (), 0))
      throw archive_error ("unable to open ZIP archive " + p.string () +
                           ": " + last_error ());

    count_ = mz_zip_reader_get_num_files (&zip_);
  }

  zip_reader::
  ~zip_reader ()
  {
    mz_zip_reader_end (&zip_);
  }

  string zip_reader::
  last_error ()
  {
    return mz_zip_get_error_string (mz_zip_get_last_error (&zip_));
  }

  optional<archive_entry> zip_reader::
  next ()
  {
    if (next_ >= count_)
    {
      current_ = nullopt;
      return nullopt;
    }

    mz_uint i (next_++);
    mz_zip_archive_file_stat s;

    if (!mz_zip_reader_file_stat (&zip_, i, &s))
      throw archive_error ("unable to read entry " + std::to_string (i) +
                           " of " + path_.string () + ": " + last_error ());

    archive_entry e;
    e.path = s.m_filename;
    e.size = s.m_uncomp_size;

    mz_uint32 ux (s.m_external_attr >> 16);
    bool posix ((s.m_version_made_by >> 8) == 3);

    if (mz_zip_reader_is_file_a_directory (&zip_, i))
      e.kind = entry_kind::directory;
    else if (posix && (ux & unix_type_mask) == unix_symlink)
      e.kind = entry_kind::other;
    else
      e.kind = entry_kind::file;

    // Archives made on Windows carry no permission bits at all.
    //
    e.mode = ux & 07777;
    if (e.mode == 0)
      e.mode = e.directory () ? 0755 : 0644;

    current_ = i;
    current_name_ = e.path;
    return e;
  }

  void zip_reader::
  extract (ostream& os)
  {
    if (!current_)
      throw archive_error ("no current entry in " + path_.string ());

    auto write = [] (void* o, mz_uint64, const void* b, size_t n) -> size_t
    {
      ostream& os (*static_cast<ostream*> (o));
      os.write (static_cast<const char*> (b), static_cast<streamsize> (n));
      return os ? n : 0;
    };

    if (!mz_zip_reader_extract_to_callback (&zip_, *current_, write, &os, 0))
    {
      if (!os)
        throw runtime_error ("unable to write '" + current_name_ + "'");

      throw archive_error ("unable to extract '" + current_name_ +
                           "' from " + path_.string () + ": " +
                           last_error ());
    }
  }
}
