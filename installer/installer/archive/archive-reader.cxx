#include <installer/archive/archive-reader.hxx>

#include <installer/archive/archive-readers.hxx>

using namespace std;

namespace installer
{
  unique_ptr<archive_reader>
  open_archive (const fs::path& p, archive_format f)
  {
    switch (f)
    {
    case archive_format::zip:
      return make_unique<zip_reader> (p);

    case archive_format::tar:
    case archive_format::tar_gz:
    case archive_format::gz:
      return make_unique<stream_reader> (p, f);
    }

    throw unsupported_archive_error (p.extension ().string ());
  }
}
