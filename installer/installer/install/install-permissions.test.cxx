#include <installer/install/install-permissions.hxx>

#include <cassert>
#include <random>
#include <string>
#include <vector>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <filesystem>

using namespace std;
using namespace installer;

namespace fs = std::filesystem;

static fs::path
make_temp_dir ()
{
  random_device rd;
  fs::path d (fs::temp_directory_path () /
              ("installer-install-" + to_string (rd ())));
  fs::create_directories (d);
  return d;
}

static void
write_file (const fs::path& p, const string& s)
{
  fs::create_directories (p.parent_path ());
  ofstream ofs (p, ios::binary | ios::trunc);
  ofs << s;
  assert (ofs);
}

static string
read_file (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  return string (istreambuf_iterator<char> (ifs), istreambuf_iterator<char> ());
}

static void
test_parse ()
{
  assert (parse_chmod ("755") == static_cast<fs::perms> (0755));
  assert (parse_chmod ("644") == static_cast<fs::perms> (0644));
  assert (parse_chmod ("000") == fs::perms::none);
  assert (parse_chmod ("rwxr-xr-x") == static_cast<fs::perms> (0755));
  assert (parse_chmod ("rw-r-----") == static_cast<fs::perms> (0640));
  assert (parse_chmod ("---------") == fs::perms::none);

  for (const char* s: {"", "75", "7555", "788", "abc", "rwxr-xr-", "rwxr-xr-xx",
                       "xwrr-xr-x", "rwsr-xr-x", "0755"})
  {
    bool thrown (false);
    try
    {
      parse_chmod (s);
    }
    catch (const invalid_argument&)
    {
      thrown = true;
    }
    assert (thrown);
  }
}

static void
test_install_file ()
{
  fs::path d (make_temp_dir ());

  write_file (d / "src" / "tool", "#!/bin/sh\n");

  fs::path t (install_file (d / "src" / "tool",
                            d / "bin",
                            parse_chmod ("755")));

  assert (t == d / "bin" / "tool");
  assert (read_file (t) == "#!/bin/sh\n");

#ifndef _WIN32
  assert ((fs::status (t).permissions () & fs::perms::mask) ==
          static_cast<fs::perms> (0755));
#endif

  // Replace an existing copy.
  //
  write_file (d / "src" / "tool", "#!/bin/sh\necho 2\n");
  install_file (d / "src" / "tool", d / "bin", parse_chmod ("700"));
  assert (read_file (t) == "#!/bin/sh\necho 2\n");

#ifndef _WIN32
  assert ((fs::status (t).permissions () & fs::perms::mask) ==
          static_cast<fs::perms> (0700));
#endif

  bool thrown (false);
  try
  {
    install_file (d / "src" / "missing", d / "bin", parse_chmod ("755"));
  }
  catch (const runtime_error&)
  {
    thrown = true;
  }
  assert (thrown);

  fs::remove_all (d);
}

static void
test_install_directory ()
{
  fs::path d (make_temp_dir ());

  write_file (d / "src" / "tool", "tool");
  write_file (d / "src" / "lib" / "helper", "helper");
  fs::create_directories (d / "src" / "empty");

  vector<fs::path> r (install_directory (d / "src",
                                         d / "dst",
                                         parse_chmod ("755")));

  assert (r.size () == 2);
  assert (read_file (d / "dst" / "tool") == "tool");
  assert (read_file (d / "dst" / "lib" / "helper") == "helper");
  assert (fs::is_directory (d / "dst" / "empty"));

  vector<fs::path> x (find_executables (d / "dst"));

#ifndef _WIN32
  assert (x.size () == 2);
  assert (x[0] == d / "dst" / "lib" / "helper");
  assert (x[1] == d / "dst" / "tool");
#endif

  bool thrown (false);
  try
  {
    install_directory (d / "nowhere", d / "dst", parse_chmod ("755"));
  }
  catch (const runtime_error&)
  {
    thrown = true;
  }
  assert (thrown);

  fs::remove_all (d);
}

static void
test_find_executables ()
{
  fs::path d (make_temp_dir ());

  write_file (d / "a.exe", "");
  write_file (d / "run.sh", "");
  write_file (d / "README", "");

#ifndef _WIN32
  apply_permissions (d / "run.sh", parse_chmod ("755"));
  apply_permissions (d / "README", parse_chmod ("644"));
  apply_permissions (d / "a.exe", parse_chmod ("644"));

  vector<fs::path> x (find_executables (d));
  assert (x.size () == 1);
  assert (x[0] == d / "run.sh");
#else
  vector<fs::path> x (find_executables (d));
  assert (x.size () == 1);
  assert (x[0] == d / "a.exe");
#endif

  assert (find_executables (d / "missing").empty ());

  fs::remove_all (d);
}

int
main ()
{
  test_parse ();
  test_install_file ();
  test_install_directory ();
  test_find_executables ();
}
