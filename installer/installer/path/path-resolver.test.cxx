#include <installer/path/path-types.hxx>
#include <installer/path/path-resolver.hxx>

#include <cassert>
#include <random>
#include <string>
#include <vector>
#include <filesystem>

using namespace std;
using namespace installer;

namespace fs = std::filesystem;

static install_environment
posix_env (vector<string> path)
{
  install_environment e;
  e.os = "linux";
  e.home = "/home/u";
  e.path_entries = move (path);
  return e;
}

static vector<string>
candidate_strings (const install_environment& e)
{
  vector<string> r;
  for (const candidate_path& c: candidate_paths (e))
    r.push_back (c.path.string ());
  return r;
}

static void
test_split ()
{
  vector<string> r (split_path_list ("/a:/b::/c", false));
  assert ((r == vector<string> {"/a", "/b", "", "/c"}));

  r = split_path_list ("C:\\a;C:\\b", true);
  assert ((r == vector<string> {"C:\\a", "C:\\b"}));

  r = split_path_list ("", false);
  assert ((r == vector<string> {""}));
}

static void
test_denied ()
{
  install_environment e (posix_env ({}));

  assert (is_denied_path ("/usr/bin", e));
  assert (is_denied_path ("/usr/bin/", e));
  assert (is_denied_path ("/bin", e));
  assert (is_denied_path ("/sbin", e));
  assert (is_denied_path ("/System/Cryptexes/App/usr/bin", e));
  assert (is_denied_path ("/snap/bin", e));

  assert (!is_denied_path ("/usr/local/bin", e));
  assert (!is_denied_path ("/binary", e));
  assert (!is_denied_path ("/home/u/bin", e));
}

// Only whole leading segments make a system directory.
//
static void
test_system ()
{
  assert (system_directory ("/usr/local/bin"));
  assert (system_directory ("/usr/local/bin/"));
  assert (system_directory ("/usr/local/share/tool"));
  assert (system_directory ("/usr/bin"));
  assert (system_directory ("/opt"));
  assert (system_directory ("/opt/tool/bin"));

  assert (!system_directory ("/optical"));
  assert (!system_directory ("/usr/binaries"));
  assert (!system_directory ("/usr/localized"));
  assert (!system_directory ("/home/u/opt"));
  assert (!system_directory ("."));
}

static void
test_classify ()
{
  install_environment e (posix_env ({}));

  assert (classify_path ("/home/u/.local/bin", e) == priority_class::high);
  assert (classify_path ("/home/u/bin", e) == priority_class::high);
  assert (classify_path ("/usr/local/bin", e) == priority_class::high);
  assert (classify_path ("/opt/homebrew/bin", e) == priority_class::high);

  assert (classify_path ("/opt/tools/bin", e) == priority_class::normal);
  assert (classify_path ("/home/user2/bin", e) == priority_class::normal);

  // Ecosystem directories lose even under the home directory.
  //
  assert (classify_path ("/home/u/.cargo/bin", e) == priority_class::low);
  assert (classify_path ("/home/u/.pyenv/shims", e) == priority_class::low);
  assert (classify_path ("/home/u/proj/.venv/bin", e) == priority_class::low);
  assert (classify_path ("/opt/miniconda3/bin", e) == priority_class::low);
  assert (classify_path ("/usr/lib/node_modules/.bin", e) ==
          priority_class::low);
  assert (classify_path ("/usr/local/lib/python3.12/site-packages", e) ==
          priority_class::low);
}

static void
test_candidates ()
{
  install_environment e (posix_env ({
    "/home/u/.cargo/bin",
    "/usr/bin",
    "",
    ".",
    "/opt/tools/bin",
    "/home/u/.local/bin",
    "/usr/local/bin",
    "/home/u/.local/bin/",
    "~/bin",
    "relative/bin",
    "/home/u/.pyenv/shims",
    "/usr/local/bin"}));

  vector<string> r (candidate_strings (e));

  assert ((r == vector<string> {
    "/home/u/.local/bin",
    "/usr/local/bin",
    "/home/u/bin",
    "/opt/tools/bin",
    "/home/u/.cargo/bin",
    "/home/u/.pyenv/shims"}));

  vector<candidate_path> cs (candidate_paths (e));
  assert (cs[2].priority == priority_class::high);
  assert (cs[3].priority == priority_class::normal);
  assert (cs[5].priority == priority_class::low);
}

static void
test_windows ()
{
  install_environment e;
  e.os = "windows";
  e.home = "C:\\Users\\Me";
  e.path_entries = {
    "C:\\Windows\\System32",
    "c:\\windows",
    "\"C:\\Users\\Me\\AppData\\Local\\Microsoft\\WindowsApps\"",
    "D:\\Tools",
    "C:\\ProgramData\\chocolatey\\bin",
    "C:\\USERS\\ME\\bin",
    "bin"};

  assert (is_denied_path ("C:\\Windows\\System32", e));
  assert (is_denied_path ("C:/WINDOWS", e));
  assert (!is_denied_path ("C:\\WindowsTools", e));

  vector<candidate_path> cs (candidate_paths (e));

  assert (cs.size () == 4);
  assert (cs[0].path.string () == "C:\\ProgramData\\chocolatey\\bin");
  assert (cs[1].path.string () == "C:\\USERS\\ME\\bin");
  assert (cs[2].path.string () == "D:\\Tools");
  assert (cs[3].priority == priority_class::low);
}

static void
test_find ()
{
  install_environment e (posix_env ({
    "/home/u/.cargo/bin",
    "/opt/tools/bin",
    "/home/u/.local/bin"}));

  // User directory before the package manager one.
  //
  assert (find_writable_install_path (e, [] (const fs::path&)
  {
    return true;
  }) == "/home/u/.local/bin");

  assert (find_writable_install_path (e, [] (const fs::path& p)
  {
    return p != "/home/u/.local/bin";
  }) == "/opt/tools/bin");

  assert (find_writable_install_path (e, [] (const fs::path& p)
  {
    return p == "/home/u/.cargo/bin";
  }) == "/home/u/.cargo/bin");
}

static void
test_fallback ()
{
  random_device rd;
  fs::path d (fs::temp_directory_path () /
              ("installer-path-" + to_string (rd ())));

  install_environment e (posix_env ({"/opt/readonly/bin"}));
  e.fallbacks = {d / ".local" / "bin", d / "bin"};

  fs::path r (find_writable_install_path (e, [&d] (const fs::path& p)
  {
    return p == d / "bin";
  }));

  assert (r == d / "bin");
  assert (fs::is_directory (d / ".local" / "bin"));
  assert (fs::is_directory (d / "bin"));

  // Nothing works.
  //
  bool thrown (false);
  try
  {
    find_writable_install_path (e, [] (const fs::path&) {return false;});
  }
  catch (const no_install_path_error& x)
  {
    thrown = true;
    assert (string (x.what ()) == "no writable installation directory found");
  }
  assert (thrown);

  fs::remove_all (d);
}

static void
test_probe ()
{
  random_device rd;
  fs::path d (fs::temp_directory_path () /
              ("installer-probe-" + to_string (rd ())));

  assert (!probe_writable (d));

  fs::create_directories (d);
  assert (probe_writable (d));
  assert (fs::is_empty (d));

  fs::remove_all (d);
}

static void
test_current ()
{
  install_environment e (install_environment::current ());

  assert (e.os == current_os ());
  assert (!e.path_entries.empty ());
}

int
main ()
{
  test_split ();
  test_denied ();
  test_system ();
  test_classify ();
  test_candidates ();
  test_windows ();
  test_find ();
  test_fallback ();
  test_probe ();
  test_current ();
}
