#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace installer
{
  namespace fs = std::filesystem;

  // Parse a permission specification, either three octal digits ("755") or
  // nine symbolic characters ("rwxr-xr-x"). Throw std::invalid_argument
  // otherwise.
  //
  fs::perms
  parse_chmod (const std::string&);

  // Apply the permissions to the path. A no-op on Windows.
  //
  void
  apply_permissions (const fs::path&, fs::perms);

  // Copy the file into the directory (created if absent), replacing an
  // existing file of the same name, and apply the permissions. Return the
  // installed path.
  //
  fs::path
  install_file (const fs::path& file, const fs::path& dir, fs::perms);

  // Mirror the directory tree under the destination, installing every
  // regular file with the permissions. Return the installed files.
  //
  std::vector<fs::path>
  install_directory (const fs::path& src, const fs::path& dst, fs::perms);

  // True if the file looks executable: any execute bit on POSIX, a known
  // extension on Windows.
  //
  bool
  executable_file (const fs::path&);

  // Regular executable files anywhere under the directory, in path order.
  //
  std::vector<fs::path>
  find_executables (const fs::path& dir);
}
