#pragma once

#include <vector>
#include <functional>
#include <filesystem>

#include <installer/path/path-types.hxx>

namespace installer
{
  namespace fs = std::filesystem;

  // Return true if files can be created in the directory.
  //
  using writability_probe = std::function<bool (const fs::path&)>;

  // Create and delete a uniquely named file in the directory.
  //
  bool
  probe_writable (const fs::path&);

  // True for system directories we never install into (/usr/bin,
  // C:\Windows, and the like).
  //
  bool
  is_denied_path (const fs::path&, const install_environment&);

  // True if the directory is, or is below, one of the POSIX locations that
  // normally need elevated privileges (/usr/local, /usr/bin, /opt).
  //
  bool
  system_directory (const fs::path&);

  // Low for directories owned by a language runtime or package manager,
  // high for the home directory and the conventional tool directories,
  // normal otherwise.
  //
  priority_class
  classify_path (const fs::path&, const install_environment&);

  // PATH entries worth considering, cleaned, deduplicated, and ordered
  // high, normal, low (discovery order within a class).
  //
  std::vector<candidate_path>
  candidate_paths (const install_environment&);

  // Return the first writable candidate, then the first writable fallback
  // (created if absent). Throw no_install_path_error if there is none.
  //
  fs::path
  find_writable_install_path (const install_environment&,
                              const writability_probe& = probe_writable);
}
