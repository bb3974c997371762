#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <stdexcept>
#include <filesystem>

namespace installer
{
  namespace fs = std::filesystem;

  // Snapshot of the environment the path resolver works against.
  //
  // Captured from the running process by current() or built by hand, which
  // is what makes the resolver testable without touching the real PATH.
  //
  struct install_environment
  {
    std::vector<std::string> path_entries; // As found in PATH, in order.
    fs::path home;
    std::string os;                        // linux, darwin, or windows.
    std::vector<fs::path> fallbacks;       // Tried when PATH has nothing.

    bool
    windows () const noexcept {return os == "windows";}

    static install_environment
    current ();
  };

  // Name of the operating system we were built for.
  //
  std::string
  current_os ();

  // Split a PATH-style list on ';' (Windows) or ':' (everything else).
  // Empty elements are preserved.
  //
  std::vector<std::string>
  split_path_list (const std::string&, bool windows);

  enum class priority_class
  {
    high,
    normal,
    low
  };

  inline std::ostream&
  operator<< (std::ostream& os, priority_class p)
  {
    switch (p)
    {
    case priority_class::high:   return os << "high";
    case priority_class::normal: return os << "normal";
    case priority_class::low:    return os << "low";
    }
    return os;
  }

  struct candidate_path
  {
    fs::path       path;
    priority_class priority;
  };

  class no_install_path_error: public std::runtime_error
  {
  public:
    no_install_path_error ()
      : std::runtime_error ("no writable installation directory found") {}
  };
}
