#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <filesystem>

namespace installer
{
  // Built-in defaults for the command line. Options override them field by
  // field.
  //
  struct installer_config
  {
    std::uint64_t chunk_size  = 1024 * 1024;
    std::size_t   parallelism = 4;

    // Caller timeout for a whole download, in seconds.
    //
    std::uint32_t timeout = 300;

    std::string install_path = default_install_path ();
    std::string chmod = "755";

    static std::string
    default_install_path ();

    // Permissions for installed files, parsed from chmod.
    //
    std::filesystem::perms
    install_mode () const;

    // Throw std::invalid_argument if any of the values is unusable.
    //
    void
    validate () const;
  };
}
