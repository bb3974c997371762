#include <installer/installer-config.hxx>

#include <stdexcept>

#include <installer/install/install-permissions.hxx>

using namespace std;

namespace installer
{
  string installer_config::
  default_install_path ()
  {
#ifdef _WIN32
    return "C:\\Program Files\\pyhub-installer";
#else
    return "/usr/local/bin";
#endif
  }

  fs::perms installer_config::
  install_mode () const
  {
    return parse_chmod (chmod);
  }

  void installer_config::
  validate () const
  {
    if (chunk_size == 0)
      throw invalid_argument ("chunk size must be positive");

    if (parallelism == 0)
      throw invalid_argument ("number of jobs must be positive");

    if (timeout == 0)
      throw invalid_argument ("timeout must be positive");

    if (install_path.empty ())
      throw invalid_argument ("default install path must not be empty");

    parse_chmod (chmod); // Throws if invalid.
  }
}
