#pragma once

#include <string>

#include <boost/asio.hpp>

#include <installer/installer-config.hxx>
#include <installer/installer-options.hxx>

#include <installer/http/http-client.hxx>

namespace installer
{
  namespace asio = boost::asio;

  // The install command: resolve the release, download the platform asset,
  // verify it if the release publishes a checksum, and install its contents.
  // Return the exit status.
  //
  asio::awaitable<int>
  run_install (http_client&,
               const std::string& repository,
               const install_options&,
               const installer_config&);
}
