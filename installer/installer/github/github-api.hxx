#pragma once

#include <string>
#include <optional>
#include <stdexcept>

#include <boost/asio.hpp>

#include <installer/http/http-client.hxx>
#include <installer/github/github-types.hxx>

namespace installer
{
  // Thrown when the API answers with anything but 200. The message includes
  // the status and, if the body carries one, GitHub's own message.
  //
  class github_error: public std::runtime_error
  {
  public:
    github_error (http_status s, const std::string& what)
      : std::runtime_error (what), status_ (s) {}

    http_status
    status () const noexcept {return status_;}

  private:
    http_status status_;
  };

  // GitHub REST API client, limited to what release installation needs.
  //
  class github_api
  {
  public:
    // If the token is absent, GITHUB_TOKEN is consulted.
    //
    explicit
    github_api (http_client& c,
                std::optional<std::string> token = std::nullopt,
                std::string base = "https://api.github.com");

    github_api (const github_api&) = delete;
    github_api& operator= (const github_api&) = delete;

    asio::awaitable<github_release>
    get_latest_release (const github_repository&);

    asio::awaitable<github_release>
    get_release_by_tag (const github_repository&, const std::string& tag);

    // Tag "latest" (or empty) means the latest release.
    //
    asio::awaitable<github_release>
    get_release (const github_repository&, const std::string& tag);

    const std::string&
    base () const noexcept {return base_;}

  private:
    asio::awaitable<json::value>
    get_json (const std::string& path);

    http_client& client_;
    std::optional<std::string> token_;
    std::string base_;
  };
}
