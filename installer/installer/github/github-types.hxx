#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <optional>

#include <boost/json.hpp>

namespace installer
{
  namespace json = boost::json;

  // GitHub release asset.
  //
  struct github_asset
  {
    std::string name;
    std::string browser_download_url;
    std::uint64_t size {0};

    github_asset () = default;

    github_asset (std::string n, std::string u, std::uint64_t s)
      : name (std::move (n)), browser_download_url (std::move (u)), size (s) {}

    bool
    empty () const {return name.empty ();}
  };

  // GitHub release.
  //
  struct github_release
  {
    using asset_type = github_asset;

    std::string tag_name;
    std::string name;
    std::vector<asset_type> assets;

    github_release () = default;

    github_release (std::string t, std::string n)
      : tag_name (std::move (t)), name (std::move (n)) {}

    bool
    empty () const {return tag_name.empty ();}

    // Find asset by exact name.
    //
    std::optional<asset_type>
    find_asset (const std::string& name) const;
  };

  // Repository identifier.
  //
  struct github_repository
  {
    std::string owner;
    std::string name;

    std::string
    string () const {return owner + '/' + name;}
  };

  inline std::ostream&
  operator<< (std::ostream& os, const github_repository& r)
  {
    return os << r.owner << '/' << r.name;
  }

  // Parse owner/repo, github:owner/repo, or https://github.com/owner/repo
  // (trailing slash allowed). Throw std::invalid_argument otherwise.
  //
  github_repository
  parse_repository (const std::string&);

  // Decode the REST API representations. Missing fields are left empty.
  //
  github_asset
  parse_asset (const json::value&);

  github_release
  parse_release (const json::value&);

  // Platform key (os-arch, e.g. linux-amd64) of the running binary.
  //
  std::string
  current_platform_key ();

  // Keywords that identify assets built for the platform. Empty if we
  // don't know the platform.
  //
  const std::vector<std::string>&
  platform_keywords (const std::string& platform);

  // How well the asset name matches the keywords: one point per keyword it
  // contains, one for a .zip or .tar.gz archive, minus ten if it looks like
  // a source archive.
  //
  int
  score_asset (const std::string& name, const std::vector<std::string>& kw);

  // Return the best scoring asset for the platform (the running one if
  // empty). Throw std::runtime_error if the platform is unknown or nothing
  // scores above zero.
  //
  const github_asset&
  select_platform_asset (const github_release&, const std::string& platform);

  // Return the checksum or signature asset that goes with the asset, if
  // the release has one.
  //
  std::optional<github_asset>
  find_signature_asset (const github_release&, const std::string& asset);
}
