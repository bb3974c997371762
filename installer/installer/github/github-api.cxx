#include <installer/github/github-api.hxx>

#include <cstdlib>

using namespace std;

namespace installer
{
  github_api::
  github_api (http_client& c, optional<string> t, string b)
    : client_ (c), token_ (move (t)), base_ (move (b))
  {
    if (!token_)
    {
      if (const char* v = getenv ("GITHUB_TOKEN"))
      {
        if (*v != '\0')
          token_ = v;
      }
    }

    while (!base_.empty () && base_.back () == '/')
      base_.pop_back ();
  }

  asio::awaitable<json::value> github_api::
  get_json (const string& path)
  {
    http_request req (http_method::get, base_ + path);

    req.set_header ("Accept", "application/vnd.github+json");
    req.set_header ("X-GitHub-Api-Version", "2022-11-28");

    if (token_)
      req.set_header ("Authorization", "Bearer " + *token_);

    http_response r (co_await client_.request (move (req)));

    if (r.status != http_status::ok)
    {
      string m ("GitHub API request " + path + " failed with status " +
                std::to_string (r.status_code ()));

      // Pass GitHub's explanation along if it is there (rate limiting and
      // the like).
      //
      if (r.body)
      {
        boost::system::error_code ec;
        json::value jv (json::parse (*r.body, ec));

        if (!ec && jv.is_object () && jv.as_object ().contains ("message"))
        {
          const json::value& mv (jv.as_object ().at ("message"));

          if (mv.is_string ())
            m += ": " + json::value_to<string> (mv);
        }
      }

      throw github_error (r.status, m);
    }

    if (!r.body)
      throw runtime_error ("empty response to GitHub API request " + path);

    co_return json::parse (*r.body);
  }

  asio::awaitable<github_release> github_api::
  get_latest_release (const github_repository& r)
  {
    json::value jv (co_await get_json ("/repos/" + r.owner + '/' + r.name +
                                       "/releases/latest"));
    co_return parse_release (jv);
  }

  asio::awaitable<github_release> github_api::
  get_release_by_tag (const github_repository& r, const string& tag)
  {
    json::value jv (co_await get_json ("/repos/" + r.owner + '/' + r.name +
                                       "/releases/tags/" + tag));
    co_return parse_release (jv);
  }

  asio::awaitable<github_release> github_api::
  get_release (const github_repository& r, const string& tag)
  {
    if (tag.empty () || tag == "latest")
      co_return co_await get_latest_release (r);

    co_return co_await get_release_by_tag (r, tag);
  }
}
