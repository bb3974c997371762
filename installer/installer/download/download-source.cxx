#include <installer/download/download-source.hxx>

using namespace std;

namespace installer
{
  asio::awaitable<resource_info> http_download_source::
  probe (const string& url)
  {
    http_response r (co_await client_.head (url));

    if (!r.is_success ())
      throw http_status_error (r.status, url);

    resource_info i;
    i.content_length = r.content_length ();
    i.accept_ranges = r.accepts_byte_ranges ();

    co_return i;
  }

  asio::awaitable<uint64_t> http_download_source::
  fetch (const string& url,
         ostream& out,
         progress_callback progress,
         optional<http_range> range)
  {
    http_client::progress_callback pc;

    if (progress)
      pc = [progress = move (progress)] (uint64_t n, uint64_t)
      {
        progress (n);
      };

    co_return co_await client_.download (url, out, move (pc), range);
  }
}
