#include <installer/download/download-types.hxx>

using namespace std;

namespace installer
{
  vector<byte_range_chunk>
  plan_chunks (uint64_t n, uint64_t cs)
  {
    if (cs == 0)
      throw invalid_argument ("chunk size must be positive");

    vector<byte_range_chunk> r;

    if (n == 0)
      return r;

    r.reserve (static_cast<size_t> ((n - 1) / cs + 1));

    for (uint64_t s (0), i (0); s < n; s += cs, ++i)
    {
      // Guard the addition: near the top of the range s + cs may wrap.
      //
      uint64_t e (cs - 1 > n - 1 - s ? n - 1 : s + cs - 1);
      r.push_back (byte_range_chunk {s, e, static_cast<size_t> (i)});

      if (e == n - 1)
        break;
    }

    return r;
  }
}
