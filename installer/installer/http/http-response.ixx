#include <cctype>
#include <charconv>

namespace installer
{
  template <typename S>
  inline std::optional<std::uint64_t> basic_http_response<S>::
  content_length () const
  {
    auto v (get_header (string_type ("Content-Length")));

    if (!v || v->empty ())
      return std::nullopt;

    std::uint64_t n (0);
    auto r (std::from_chars (v->data (), v->data () + v->size (), n));

    if (r.ec != std::errc () || r.ptr != v->data () + v->size ())
      return std::nullopt;

    return n;
  }

  template <typename S>
  inline bool basic_http_response<S>::
  accepts_byte_ranges () const
  {
    auto v (get_header (string_type ("Accept-Ranges")));

    if (!v)
      return false;

    // The value is a token list, although in practice it is either "bytes"
    // or "none".
    //
    string_type t;
    for (char c: *v)
    {
      if (c == ',' || c == ' ' || c == '\t')
      {
        if (http_field_name_equal (t, string_type ("bytes")))
          return true;

        t.clear ();
      }
      else
        t += c;
    }

    return http_field_name_equal (t, string_type ("bytes"));
  }
}
