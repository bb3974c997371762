#include <algorithm>
#include <cctype>

namespace installer
{
  // Case-insensitive field name comparison.
  //
  template <typename S>
  inline bool
  http_field_name_equal (const S& x, const S& y)
  {
    if (x.size () != y.size ())
      return false;

    for (std::size_t i (0); i < x.size (); ++i)
    {
      if (std::tolower (static_cast<unsigned char> (x[i])) !=
          std::tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type n, string_type v)
  {
    remove (n);
    fields.emplace_back (std::move (n), std::move (v));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  add (string_type n, string_type v)
  {
    fields.emplace_back (std::move (n), std::move (v));
  }

  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& n) const
  {
    auto i (std::find_if (fields.begin (), fields.end (),
                          [&n] (const field_type& f)
    {
      return http_field_name_equal (f.name, n);
    }));

    if (i == fields.end ())
      return std::nullopt;

    return i->value;
  }

  template <typename S>
  inline bool basic_http_headers<S>::
  contains (const string_type& n) const
  {
    return get (n).has_value ();
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& n)
  {
    fields.erase (std::remove_if (fields.begin (), fields.end (),
                                  [&n] (const field_type& f)
    {
      return http_field_name_equal (f.name, n);
    }), fields.end ());
  }
}
