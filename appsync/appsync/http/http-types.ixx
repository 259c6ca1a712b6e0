#include <algorithm>
#include <cctype>

namespace appsync
{
  template <typename S>
  inline bool
  http_name_equal (const S& x, const S& y)
  {
    return x.size () == y.size () &&
           std::equal (x.begin (), x.end (), y.begin (),
                       [] (char a, char b)
    {
      return std::tolower (static_cast<unsigned char> (a)) ==
             std::tolower (static_cast<unsigned char> (b));
    });
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
    for (const field_type& f: fields)
    {
      if (http_name_equal (f.name, n))
        return f.value;
    }

    return std::nullopt;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& n)
  {
    fields.erase (std::remove_if (fields.begin (),
                                  fields.end (),
                                  [&n] (const field_type& f)
                                  {
                                    return http_name_equal (f.name, n);
                                  }),
                  fields.end ());
  }
}
