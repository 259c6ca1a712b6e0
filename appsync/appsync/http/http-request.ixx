namespace appsync
{
  template <typename S>
  inline typename basic_http_request<S>::string_type basic_http_request<S>::
  target () const
  {
    return string_type (parse_url (url).target);
  }

  template <typename S>
  inline void basic_http_request<S>::
  normalize (const string_type& ua)
  {
    if (!has_header (string_type ("Host")))
    {
      url_parts p (parse_url (url));

      // Only spell out the port if it is not the scheme default, otherwise
      // some virtual hosts get confused.
      //
      bool def ((p.secure () && p.port == "443") ||
                (!p.secure () && p.port == "80"));

      if (!p.host.empty ())
      {
        string_type h (p.authority_host ());
        set_header (string_type ("Host"), def ? h : h + ':' + p.port);
      }
    }

    if (!has_header (string_type ("User-Agent")) && !ua.empty ())
      set_header (string_type ("User-Agent"), ua);
  }
}
