#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <optional>

#include <appsync/http/http-types.hxx>

namespace appsync
{
  // Components of an absolute http(s) URL.
  //
  template <typename S>
  struct basic_url_parts
  {
    using string_type = S;

    string_type scheme;
    string_type host;   // IPv6 literals without brackets.
    string_type port;
    string_type target;

    bool
    secure () const
    {
      return scheme == "https";
    }

    // Host as it appears in a URL or the Host header, that is, with IPv6
    // literals in brackets.
    //
    string_type
    authority_host () const
    {
      return host.find (':') != string_type::npos
        ? string_type ("[") + host + ']'
        : host;
    }
  };

  using url_parts = basic_url_parts<std::string>;

  // Split a URL into scheme, host, port, and target.
  //
  // This handles the scheme://host[:port][/path[?query]] form we get from
  // manifests and Location headers. A missing scheme defaults to http, a
  // missing port to the scheme default, and a missing path to "/". The
  // brackets are stripped from an IPv6 literal host ([::1] -> ::1). User
  // info is not supported.
  //
  // Throw std::runtime_error if the scheme is not http or https, there is
  // no host, or an IPv6 literal is malformed.
  //
  url_parts
  parse_url (const std::string& url);

  // Resolve a Location header value against the URL it was returned for.
  //
  // Absolute URLs are returned as is, "/path" replaces the target of the
  // base, and anything else is taken relative to the base's directory.
  //
  std::string
  resolve_url (const std::string& base, const std::string& location);

  // HTTP GET request.
  //
  // Everything we send is a GET so there is neither a method nor a body.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request () = default;

    explicit
    basic_http_request (string_type u, http_version v = http_version (1, 1))
      : url (std::move (u)), version (v) {}

    // Request target (path and query) as sent on the request line.
    //
    string_type
    target () const;

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    // Fill in Host and User-Agent unless already set.
    //
    void
    normalize (const string_type& user_agent);

    bool
    empty () const noexcept
    {
      return url.empty ();
    }
  };

  template <typename S>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_request<S>& r) -> decltype (o)
  {
    return o << "GET " << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string>;
}

#include <appsync/http/http-request.ixx>
