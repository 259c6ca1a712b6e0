#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <appsync/http/http-types.hxx>

namespace appsync
{
  // HTTP response with a fully buffered body.
  //
  // Streaming downloads never produce one of these; they go straight to disk
  // (see basic_http_client::download()).
  //
  template <typename S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_status                status;
    http_version               version;
    string_type                reason;
    headers_type               headers;
    std::optional<string_type> body;

    basic_http_response () : status (http_status::ok) {}

    explicit
    basic_http_response (http_status s, string_type r = string_type ())
      : status (s), reason (std::move (r)) {}

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }
  };

  template <typename S>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_response<S>& r) -> decltype (o)
  {
    o << r.version << ' ' << r.status;

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string>;
}
