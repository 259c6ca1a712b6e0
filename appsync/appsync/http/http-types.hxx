#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <stdexcept>

namespace appsync
{
  // HTTP status code.
  //
  // Only the codes we act on are named. Anything else the server sends is
  // still representable since the underlying type is the raw code.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    no_content            = 204,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    not_modified          = 304,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  // Return the reason phrase for the status or an empty string if we don't
  // know it.
  //
  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
      : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y)
  {
    return x.name == y.name && x.value == y.value;
  }

  // HTTP headers.
  //
  // Field names are compared case-insensitively, values are kept as is.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Replace any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Append, allowing duplicates.
    //
    void
    add (string_type name, string_type value);

    // Return the first value for the name, if any.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t mj = 1, std::uint8_t mi = 1)
      : major (mj), minor (mi) {}

    // Beast encodes the version as major * 10 + minor.
    //
    unsigned
    beast () const noexcept
    {
      return major * 10u + minor;
    }

    std::string
    string () const;
  };

  inline bool
  operator== (const http_version& x, const http_version& y) noexcept
  {
    return x.major == y.major && x.minor == y.minor;
  }

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  // Thrown when the server answers with a status we can't use (anything
  // outside 2xx once redirects have been followed).
  //
  // The message is whatever the server said about the failure (see
  // http_error_message()), or the reason phrase if it said nothing.
  //
  class http_error: public std::runtime_error
  {
  public:
    http_error (std::uint16_t status, const std::string& message)
      : std::runtime_error (message), status_ (status) {}

    std::uint16_t
    status () const noexcept
    {
      return status_;
    }

  private:
    std::uint16_t status_;
  };

  // Extract a human-readable error message from an error response body.
  //
  // If the body is a JSON object with a string "detail" member, that is the
  // message. Otherwise the raw body text is the message, as is. An empty
  // body yields the reason phrase.
  //
  std::string
  http_error_message (const std::optional<std::string>& body,
                      const std::string& reason);
}

#include <appsync/http/http-types.ixx>
