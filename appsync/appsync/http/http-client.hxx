#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <appsync/appsync-types.hxx>
#include <appsync/http/http-types.hxx>
#include <appsync/http/http-request.hxx>
#include <appsync/http/http-response.hxx>

#include <appsync/version.hxx>

namespace appsync
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client configuration.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds, covering resolve, connect, and the
    // TLS handshake.
    //
    std::uint32_t connect_timeout = 30000;

    // Timeout in milliseconds for each write and each read. For downloads it
    // is renewed for every chunk so it bounds stalls, not transfer time.
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow before giving up.
    //
    std::uint8_t max_redirects = 10;

    bool follow_redirects = true;

    // Verify the server certificate chain and host name.
    //
    bool verify_ssl = true;

    // CA bundle to verify against (empty means the system default paths).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("appsync/" APPSYNC_VERSION_STR);

    // Size of the buffer each download chunk is read into.
    //
    std::size_t chunk_size = 64 * 1024;
  };

  // Shared client state: the executor's context, the configuration, and the
  // TLS context all connections are created from.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tls_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP/1.1 client on top of Boost.Beast and coroutines.
  //
  // Every request uses its own connection which is closed once the response
  // has been read. Both http:// and https:// URLs are supported and redirects
  // are followed according to the traits.
  //
  // Transport failures (resolution, connect, TLS, timeouts, premature end of
  // stream) are reported by throwing boost::system::system_error with the
  // underlying error code so that callers can tell them apart.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // Download progress: (bytes received so far, declared total). The total
    // is 0 if the server did not send a Content-Length.
    //
    using progress_callback =
      std::function<void (std::uint64_t, std::uint64_t)>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform the request and return the response with its body buffered in
    // memory. Redirects are followed, any other status (including errors) is
    // returned to the caller as is.
    //
    asio::awaitable<response_type>
    request (request_type req);

    asio::awaitable<response_type>
    get (const string_type& url);

    // Stream the response body into the file at the target path, creating
    // or truncating it once the response headers have been accepted.
    //
    // Throw http_error if the final response is not 2xx (the target is not
    // touched in this case) and io_error if the file can't be written. The
    // progress callback, if any, is called after every chunk written.
    //
    // Return the number of body bytes written.
    //
    asio::awaitable<std::uint64_t>
    download (const string_type& url,
              const fs::path& target,
              progress_callback progress = nullptr);

    session_type&
    session () noexcept
    {
      return *session_;
    }

    const session_type&
    session () const noexcept
    {
      return *session_;
    }

  private:
    using tcp_stream = beast::tcp_stream;
    using ssl_stream = beast::ssl_stream<beast::tcp_stream>;

    asio::awaitable<response_type>
    request_impl (request_type req, std::uint8_t redirects);

    asio::awaitable<std::uint64_t>
    download_impl (string_type url,
                   const fs::path& target,
                   const progress_callback& progress,
                   std::uint8_t redirects);

    // Connection establishment.
    //
    asio::awaitable<std::unique_ptr<tcp_stream>>
    connect_tcp (const url_parts& p);

    asio::awaitable<std::unique_ptr<ssl_stream>>
    connect_ssl (const url_parts& p);

    // Send the request and read the whole response. Stream-agnostic so the
    // plain and TLS paths share it.
    //
    template <typename Stream>
    asio::awaitable<response_type>
    exchange (Stream& s, const request_type& req);

    // Send the request and read the response header. If the response can be
    // used, stream its body into the target and return the number of bytes
    // written. Otherwise return the redirect location or throw.
    //
    struct transfer_result
    {
      std::uint64_t bytes = 0;
      std::optional<string_type> redirect;
    };

    template <typename Stream>
    asio::awaitable<transfer_result>
    transfer (Stream& s,
              const request_type& req,
              const fs::path& target,
              const progress_callback& progress);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;

  // Return true if the error code denotes a failure to resolve the host
  // name, as opposed to, say, a refused connection.
  //
  bool
  host_resolution_failure (const boost::system::error_code&) noexcept;
}

#include <appsync/http/http-client.ixx>
#include <appsync/http/http-client.txx>
