#include <chrono>
#include <limits>
#include <vector>
#include <fstream>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace appsync
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  // Close a connection once we are done with it.
  //
  // Errors are ignored: the response has already been read in full and a
  // lot of servers drop the connection without a TLS close_notify.
  //
  inline asio::awaitable<void>
  close_stream (beast::tcp_stream& s)
  {
    beast::error_code ec;
    s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    co_return;
  }

  inline asio::awaitable<void>
  close_stream (beast::ssl_stream<beast::tcp_stream>& s)
  {
    beast::get_lowest_layer (s).expires_after (std::chrono::seconds (5));

    beast::error_code ec;
    co_await s.async_shutdown (asio::redirect_error (asio::use_awaitable, ec));
  }

  // Build the Beast request from ours. The target is taken from the URL.
  //
  template <typename S>
  inline http::request<http::empty_body>
  to_beast_request (const basic_http_request<S>& req)
  {
    http::request<http::empty_body> r (http::verb::get,
                                       req.target (),
                                       req.version.beast ());

    for (const auto& h: req.headers)
      r.set (h.name, h.value);

    return r;
  }

  template <typename T>
  asio::awaitable<std::unique_ptr<typename basic_http_client<T>::tcp_stream>>
  basic_http_client<T>::
  connect_tcp (const url_parts& p)
  {
    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto eps (co_await rslv.async_resolve (p.host,
                                           p.port,
                                           asio::use_awaitable));

    auto s (std::make_unique<tcp_stream> (ctx));

    s->expires_after (std::chrono::milliseconds (tr.connect_timeout));
    co_await s->async_connect (eps, asio::use_awaitable);

    co_return s;
  }

  template <typename T>
  asio::awaitable<std::unique_ptr<typename basic_http_client<T>::ssl_stream>>
  basic_http_client<T>::
  connect_ssl (const url_parts& p)
  {
    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto eps (co_await rslv.async_resolve (p.host,
                                           p.port,
                                           asio::use_awaitable));

    auto s (std::make_unique<ssl_stream> (ctx, session_->ssl_context ()));

    // Beast doesn't wrap SNI so we go down to OpenSSL. Without it virtual
    // hosts hand us the wrong certificate and the handshake fails anyway.
    //
    if (!SSL_set_tlsext_host_name (s->native_handle (), p.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());

      throw beast::system_error (ec, "unable to set SNI host name");
    }

    if (tr.verify_ssl)
      s->set_verify_callback (ssl::host_name_verification (p.host));

    // The connect timeout also covers the handshake.
    //
    auto& l (beast::get_lowest_layer (*s));
    l.expires_after (std::chrono::milliseconds (tr.connect_timeout));

    co_await l.async_connect (eps, asio::use_awaitable);
    co_await s->async_handshake (ssl::stream_base::client,
                                 asio::use_awaitable);

    co_return s;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (Stream& s, const request_type& req)
  {
    const auto& tr (session_->traits ());
    std::chrono::milliseconds to (tr.request_timeout);

    auto& l (beast::get_lowest_layer (s));

    http::request<http::empty_body> br (to_beast_request (req));

    l.expires_after (to);
    co_await http::async_write (s, br, asio::use_awaitable);

    beast::flat_buffer b;
    http::response<http::string_body> bres;

    l.expires_after (to);
    co_await http::async_read (s, b, bres, asio::use_awaitable);

    response_type r;
    r.status  = static_cast<http_status> (bres.result_int ());
    r.version = http_version (static_cast<std::uint8_t> (bres.version () / 10),
                              static_cast<std::uint8_t> (bres.version () % 10));
    r.reason  = string_type (bres.reason ());

    for (const auto& h: bres)
      r.headers.add (string_type (h.name_string ()),
                     string_type (h.value ()));

    if (!bres.body ().empty ())
      r.body = std::move (bres.body ());

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirects)
  {
    const auto& tr (session_->traits ());

    if (redirects > tr.max_redirects)
      throw std::runtime_error ("maximum number of redirects exceeded");

    url_parts p (parse_url (req.url));
    response_type r;

    if (p.secure ())
    {
      auto s (co_await connect_ssl (p));
      r = co_await exchange (*s, req);
      co_await close_stream (*s);
    }
    else
    {
      auto s (co_await connect_tcp (p));
      r = co_await exchange (*s, req);
      co_await close_stream (*s);
    }

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (auto loc = r.location ())
      {
        // Same headers except Host which belongs to the new location.
        //
        request_type n (string_type (resolve_url (req.url, *loc)),
                        req.version);
        n.headers = req.headers;
        n.headers.remove (string_type ("Host"));
        n.normalize (tr.user_agent);

        co_return co_await request_impl (
          std::move (n), static_cast<std::uint8_t> (redirects + 1));
      }
    }

    co_return r;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::transfer_result>
  basic_http_client<T>::
  transfer (Stream& s,
            const request_type& req,
            const fs::path& target,
            const progress_callback& progress)
  {
    const auto& tr (session_->traits ());
    std::chrono::milliseconds to (tr.request_timeout);

    auto& l (beast::get_lowest_layer (s));

    http::request<http::empty_body> br (to_beast_request (req));

    l.expires_after (to);
    co_await http::async_write (s, br, asio::use_awaitable);

    // Read the header first: we want to decide what to do (follow, fail, or
    // save) before touching the target.
    //
    beast::flat_buffer b;
    http::response_parser<http::buffer_body> p;
    p.body_limit (std::numeric_limits<std::uint64_t>::max ());

    l.expires_after (to);
    co_await http::async_read_header (s, b, p, asio::use_awaitable);

    transfer_result r;
    unsigned st (p.get ().result_int ());

    if (tr.follow_redirects && st >= 300 && st < 400)
    {
      auto loc (p.get ()[http::field::location]);

      if (!loc.empty ())
      {
        r.redirect = string_type (loc);
        co_return r;
      }
    }

    // Read one chunk of the body into the buffer. Return the number of bytes
    // placed there. The need_buffer "error" just means the buffer is full.
    //
    std::vector<char> buf (tr.chunk_size);

    auto read_chunk = [&] () -> asio::awaitable<std::size_t>
    {
      p.get ().body ().data = buf.data ();
      p.get ().body ().size = buf.size ();

      l.expires_after (to);

      beast::error_code ec;
      co_await http::async_read (s,
                                 b,
                                 p,
                                 asio::redirect_error (asio::use_awaitable, ec));

      if (ec == http::error::need_buffer)
        ec = {};

      if (ec)
        throw beast::system_error (ec);

      co_return buf.size () - p.get ().body ().size;
    };

    if (st < 200 || st >= 300)
    {
      std::string reason (p.get ().reason ());

      if (reason.empty ())
        reason = to_string (static_cast<http_status> (st));

      if (reason.empty ())
        reason = "HTTP status " + std::to_string (st);

      // Salvage a bit of the body: it often says what went wrong. A failure
      // to read it is not interesting, the status already is the error.
      //
      std::optional<std::string> body;

      try
      {
        std::string t;

        while (!p.is_done () && t.size () < 4096)
        {
          std::size_t n (co_await read_chunk ());
          t.append (buf.data (), n);
        }

        if (!t.empty ())
          body = std::move (t);
      }
      catch (const beast::system_error&)
      {
      }

      throw http_error (static_cast<std::uint16_t> (st),
                        http_error_message (body, reason));
    }

    std::uint64_t total (p.content_length () ? *p.content_length () : 0);

    std::ofstream ofs (target, std::ios::binary | std::ios::trunc);
    if (!ofs)
      throw io_error (target, "unable to open file for writing");

    while (!p.is_done ())
    {
      std::size_t n (co_await read_chunk ());

      if (n == 0)
        continue;

      if (!ofs.write (buf.data (), static_cast<std::streamsize> (n)))
        throw io_error (target, "unable to write file");

      r.bytes += n;

      if (progress)
        progress (r.bytes, total);
    }

    ofs.close ();

    if (!ofs)
      throw io_error (target, "unable to write file");

    co_return r;
  }

  template <typename T>
  asio::awaitable<std::uint64_t>
  basic_http_client<T>::
  download_impl (string_type url,
                 const fs::path& target,
                 const progress_callback& progress,
                 std::uint8_t redirects)
  {
    const auto& tr (session_->traits ());

    if (redirects > tr.max_redirects)
      throw std::runtime_error ("maximum number of redirects exceeded");

    request_type req (url);
    req.normalize (tr.user_agent);

    url_parts p (parse_url (url));
    transfer_result r;

    if (p.secure ())
    {
      auto s (co_await connect_ssl (p));
      r = co_await transfer (*s, req, target, progress);
      co_await close_stream (*s);
    }
    else
    {
      auto s (co_await connect_tcp (p));
      r = co_await transfer (*s, req, target, progress);
      co_await close_stream (*s);
    }

    if (r.redirect)
      co_return co_await download_impl (
        string_type (resolve_url (url, *r.redirect)),
        target,
        progress,
        static_cast<std::uint8_t> (redirects + 1));

    co_return r.bytes;
  }
}
