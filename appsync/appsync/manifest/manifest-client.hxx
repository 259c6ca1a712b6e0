#pragma once

#include <string>
#include <cstdint>

#include <boost/asio/awaitable.hpp>

#include <appsync/appsync-types.hxx>
#include <appsync/http/http.hxx>
#include <appsync/manifest/manifest.hxx>

namespace appsync
{
  // Outcome of fetching the remote manifest.
  //
  struct fetch_result
  {
    bool success = false;
    manifest value;

    failure_kind failure = failure_kind::none;
    std::uint16_t status = 0; // 0 if there was no HTTP response.
    std::string error_message;

    explicit operator bool () const noexcept { return success; }
  };

  // Fetch the authoritative manifest from the update server.
  //
  class manifest_client
  {
  public:
    explicit
    manifest_client (http_client& c)
      : client_ (c) {}

    manifest_client (const manifest_client&) = delete;
    manifest_client& operator= (const manifest_client&) = delete;

    // GET the URL and parse the body as a manifest.
    //
    // Failures are returned rather than thrown: a host name that doesn't
    // resolve is dns, everything else (non-2xx status, a body that is not a
    // valid manifest, or any other transport problem) is http. For a non-2xx
    // status the message is the body's "detail" member if it's JSON, its
    // text otherwise. There is no retry.
    //
    // A manifest that lists files must also specify download_url.
    //
    asio::awaitable<fetch_result>
    fetch (const std::string& url);

  private:
    http_client& client_;
  };
}
