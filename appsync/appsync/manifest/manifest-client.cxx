#include <appsync/manifest/manifest-client.hxx>

#include <stdexcept>

using namespace std;

namespace appsync
{
  asio::awaitable<fetch_result> manifest_client::
  fetch (const string& url)
  {
    fetch_result r;
    http_response res;

    try
    {
      res = co_await client_.get (url);
    }
    catch (const boost::system::system_error& e)
    {
      const boost::system::error_code& ec (e.code ());

      r.failure = host_resolution_failure (ec)
        ? failure_kind::dns
        : failure_kind::http;
      r.error_message = ec.message ();

      co_return r;
    }
    catch (const runtime_error& e)
    {
      // Bad URL, too many redirects, and the like.
      //
      r.failure = failure_kind::http;
      r.error_message = e.what ();

      co_return r;
    }

    r.status = res.status_code ();

    if (!res.is_success ())
    {
      string reason (res.reason);

      if (reason.empty ())
        reason = to_string (res.status);

      r.failure = failure_kind::http;
      r.error_message = http_error_message (res.body, reason);

      co_return r;
    }

    try
    {
      manifest m (res.body ? *res.body : string ());

      if (!m.download_url && !m.empty ())
        throw manifest_error ("manifest has no download_url");

      r.value = move (m);
      r.success = true;
    }
    catch (const manifest_error& e)
    {
      r.failure = failure_kind::http;
      r.error_message = e.what ();
    }

    co_return r;
  }
}
