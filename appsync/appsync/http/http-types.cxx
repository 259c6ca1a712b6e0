#include <appsync/http/http-types.hxx>

#include <boost/json.hpp>

using namespace std;

namespace appsync
{
  namespace json = boost::json;

  string
  to_string (http_status s)
  {
    switch (s)
    {
      case http_status::ok:                    return "OK";
      case http_status::no_content:            return "No Content";
      case http_status::partial_content:       return "Partial Content";
      case http_status::moved_permanently:     return "Moved Permanently";
      case http_status::found:                 return "Found";
      case http_status::see_other:             return "See Other";
      case http_status::not_modified:          return "Not Modified";
      case http_status::temporary_redirect:    return "Temporary Redirect";
      case http_status::permanent_redirect:    return "Permanent Redirect";
      case http_status::bad_request:           return "Bad Request";
      case http_status::unauthorized:          return "Unauthorized";
      case http_status::forbidden:             return "Forbidden";
      case http_status::not_found:             return "Not Found";
      case http_status::too_many_requests:     return "Too Many Requests";
      case http_status::internal_server_error: return "Internal Server Error";
      case http_status::bad_gateway:           return "Bad Gateway";
      case http_status::service_unavailable:   return "Service Unavailable";
      case http_status::gateway_timeout:       return "Gateway Timeout";
    }
    return string ();
  }

  string http_version::
  string () const
  {
    return "HTTP/" + std::to_string (major) + '.' + std::to_string (minor);
  }

  std::string
  http_error_message (const optional<std::string>& body, const std::string& r)
  {
    if (!body || body->empty ())
      return r;

    const std::string& b (*body);

    // Servers built on the usual Python/JS API frameworks report errors as
    // {"detail": "..."}. Anything that doesn't parse is just text.
    //
    boost::system::error_code ec;
    json::value v (json::parse (b, ec));

    if (!ec && v.is_object ())
    {
      const json::object& o (v.as_object ());

      if (auto i (o.find ("detail")); i != o.end ())
      {
        if (i->value ().is_string ())
          return json::value_to<std::string> (i->value ());

        return json::serialize (i->value ());
      }
    }

    return b;
  }
}
