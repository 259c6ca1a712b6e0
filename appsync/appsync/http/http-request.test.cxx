#include <appsync/http/http-types.hxx>
#include <appsync/http/http-request.hxx>
#include <appsync/http/http-response.hxx>

#include <cassert>
#include <string>
#include <optional>
#include <stdexcept>

using namespace std;
using namespace appsync;

static void
check_url (const string& u,
           const string& scheme,
           const string& host,
           const string& port,
           const string& target)
{
  url_parts p (parse_url (u));

  assert (p.scheme == scheme);
  assert (p.host == host);
  assert (p.port == port);
  assert (p.target == target);
}

static void
check_url_fail (const string& u)
{
  try
  {
    parse_url (u);
    assert (false);
  }
  catch (const runtime_error&)
  {
  }
}

static void
test_parse ()
{
  check_url ("https://example.org/files/manifest.json",
             "https", "example.org", "443", "/files/manifest.json");

  check_url ("http://example.org", "http", "example.org", "80", "/");
  check_url ("http://127.0.0.1:8080/x", "http", "127.0.0.1", "8080", "/x");
  check_url ("example.org/a/b", "http", "example.org", "80", "/a/b");

  // Query is kept, fragment never goes over the wire.
  //
  check_url ("http://h/a?b=c#d", "http", "h", "80", "/a?b=c");
  check_url ("http://h?b=c", "http", "h", "80", "/?b=c");
  check_url ("http://h#frag", "http", "h", "80", "/");

  // An empty port means the default.
  //
  check_url ("https://h:/x", "https", "h", "443", "/x");

  // IPv6 literals lose their brackets so they can be resolved.
  //
  check_url ("http://[::1]:8080/m", "http", "::1", "8080", "/m");
  check_url ("https://[2001:db8::7]/m", "https", "2001:db8::7", "443", "/m");
  check_url ("http://[::1]", "http", "::1", "80", "/");

  check_url_fail ("http://[::1/m");
  check_url_fail ("http://[::1]x/m");
  check_url_fail ("http://[]:80/m");

  check_url_fail ("ftp://example.org/file");
  check_url_fail ("http:///path");
  check_url_fail ("");
}

static void
test_resolve ()
{
  const string b ("http://h:8080/files/sub/manifest.json?x=1");

  assert (resolve_url (b, "https://other/y") == "https://other/y");
  assert (resolve_url (b, "//cdn/y") == "http://cdn/y");
  assert (resolve_url (b, "/y") == "http://h:8080/y");
  assert (resolve_url (b, "y") == "http://h:8080/files/sub/y");
  assert (resolve_url ("http://h", "y") == "http://h:80/y");
  assert (resolve_url ("http://[::1]:8080/a/m", "y") ==
          "http://[::1]:8080/a/y");
}

static void
test_request ()
{
  http_request r ("http://127.0.0.1:8080/a/b?c");

  assert (r.target () == "/a/b?c");

  r.normalize ("appsync/test");
  assert (r.get_header ("host") == string ("127.0.0.1:8080"));
  assert (r.get_header ("User-Agent") == string ("appsync/test"));

  http_request r6 ("http://[::1]:8080/m");
  r6.normalize ("appsync/test");
  assert (r6.get_header ("Host") == string ("[::1]:8080"));

  // Default ports are left out of Host and existing headers are kept.
  //
  http_request d ("https://example.org/");
  d.set_header ("User-Agent", "custom");
  d.normalize ("appsync/test");

  assert (d.get_header ("Host") == string ("example.org"));
  assert (d.get_header ("user-agent") == string ("custom"));
  assert (d.headers.size () == 2);
}

static void
test_headers ()
{
  http_headers h;

  h.set ("Content-Type", "text/plain");
  h.set ("content-type", "application/json");
  assert (h.size () == 1);
  assert (h.get ("CONTENT-TYPE") == string ("application/json"));

  h.add ("Set-Cookie", "a");
  h.add ("Set-Cookie", "b");
  assert (h.size () == 3);
  assert (h.get ("set-cookie") == string ("a"));

  h.remove ("SET-COOKIE");
  assert (h.size () == 1);
  assert (!h.contains ("Set-Cookie"));
}

static void
test_response ()
{
  http_response r (http_status::ok);

  assert (r.is_success ());
  assert (!http_response (http_status::found).is_success ());
  assert (http_response (http_status::found).is_redirection ());
  assert (!http_response (http_status::not_found).is_success ());
}

// Error messages come from a JSON "detail" member if there is one and from
// the body text otherwise.
//
static void
test_error_message ()
{
  assert (http_error_message (nullopt, "Not Found") == "Not Found");
  assert (http_error_message (string (), "Not Found") == "Not Found");

  assert (http_error_message (string ("{\"detail\": \"manifest not published\"}"),
                              "Not Found") == "manifest not published");

  assert (http_error_message (string ("{\"detail\": {\"code\": 7}}"),
                              "Bad Request") == "{\"code\":7}");

  assert (http_error_message (string ("{\"error\": \"x\"}"),
                              "Bad Request") == "{\"error\": \"x\"}");

  assert (http_error_message (string ("service down for maintenance"),
                              "Service Unavailable") ==
          "service down for maintenance");

  // Long text bodies are not cut short.
  //
  string l (300, 'x');
  assert (http_error_message (l, "Internal Server Error") == l);

  http_error e (503, "service down");
  assert (e.status () == 503);
  assert (string (e.what ()) == "service down");

  assert (to_string (http_status::not_found) == "Not Found");
  assert (to_string (static_cast<http_status> (599)).empty ());
}

int
main ()
{
  test_parse ();
  test_resolve ();
  test_request ();
  test_headers ();
  test_response ();
  test_error_message ();
}
