#include <appsync/http/http-request.hxx>

#include <stdexcept>

using namespace std;

namespace appsync
{
  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    // Scheme. Fall back to plain http if there is none.
    //
    if (size_t p = url.find ("://"); p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    if (r.scheme != "http" && r.scheme != "https")
      throw runtime_error ("unsupported URL scheme '" + r.scheme + "' in " +
                           url);

    // Authority ends at the start of the path, the query, or the string.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));

    if (!auth.empty () && auth[0] == '[')
    {
      // IPv6 literal: [addr] optionally followed by :port.
      //
      size_t c (auth.find (']'));

      if (c == string::npos)
        throw runtime_error ("unterminated IPv6 address in URL " + url);

      r.host = auth.substr (1, c - 1);

      if (c + 1 != auth.size ())
      {
        if (auth[c + 1] != ':')
          throw runtime_error ("invalid IPv6 address in URL " + url);

        r.port = auth.substr (c + 2);
      }
    }
    else if (size_t c = auth.rfind (':'); c != string::npos)
    {
      r.host = auth.substr (0, c);
      r.port = auth.substr (c + 1);
    }
    else
      r.host = auth;

    if (r.host.empty ())
      throw runtime_error ("no host in URL " + url);

    if (r.port.empty ())
      r.port = r.secure () ? "443" : "80";

    // Target. The fragment never goes over the wire.
    //
    if (end < url.size () && url[end] != '#')
    {
      r.target = url.substr (end);

      if (size_t h = r.target.find ('#'); h != string::npos)
        r.target.resize (h);

      if (r.target[0] == '?')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  string
  resolve_url (const string& base, const string& loc)
  {
    if (loc.find ("://") != string::npos)
      return loc;

    url_parts b (parse_url (base));
    string origin (b.scheme + "://" + b.authority_host () + ':' + b.port);

    // Protocol-relative (//host/path).
    //
    if (loc.size () > 1 && loc[0] == '/' && loc[1] == '/')
      return b.scheme + ':' + loc;

    if (!loc.empty () && loc[0] == '/')
      return origin + loc;

    // Relative to the directory of the base target, ignoring its query.
    //
    string t (b.target.substr (0, b.target.find ('?')));
    return origin + t.substr (0, t.rfind ('/') + 1) + loc;
  }
}
