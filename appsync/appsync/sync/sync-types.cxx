#include <appsync/sync/sync-types.hxx>

using namespace std;

namespace appsync
{
  bool
  valid_transition (sync_state f, sync_state t) noexcept
  {
    using s = sync_state;

    switch (f)
    {
      case s::idle:              return t == s::fetching_manifest;
      case s::fetching_manifest: return t == s::diffing || t == s::error;
      case s::diffing:           return t == s::downloading || t == s::persisting;
      case s::downloading:       return t == s::persisting || t == s::error;
      case s::persisting:        return t == s::done;
      case s::done:
      case s::error:             return t == s::idle;
    }

    return false;
  }

  string
  describe (const sync_outcome& o)
  {
    switch (o.failure)
    {
    case failure_kind::none:
      return o.success ? "up to date" : "sync did not complete";
    case failure_kind::dns:
      return "unable to reach the update server, check your internet "
             "connection";
    case failure_kind::http:
      {
        string r ("update server error");

        if (o.status != 0)
          r += " (" + std::to_string (o.status) + ')';

        r += ": ";
        r += o.error_message;

        if (!o.path.empty ())
          r += " [" + o.path + ']';

        return r;
      }
    }

    return string ();
  }
}
