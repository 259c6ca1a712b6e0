#include <appsync/manifest/manifest.hxx>

#include <vector>
#include <algorithm>

#include <boost/json/serialize.hpp>

using namespace std;

namespace appsync
{
  namespace
  {
    void
    write_value (string& o, const json::value& v, size_t indent)
    {
      switch (v.kind ())
      {
      case json::kind::object:
        {
          const json::object& obj (v.as_object ());

          if (obj.empty ())
          {
            o += "{}";
            break;
          }

          vector<const json::key_value_pair*> kvs;
          for (const auto& kv: obj)
            kvs.push_back (&kv);

          sort (kvs.begin (),
                kvs.end (),
                [] (const json::key_value_pair* x,
                    const json::key_value_pair* y)
          {
            return x->key () < y->key ();
          });

          o += "{\n";

          for (size_t i (0); i != kvs.size (); ++i)
          {
            o.append (indent + 4, ' ');
            o += json::serialize (json::value (kvs[i]->key ()));
            o += ": ";
            write_value (o, kvs[i]->value (), indent + 4);

            if (i + 1 != kvs.size ())
              o += ',';

            o += '\n';
          }

          o.append (indent, ' ');
          o += '}';
          break;
        }
      case json::kind::array:
        {
          const json::array& a (v.as_array ());

          if (a.empty ())
          {
            o += "[]";
            break;
          }

          o += "[\n";

          for (size_t i (0); i != a.size (); ++i)
          {
            o.append (indent + 4, ' ');
            write_value (o, a[i], indent + 4);

            if (i + 1 != a.size ())
              o += ',';

            o += '\n';
          }

          o.append (indent, ' ');
          o += ']';
          break;
        }
      default:
        o += json::serialize (v);
        break;
      }
    }
  }

  string
  serialize_sorted (const json::value& v)
  {
    string r;
    write_value (r, v, 0);
    return r;
  }

  string
  encode_url_path (const string& s)
  {
    static const char digits[] = "0123456789ABCDEF";

    string r;
    r.reserve (s.size ());

    for (char c: s)
    {
      unsigned char u (static_cast<unsigned char> (c));

      bool keep ((u >= 'A' && u <= 'Z') ||
                 (u >= 'a' && u <= 'z') ||
                 (u >= '0' && u <= '9') ||
                 string ("-._~!$&'()*+,;=:@/").find (c) != string::npos);

      if (keep)
        r += c;
      else
      {
        r += '%';
        r += digits[u >> 4];
        r += digits[u & 0x0f];
      }
    }

    return r;
  }
}
