#include <boost/json/parse.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value_to.hpp>

namespace appsync
{
  template <typename S>
  basic_manifest<S>::
  basic_manifest (const string_type& s)
  {
    boost::system::error_code ec;
    json::value jv (json::parse (s, ec));

    if (ec)
      throw manifest_error ("invalid manifest JSON: " + ec.message ());

    parse (jv);
  }

  template <typename S>
  basic_manifest<S>::
  basic_manifest (const json::value& jv)
  {
    parse (jv);
  }

  template <typename S>
  void basic_manifest<S>::
  parse (const json::value& jv)
  {
    if (!jv.is_object ())
      throw manifest_error ("manifest must be a JSON object");

    const json::object& o (jv.as_object ());

    // download_url is optional (the local manifest doesn't have one) but if
    // it's there it must be a string.
    //
    if (const json::value* u = o.if_contains ("download_url"))
    {
      if (!u->is_string ())
        throw manifest_error ("manifest download_url must be a string");

      download_url = json::value_to<string_type> (*u);
    }

    const json::value* jf (o.if_contains ("files"));

    if (jf == nullptr)
      throw manifest_error ("manifest has no files member");

    if (!jf->is_object ())
      throw manifest_error ("manifest files member must be an object");

    // Note that a JSON object can't have duplicate keys once parsed (the
    // last one wins) so add() will only complain about bad paths/digests.
    //
    for (const auto& kv: jf->as_object ())
    {
      string_type p (kv.key ().data (), kv.key ().size ());

      if (!kv.value ().is_string ())
        throw manifest_error ("digest of '" + std::string (p) +
                              "' must be a string");

      add (std::move (p), json::value_to<string_type> (kv.value ()));
    }
  }

  template <typename S>
  void basic_manifest<S>::
  add (string_type p, string_type d)
  {
    if (!valid_path (p))
      throw manifest_error ("invalid manifest path '" + std::string (p) + "'");

    if (!valid_digest (d))
      throw manifest_error ("invalid digest '" + std::string (d) + "' for '" +
                            std::string (p) + "'");

    if (find (p) != nullptr)
      throw manifest_error ("duplicate manifest path '" + std::string (p) +
                            "'");

    files.emplace_back (std::move (p), std::move (d));
  }

  template <typename S>
  typename basic_manifest<S>::string_type basic_manifest<S>::
  file_url (const file_type& f) const
  {
    if (!download_url)
      throw std::logic_error ("manifest has no download URL");

    return *download_url + "/" + string_type (encode_url_path (f.path));
  }

  template <typename S>
  json::value basic_manifest<S>::
  json () const
  {
    json::object fo;
    for (const auto& f: files)
      fo[f.path] = f.digest;

    json::object o;
    o["files"] = std::move (fo);

    if (download_url)
      o["download_url"] = *download_url;

    return o;
  }
}
