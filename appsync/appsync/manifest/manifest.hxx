#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <stdexcept>

#include <boost/json/value.hpp>

#include <appsync/manifest/manifest-types.hxx>

namespace appsync
{
  namespace json = boost::json;

  // Thrown when a manifest can't be parsed or doesn't validate.
  //
  class manifest_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // File entry in a manifest.
  //
  template <typename S = std::string>
  struct basic_manifest_file
  {
    using string_type = S;

    string_type path;   // Relative, forward slash-separated.
    string_type digest; // SHA-256, lowercase hex.

    basic_manifest_file () = default;

    basic_manifest_file (string_type p, string_type d)
      : path (std::move (p)), digest (std::move (d)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_manifest_file<S>& x,
              const basic_manifest_file<S>& y) noexcept
  {
    return x.path == y.path && x.digest == y.digest;
  }

  template <typename S>
  inline bool
  operator!= (const basic_manifest_file<S>& x,
              const basic_manifest_file<S>& y) noexcept
  {
    return !(x == y);
  }

  // Manifest: the set of files that make up an installation together with
  // their digests and, for the remote manifest, where to get them from.
  //
  // The JSON representation is:
  //
  // {
  //   "download_url": "https://example.org/files",
  //   "files": {"bin/client": "<sha256>", ...}
  // }
  //
  // Files are kept in the order they appear in the JSON object. Paths are
  // unique.
  //
  template <typename S = std::string>
  class basic_manifest
  {
  public:
    using string_type = S;
    using file_type   = basic_manifest_file<string_type>;
    using files_type  = std::vector<file_type>;

    files_type files;
    std::optional<string_type> download_url;

    basic_manifest () = default;

    // Parse from JSON string or value.
    //
    // Throw manifest_error if the JSON is malformed, is not an object, has no
    // "files" object, or any entry has an invalid path or digest.
    //
    explicit
    basic_manifest (const string_type& json_str);

    explicit
    basic_manifest (const json::value& jv);

    bool
    empty () const noexcept
    {
      return files.empty ();
    }

    // Append a file entry. Throw manifest_error if the path or digest is
    // invalid or the path is already present.
    //
    void
    add (string_type path, string_type digest);

    // Return the entry for the path or NULL if there is none.
    //
    const file_type*
    find (const string_type& path) const;

    // Return the URL the file can be downloaded from, that is, download_url,
    // a slash, and the path with characters that are not allowed in a URL
    // path percent-encoded. Throw std::logic_error if there is no
    // download_url.
    //
    string_type
    file_url (const file_type&) const;

    // Serialize to JSON value.
    //
    json::value
    json () const;

    // Serialize to JSON string. The output is deterministic: object members
    // are sorted by key and indented by four spaces.
    //
    string_type
    string () const;

  private:
    void
    parse (const json::value&);
  };

  template <typename S>
  inline bool
  operator== (const basic_manifest<S>& x, const basic_manifest<S>& y)
  {
    return x.files == y.files && x.download_url == y.download_url;
  }

  template <typename S>
  inline bool
  operator!= (const basic_manifest<S>& x, const basic_manifest<S>& y)
  {
    return !(x == y);
  }

  using manifest_file = basic_manifest_file<std::string>;
  using manifest      = basic_manifest<std::string>;

  // Serialize the JSON value with object members sorted by key, one member
  // or element per line, and four-space indentation.
  //
  std::string
  serialize_sorted (const json::value&);

  // Percent-encode everything except unreserved characters, sub-delimiters,
  // ':', '@', and '/' so that the result can be appended to a URL path.
  //
  std::string
  encode_url_path (const std::string&);
}

#include <appsync/manifest/manifest.ixx>
#include <appsync/manifest/manifest.txx>
