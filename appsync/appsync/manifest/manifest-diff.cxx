#include <appsync/manifest/manifest-diff.hxx>

#include <system_error>

using namespace std;

namespace appsync
{
  vector<string>
  missing_files (const manifest& m, const fs::path& dir)
  {
    vector<string> r;

    for (const auto& f: m.files)
    {
      fs::path p (resolve_path (dir, f.path));

      error_code ec;
      if (!fs::is_regular_file (p, ec) || compute_file_hash (p) != f.digest)
        r.push_back (f.path);
    }

    return r;
  }

  fs::path
  resolve_path (const fs::path& dir, const string& p)
  {
    // Manifest paths are always forward slash-separated which generic
    // format construction turns into the native separators.
    //
    return dir / fs::path (p, fs::path::generic_format);
  }
}
