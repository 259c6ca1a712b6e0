#include <appsync/manifest/manifest-store.hxx>

#include <string>
#include <fstream>
#include <iterator>
#include <system_error>

using namespace std;

namespace appsync
{
  manifest manifest_store::
  load () const
  {
    error_code ec;
    if (!fs::is_regular_file (file_, ec))
      return manifest ();

    ifstream is (file_, ios::binary);
    if (!is)
      return manifest ();

    string s ((istreambuf_iterator<char> (is)), istreambuf_iterator<char> ());

    if (is.bad ())
      return manifest ();

    try
    {
      return manifest (s);
    }
    catch (const manifest_error&)
    {
      return manifest ();
    }
  }

  void manifest_store::
  save (const manifest& m) const
  {
    manifest l;
    l.files = m.files;

    string s (l.string ());
    s += '\n';

    if (file_.has_parent_path ())
    {
      error_code ec;
      fs::create_directories (file_.parent_path (), ec);

      if (ec)
        throw io_error (file_.parent_path (),
                        "unable to create manifest directory",
                        ec);
    }

    fs::path t (file_);
    t += ".tmp";

    {
      ofstream os (t, ios::binary | ios::trunc);
      if (!os)
        throw io_error (t, "unable to create manifest file");

      os << s;
      os.close ();

      if (!os)
      {
        error_code ec;
        fs::remove (t, ec); // Best effort.
        throw io_error (t, "unable to write manifest file");
      }
    }

    error_code ec;
    fs::rename (t, file_, ec);

    if (ec)
    {
      error_code rec;
      fs::remove (t, rec);
      throw io_error (file_, "unable to replace manifest file", ec);
    }
  }
}
