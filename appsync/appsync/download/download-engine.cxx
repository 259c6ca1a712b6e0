#include <appsync/download/download-engine.hxx>

#include <stdexcept>
#include <system_error>

#include <appsync/manifest/manifest-diff.hxx>

using namespace std;

namespace appsync
{
  asio::awaitable<void> download_engine::
  download_all (const manifest& m,
                const vector<string>& ps,
                const fs::path& dir,
                const download_progress_callback& progress)
  {
    // Resolve everything upfront so that a bad path doesn't abort the batch
    // half way through.
    //
    vector<const manifest_file*> files;
    files.reserve (ps.size ());

    for (const string& p: ps)
    {
      const manifest_file* f (m.find (p));

      if (f == nullptr)
        throw invalid_argument ("path '" + p + "' is not in the manifest");

      files.push_back (f);
    }

    if (files.empty ())
      co_return;

    if (!m.download_url)
      throw invalid_argument ("manifest has no download URL");

    fs::path sd (download_staging_dir (dir));

    // Whatever is left in the staging directory is garbage once the batch is
    // over, successful or not.
    //
    struct cleanup
    {
      const fs::path& d;
      ~cleanup ()
      {
        error_code ec;
        fs::remove_all (d, ec); // Best effort.
      }
    } c {sd};

    for (size_t i (0); i != files.size (); ++i)
      co_await download_file (m, *files[i], dir, sd, i, files.size (), progress);
  }

  asio::awaitable<void> download_engine::
  download_file (const manifest& m,
                 const manifest_file& f,
                 const fs::path& dir,
                 const fs::path& sd,
                 size_t i,
                 size_t n,
                 const download_progress_callback& progress)
  {
    fs::path p (resolve_path (dir, f.path));
    fs::path t (resolve_path (sd, f.path));

    auto create_parent = [] (const fs::path& x)
    {
      error_code ec;
      fs::create_directories (x.parent_path (), ec);

      if (ec)
        throw io_error (x.parent_path (), "unable to create directory", ec);
    };

    create_parent (t);

    auto remove_part = [&t] ()
    {
      error_code ec;
      fs::remove (t, ec); // Best effort.
    };

    auto chunk = [&] (uint64_t received, uint64_t total)
    {
      if (total != 0 && progress)
        progress (batch_percent (i, n, file_percent (received, total)),
                  f.path);
    };

    try
    {
      co_await client_.download (m.file_url (f), t, chunk);
    }
    catch (const http_error& e)
    {
      remove_part ();
      throw transfer_error (failure_kind::http, e.status (), e.what (), f.path);
    }
    catch (const boost::system::system_error& e)
    {
      remove_part ();
      throw transfer_error (host_resolution_failure (e.code ())
                            ? failure_kind::dns
                            : failure_kind::http,
                            0,
                            e.code ().message (),
                            f.path);
    }
    catch (const io_error&)
    {
      remove_part ();
      throw;
    }
    catch (const runtime_error& e)
    {
      // Too many redirects, bad redirect URL, etc.
      //
      remove_part ();
      throw transfer_error (failure_kind::http, 0, e.what (), f.path);
    }

    create_parent (p);

    error_code ec;
    fs::rename (t, p, ec);

    if (ec)
    {
      remove_part ();
      throw io_error (p, "unable to move downloaded file into place", ec);
    }
  }

  fs::path
  download_staging_dir (const fs::path& dir)
  {
    error_code ec;
    fs::path d (fs::absolute (dir, ec));

    if (ec)
      throw io_error (dir, "unable to determine absolute path", ec);

    d = d.lexically_normal ();

    // Trailing separator (app/).
    //
    if (!d.has_filename () && d.has_relative_path ())
      d = d.parent_path ();

    if (!d.has_relative_path ())
      throw invalid_argument ("no directory to stage downloads into next to " +
                              d.string ());

    d += ".part";
    return d;
  }
}
