#include <appsync/download/download-engine.hxx>

#include <appsync/manifest/manifest-types.hxx>
#include <appsync/testing/temp-dir.hxx>
#include <appsync/testing/http-server.hxx>

#include <cassert>
#include <string>
#include <vector>
#include <utility>
#include <stdexcept>

using namespace std;
using namespace appsync;

static string
sha (const string& s)
{
  return compute_hash (s.data (), s.size ());
}

static string
content (size_t n, char b)
{
  string r;
  for (size_t i (0); i != n; ++i)
    r += static_cast<char> (b + i % 7);
  return r;
}

using events = vector<pair<int, string>>;

// The overall percentage is floor ((i + p / 100) / n * 100) for the 0-based
// file index i.
//
static void
test_percent ()
{
  assert (file_percent (0, 10) == 0);
  assert (file_percent (9, 10) == 90);
  assert (file_percent (10, 10) == 100);
  assert (file_percent (1, 3) == 33);
  assert (file_percent (2, 3) == 66);
  assert (file_percent (20, 10) == 100);

  assert (batch_percent (0, 1, 50) == 50);
  assert (batch_percent (0, 1, 100) == 100);
  assert (batch_percent (0, 2, 100) == 50);
  assert (batch_percent (1, 2, 0) == 50);
  assert (batch_percent (1, 2, 100) == 100);
  assert (batch_percent (0, 3, 100) == 33);
  assert (batch_percent (1, 3, 50) == 50);
  assert (batch_percent (2, 3, 99) == 99);
  assert (batch_percent (2, 3, 100) == 100);

  // Floating point would say (0 + 0.29) / 1 * 100 = 28.999...
  //
  assert (batch_percent (0, 1, 29) == 29);
}

// Download the paths into dir, recording the progress events.
//
static void
download (asio::io_context& ioc,
          const manifest& m,
          const vector<string>& ps,
          const fs::path& dir,
          events& es)
{
  http_client c (ioc);
  download_engine e (c);

  testing::run (ioc, [&] () -> asio::awaitable<void>
  {
    co_await e.download_all (m,
                             ps,
                             dir,
                             [&es] (int p, const string& l)
                             {
                               es.emplace_back (p, l);
                             });
  });
}

static void
test_batch ()
{
  testing::temp_dir d ("download-batch");

  asio::io_context ioc;
  testing::http_server s (ioc);

  // Multiple chunks each for a and c, b is tiny.
  //
  string a (content (200 * 1024, 'a'));
  string b ("hello");
  string c (content (70 * 1024, 'k'));

  s.add ("/files/a.bin", testing::route (200, a, "application/octet-stream"));
  s.add ("/files/sub/dir/b.txt", testing::route (200, b, "text/plain"));
  s.add ("/files/c.bin", testing::route (200, c, "application/octet-stream"));

  manifest m;
  m.download_url = s.url ("/files");
  m.add ("a.bin", sha (a));
  m.add ("sub/dir/b.txt", sha (b));
  m.add ("c.bin", sha (c));
  m.add ("untouched", sha ("x"));

  // Stale content is replaced.
  //
  testing::write_file (d / "c.bin", "old");

  events es;
  download (ioc, m, {"a.bin", "sub/dir/b.txt", "c.bin"}, d.path (), es);

  assert (testing::read_file (d / "a.bin") == a);
  assert (testing::read_file (d / "sub" / "dir" / "b.txt") == b);
  assert (testing::read_file (d / "c.bin") == c);

  assert (!fs::exists (d / "untouched"));
  assert (!fs::exists (d / "a.bin.part"));
  assert (s.hits ("/files/untouched") == 0);

  // Requests in order, one per file.
  //
  assert (s.requests () == (vector<string> {"/files/a.bin",
                                             "/files/sub/dir/b.txt",
                                             "/files/c.bin"}));

  // Non-decreasing, labelled with the file being downloaded, ending at 100.
  //
  assert (!es.empty ());

  for (size_t i (1); i != es.size (); ++i)
    assert (es[i - 1].first <= es[i].first);

  for (const auto& e: es)
    assert (e.first >= 0 && e.first <= 100);

  assert (es.front ().second == "a.bin");
  assert (es.back () == make_pair (100, string ("c.bin")));

  // Each file ends at its share of the batch.
  //
  auto last = [&es] (const string& p)
  {
    int r (-1);
    for (const auto& e: es)
      if (e.second == p)
        r = e.first;
    return r;
  };

  assert (last ("a.bin") == 33);
  assert (last ("sub/dir/b.txt") == 66);

  // More than one chunk means more than one event.
  //
  size_t n (0);
  for (const auto& e: es)
    if (e.second == "a.bin")
      ++n;

  assert (n > 1);
}

// Without Content-Length there is nothing to compute a percentage from.
//
static void
test_chunked ()
{
  testing::temp_dir d ("download-chunked");

  asio::io_context ioc;
  testing::http_server s (ioc);

  string a (content (100 * 1024, 'q'));

  testing::route r (200, a, "application/octet-stream");
  r.chunked = true;
  s.add ("/f/a.bin", r);

  manifest m;
  m.download_url = s.url ("/f");
  m.add ("a.bin", sha (a));

  events es;
  download (ioc, m, {"a.bin"}, d.path (), es);

  assert (testing::read_file (d / "a.bin") == a);
  assert (es.empty ());
}

// The first failing file aborts the batch. Files before it stay, the failed
// one leaves nothing behind, files after it are never requested.
//
static void
test_fail_fast ()
{
  testing::temp_dir d ("download-fail-fast");

  asio::io_context ioc;
  testing::http_server s (ioc);

  string a ("first");
  string b (content (64 * 1024, 'b'));
  string c ("third");

  testing::route dropped (200, b, "application/octet-stream");
  dropped.drop_after = 1000;

  s.add ("/f/1", testing::route (200, a, "text/plain"));
  s.add ("/f/2", dropped);
  s.add ("/f/3", testing::route (200, c, "text/plain"));

  manifest m;
  m.download_url = s.url ("/f");
  m.add ("1", sha (a));
  m.add ("2", sha (b));
  m.add ("3", sha (c));

  testing::write_file (d / "2", "previous");

  events es;

  try
  {
    download (ioc, m, {"1", "2", "3"}, d.path (), es);
    assert (false);
  }
  catch (const transfer_error& e)
  {
    assert (e.kind () == failure_kind::http);
    assert (e.status () == 0);
    assert (e.path () == "2");
  }

  assert (testing::read_file (d / "1") == a);
  assert (testing::read_file (d / "2") == "previous");
  assert (!fs::exists (d / "2.part"));
  assert (!fs::exists (download_staging_dir (d.path ())));
  assert (!fs::exists (d / "3"));
  assert (s.hits ("/f/3") == 0);
}

static void
test_http_error ()
{
  testing::temp_dir d ("download-http-error");

  asio::io_context ioc;
  testing::http_server s (ioc);

  manifest m;
  m.download_url = s.url ("/f");
  m.add ("gone.bin", sha ("x"));

  events es;

  try
  {
    download (ioc, m, {"gone.bin"}, d.path (), es);
    assert (false);
  }
  catch (const transfer_error& e)
  {
    assert (e.kind () == failure_kind::http);
    assert (e.status () == 404);
    assert (string (e.what ()) == "no such file");
    assert (e.path () == "gone.bin");
  }

  assert (!fs::exists (d / "gone.bin"));
  assert (!fs::exists (d / "gone.bin.part"));
  assert (!fs::exists (download_staging_dir (d.path ())));
}

// Manifest paths that look like partial downloads of other manifest paths
// are files like any other.
//
static void
test_part_names ()
{
  testing::temp_dir d ("download-part-names");

  asio::io_context ioc;
  testing::http_server s (ioc);

  string x ("x contents");
  string xp ("x.part contents");

  s.add ("/f/x.part", testing::route (200, xp, "text/plain"));
  s.add ("/f/x", testing::route (200, x, "text/plain"));

  manifest m;
  m.download_url = s.url ("/f");
  m.add ("x.part", sha (xp));
  m.add ("x", sha (x));

  events es;
  download (ioc, m, {"x.part", "x"}, d.path (), es);

  assert (testing::read_file (d / "x.part") == xp);
  assert (testing::read_file (d / "x") == x);
  assert (!fs::exists (download_staging_dir (d.path ())));

  // A failed download leaves the installed file alone.
  //
  testing::route dropped (200, x, "text/plain");
  dropped.drop_after = 2;
  s.add ("/f/x", dropped);

  fs::remove (d / "x");

  try
  {
    download (ioc, m, {"x"}, d.path (), es);
    assert (false);
  }
  catch (const transfer_error& e)
  {
    assert (e.path () == "x");
  }

  assert (testing::read_file (d / "x.part") == xp);
  assert (!fs::exists (d / "x"));
}

static void
test_staging_dir ()
{
  fs::path d (fs::temp_directory_path ().lexically_normal () / "app");

  assert (download_staging_dir (d) == fs::path (d.string () + ".part"));
  assert (download_staging_dir (d / "") == fs::path (d.string () + ".part"));
  assert (download_staging_dir (d / "sub" / "..") ==
          fs::path (d.string () + ".part"));

  assert (download_staging_dir ("app") ==
          fs::current_path () / "app.part");

  try
  {
    download_staging_dir (fs::path ("/"));
    assert (false);
  }
  catch (const invalid_argument&)
  {
  }
}

static void
test_invalid ()
{
  testing::temp_dir d ("download-invalid");

  asio::io_context ioc;
  testing::http_server s (ioc);

  manifest m;
  m.download_url = s.url ("/f");
  m.add ("a", sha ("a"));

  events es;

  try
  {
    download (ioc, m, {"a", "b"}, d.path (), es);
    assert (false);
  }
  catch (const invalid_argument&)
  {
  }

  // Nothing was requested.
  //
  assert (s.requests ().empty ());

  // Nothing to do is fine.
  //
  download (ioc, m, {}, d.path (), es);
  assert (es.empty ());
}

int
main ()
{
  test_percent ();
  test_batch ();
  test_chunked ();
  test_fail_fast ();
  test_http_error ();
  test_invalid ();
  test_part_names ();
  test_staging_dir ();
}
