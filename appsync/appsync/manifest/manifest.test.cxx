#include <appsync/manifest/manifest.hxx>

#include <cassert>
#include <string>
#include <stdexcept>

using namespace std;
using namespace appsync;

static const string h1 (
  "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");

static const string h2 (
  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

static void
check_fail (const string& json)
{
  try
  {
    manifest m (json);
    assert (false);
  }
  catch (const manifest_error&)
  {
  }
}

static void
test_parse ()
{
  manifest m ("{\"download_url\": \"http://x/files\", \"files\": {"
              "\"b.txt\": \"" + h2 + "\", "
              "\"a/c.bin\": \"" + h1 + "\"}}");

  assert (m.download_url == string ("http://x/files"));

  // Manifest order, not sorted.
  //
  assert (m.files.size () == 2);
  assert (m.files[0].path == "b.txt" && m.files[0].digest == h2);
  assert (m.files[1].path == "a/c.bin" && m.files[1].digest == h1);

  assert (m.find ("a/c.bin") != nullptr);
  assert (m.find ("a/c.bin")->digest == h1);
  assert (m.find ("c.bin") == nullptr);

  // Local manifests have no download URL and may be empty.
  //
  manifest l (string ("{\"files\": {}}"));
  assert (l.empty ());
  assert (!l.download_url);

  // Unknown members are ignored.
  //
  manifest u ("{\"version\": 3, \"files\": {\"a\": \"" + h1 + "\"}}");
  assert (u.files.size () == 1);
}

static void
test_parse_fail ()
{
  check_fail ("");
  check_fail ("not json");
  check_fail ("{\"files\": {}");
  check_fail ("[]");
  check_fail ("{}");
  check_fail ("{\"files\": []}");
  check_fail ("{\"files\": {\"a\": 1}}");
  check_fail ("{\"files\": {}, \"download_url\": 1}");
  check_fail ("{\"files\": {\"a\": \"abc\"}}");
  check_fail ("{\"files\": {\"a\": \"" + string (64, 'A') + "\"}}");
  check_fail ("{\"files\": {\"../a\": \"" + h1 + "\"}}");
  check_fail ("{\"files\": {\"/a\": \"" + h1 + "\"}}");
}

static void
test_add ()
{
  manifest m;
  m.add ("a", h1);

  try
  {
    m.add ("a", h2);
    assert (false);
  }
  catch (const manifest_error&)
  {
  }

  try
  {
    m.add ("b//c", h2);
    assert (false);
  }
  catch (const manifest_error&)
  {
  }

  assert (m.files.size () == 1);
}

// Serialized form is sorted by key and indented by four spaces so that the
// same manifest always produces the same bytes.
//
static void
test_serialize ()
{
  manifest m;
  m.add ("b.txt", h2);
  m.add ("a.txt", h1);

  assert (m.string () ==
          "{\n"
          "    \"files\": {\n"
          "        \"a.txt\": \"" + h1 + "\",\n"
          "        \"b.txt\": \"" + h2 + "\"\n"
          "    }\n"
          "}");

  m.download_url = "http://x/files";

  assert (m.string () ==
          "{\n"
          "    \"download_url\": \"http://x/files\",\n"
          "    \"files\": {\n"
          "        \"a.txt\": \"" + h1 + "\",\n"
          "        \"b.txt\": \"" + h2 + "\"\n"
          "    }\n"
          "}");

  assert (manifest ().string () == "{\n    \"files\": {}\n}");

  // What we write we can read back, order aside.
  //
  manifest r (m.string ());
  assert (r.download_url == m.download_url);
  assert (r.files.size () == 2);
  assert (r.find ("a.txt")->digest == h1);
  assert (r.find ("b.txt")->digest == h2);
}

static void
test_serialize_sorted ()
{
  json::object o;
  o["z"] = 1;
  o["a"] = json::array ({true, nullptr});
  o["m"] = json::object ();

  assert (serialize_sorted (o) ==
          "{\n"
          "    \"a\": [\n"
          "        true,\n"
          "        null\n"
          "    ],\n"
          "    \"m\": {},\n"
          "    \"z\": 1\n"
          "}");

  assert (serialize_sorted (json::value ("q\"")) == "\"q\\\"\"");
}

static void
test_file_url ()
{
  manifest m;
  m.download_url = "http://x/files";
  m.add ("bin/client.exe", h1);
  m.add ("data/my map #1.dat", h2);

  assert (m.file_url (m.files[0]) == "http://x/files/bin/client.exe");
  assert (m.file_url (m.files[1]) == "http://x/files/data/my%20map%20%231.dat");

  assert (encode_url_path ("a-b_c.d~e/f") == "a-b_c.d~e/f");
  assert (encode_url_path ("100%") == "100%25");
  assert (encode_url_path ("\xc3\xa9") == "%C3%A9");

  manifest l;
  l.add ("a", h1);

  try
  {
    l.file_url (l.files[0]);
    assert (false);
  }
  catch (const logic_error&)
  {
  }
}

int
main ()
{
  test_parse ();
  test_parse_fail ();
  test_add ();
  test_serialize ();
  test_serialize_sorted ();
  test_file_url ();
}
