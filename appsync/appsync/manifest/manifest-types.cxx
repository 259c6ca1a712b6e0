#include <appsync/manifest/manifest-types.hxx>

#include <memory>
#include <vector>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

using namespace std;

namespace appsync
{
  namespace
  {
    // Incremental SHA-256 on top of the OpenSSL EVP interface.
    //
    class sha256
    {
    public:
      sha256 ()
        : ctx_ (EVP_MD_CTX_new (), &EVP_MD_CTX_free)
      {
        if (!ctx_ || EVP_DigestInit_ex (ctx_.get (), EVP_sha256 (), nullptr) != 1)
          throw runtime_error ("unable to initialize SHA-256 context");
      }

      void
      append (const void* d, size_t n)
      {
        if (EVP_DigestUpdate (ctx_.get (), d, n) != 1)
          throw runtime_error ("unable to update SHA-256 digest");
      }

      // Finish and return the digest as lowercase hex.
      //
      string
      finish ()
      {
        unsigned char h[EVP_MAX_MD_SIZE];
        unsigned int n (0);

        if (EVP_DigestFinal_ex (ctx_.get (), h, &n) != 1)
          throw runtime_error ("unable to finalize SHA-256 digest");

        ostringstream os;
        for (unsigned int i (0); i < n; ++i)
          os << hex << setw (2) << setfill ('0') << static_cast<int> (h[i]);

        return os.str ();
      }

    private:
      unique_ptr<EVP_MD_CTX, decltype (&EVP_MD_CTX_free)> ctx_;
    };
  }

  string
  compute_file_hash (const fs::path& p)
  {
    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw io_error (p, "unable to open file for hashing");

    sha256 h;

    vector<char> buf (hash_chunk_size);
    while (ifs.read (buf.data (), static_cast<streamsize> (buf.size ())) ||
           ifs.gcount () > 0)
    {
      h.append (buf.data (), static_cast<size_t> (ifs.gcount ()));
    }

    if (ifs.bad ())
      throw io_error (p, "unable to read file for hashing");

    return h.finish ();
  }

  string
  compute_hash (const void* d, size_t n)
  {
    sha256 h;
    h.append (d, n);
    return h.finish ();
  }

  bool
  valid_digest (const string& d)
  {
    if (d.size () != digest_length)
      return false;

    for (char c: d)
    {
      if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
        return false;
    }

    return true;
  }

  bool
  valid_path (const string& p)
  {
    if (p.empty () || p.front () == '/')
      return false;

    // Things that would make the path absolute or escape the install
    // directory on Windows.
    //
    if (p.find ('\\') != string::npos || p.find (':') != string::npos)
      return false;

    for (size_t b (0);;)
    {
      size_t e (p.find ('/', b));
      size_t n ((e == string::npos ? p.size () : e) - b);

      if (n == 0 ||
          (n == 1 && p[b] == '.') ||
          (n == 2 && p[b] == '.' && p[b + 1] == '.'))
        return false;

      if (e == string::npos)
        break;

      b = e + 1;
    }

    return true;
  }
}
