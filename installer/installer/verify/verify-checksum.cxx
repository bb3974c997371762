#include <installer/verify/verify-checksum.hxx>

#include <cctype>
#include <memory>
#include <vector>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <algorithm>

#include <openssl/evp.h>

using namespace std;

namespace installer
{
  string
  to_string (checksum_type t)
  {
    switch (t)
    {
    case checksum_type::sha256:  return "sha256";
    case checksum_type::sha512:  return "sha512";
    case checksum_type::gpg:     return "gpg";
    case checksum_type::unknown: return "unknown";
    }

    return "unknown";
  }

  static string
  trim (const string& s)
  {
    size_t b (s.find_first_not_of (" \t\r\n"));
    if (b == string::npos)
      return string ();

    size_t e (s.find_last_not_of (" \t\r\n"));
    return s.substr (b, e - b + 1);
  }

  static string
  first_token (const string& s)
  {
    istringstream is (s);
    string r;
    is >> r;
    return r;
  }

  static bool
  hex_string (const string& s)
  {
    return all_of (s.begin (), s.end (),
                   [] (unsigned char c) {return isxdigit (c) != 0;});
  }

  checksum_type
  detect_checksum_type (const string& text)
  {
    string s (trim (text));

    if (s.find ("-----BEGIN PGP") != string::npos)
      return checksum_type::gpg;

    string t (first_token (s));

    if (!hex_string (t))
      return checksum_type::unknown;

    switch (t.size ())
    {
    case 64:  return checksum_type::sha256;
    case 128: return checksum_type::sha512;
    }

    return checksum_type::unknown;
  }

  string
  compute_sha256 (const fs::path& f)
  {
    ifstream ifs (f, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open " + f.string ());

    unique_ptr<EVP_MD_CTX, void (*) (EVP_MD_CTX*)> ctx (EVP_MD_CTX_new (),
                                                        &EVP_MD_CTX_free);

    if (!ctx || EVP_DigestInit_ex (ctx.get (), EVP_sha256 (), nullptr) != 1)
      throw runtime_error ("unable to initialize SHA-256 digest");

    char buf[65536];
    while (ifs.read (buf, sizeof (buf)) || ifs.gcount () > 0)
    {
      if (EVP_DigestUpdate (ctx.get (),
                            buf,
                            static_cast<size_t> (ifs.gcount ())) != 1)
        throw runtime_error ("unable to compute SHA-256 of " + f.string ());
    }

    if (ifs.bad ())
      throw runtime_error ("unable to read " + f.string ());

    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx.get (), h, &n) != 1)
      throw runtime_error ("unable to compute SHA-256 of " + f.string ());

    ostringstream os;
    for (unsigned int i (0); i != n; ++i)
      os << hex << setw (2) << setfill ('0') << static_cast<int> (h[i]);

    return os.str ();
  }

  string
  select_checksum (const string& text, const string& name)
  {
    vector<string> ls;
    {
      istringstream is (text);
      for (string l; getline (is, l); )
      {
        l = trim (l);

        if (!l.empty ())
          ls.push_back (move (l));
      }
    }

    if (ls.empty ())
      return string ();

    if (ls.size () > 1)
    {
      for (const string& l: ls)
      {
        istringstream is (l);
        string d, n;
        is >> d >> n;

        // sha256sum marks binary mode with a leading '*'.
        //
        if (!n.empty () && n[0] == '*')
          n.erase (0, 1);

        if (!n.empty () && fs::path (n).filename ().string () == name)
          return l;
      }

      throw verification_error ("no checksum for " + name);
    }

    return ls.front ();
  }

  void
  verify_checksum (const fs::path& f, const string& text)
  {
    string s (trim (text));

    if (detect_checksum_type (s) == checksum_type::gpg)
      throw verification_error ("GPG signature verification is not supported");

    string l (select_checksum (s, f.filename ().string ()));

    switch (detect_checksum_type (l))
    {
    case checksum_type::sha256:
      break;
    case checksum_type::sha512:
      throw verification_error ("SHA-512 verification is not supported");
    case checksum_type::gpg:
    case checksum_type::unknown:
      throw verification_error ("unsupported checksum type: unknown");
    }

    string e (first_token (l));
    string a (compute_sha256 (f));

    auto ieq = [] (unsigned char x, unsigned char y)
    {
      return tolower (x) == tolower (y);
    };

    if (e.size () != a.size () || !equal (e.begin (), e.end (), a.begin (), ieq))
      throw checksum_mismatch (e, a);
  }

  asio::awaitable<void>
  verify_checksum_url (http_client& c, const fs::path& f, const string& url)
  {
    http_response r (co_await c.get (url));

    if (r.status != http_status::ok)
      throw http_status_error (r.status, url);

    verify_checksum (f, r.body ? *r.body : string ());
  }
}
