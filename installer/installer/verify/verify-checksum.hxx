#pragma once

#include <string>
#include <ostream>
#include <stdexcept>
#include <filesystem>

#include <boost/asio.hpp>

#include <installer/http/http-client.hxx>

namespace installer
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  enum class checksum_type
  {
    sha256,
    sha512,
    gpg,
    unknown
  };

  std::string
  to_string (checksum_type);

  inline std::ostream&
  operator<< (std::ostream& os, checksum_type t)
  {
    return os << to_string (t);
  }

  // Checksum mismatch or a checksum we cannot verify.
  //
  class verification_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  class checksum_mismatch: public verification_error
  {
  public:
    checksum_mismatch (std::string expected, std::string actual)
      : verification_error ("SHA-256 verification failed:\n"
                            "  expected: " + expected + "\n"
                            "  actual:   " + actual),
        expected_ (std::move (expected)),
        actual_ (std::move (actual)) {}

    const std::string&
    expected () const noexcept {return expected_;}

    const std::string&
    actual () const noexcept {return actual_;}

  private:
    std::string expected_;
    std::string actual_;
  };

  // Guess the kind of checksum from its text: an armoured PGP block, or a
  // hex digest (optionally followed by a file name) whose length gives the
  // algorithm away.
  //
  checksum_type
  detect_checksum_type (const std::string&);

  // Lower-case hex SHA-256 digest of the file contents.
  //
  std::string
  compute_sha256 (const fs::path&);

  // Pick the line that applies to the file out of checksum text. Checksum
  // files list one "<digest>  <name>" per line; a lone digest applies to
  // whatever file it is checked against. Return the trimmed line.
  //
  // Throw verification_error if there are several lines and none of them
  // names the file.
  //
  std::string
  select_checksum (const std::string& text, const std::string& file_name);

  // Verify the file against checksum text (a digest or a checksum file).
  // Only SHA-256 is supported, anything else throws verification_error.
  //
  void
  verify_checksum (const fs::path&, const std::string& text);

  // As above but fetch the checksum text first. Anything but 200 is an
  // error.
  //
  asio::awaitable<void>
  verify_checksum_url (http_client&, const fs::path&, const std::string& url);
}
