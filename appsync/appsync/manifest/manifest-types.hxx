#pragma once

#include <string>
#include <cstddef>

#include <appsync/appsync-types.hxx>

namespace appsync
{
  // Length of a SHA-256 digest in hex.
  //
  constexpr std::size_t digest_length = 64;

  // Size of the chunks files are read in when hashing.
  //
  constexpr std::size_t hash_chunk_size = 64 * 1024;

  // Compute the SHA-256 digest of the file as lowercase hex.
  //
  // The file is streamed in hash_chunk_size pieces so its size doesn't
  // matter. Throw io_error if it can't be opened or read.
  //
  std::string
  compute_file_hash (const fs::path&);

  // Compute the SHA-256 digest of a memory buffer as lowercase hex.
  //
  std::string
  compute_hash (const void* data, std::size_t size);

  // Return true if the string is a valid digest: exactly digest_length
  // lowercase hex characters.
  //
  bool
  valid_digest (const std::string&);

  // Return true if the string is a valid manifest path: non-empty, relative,
  // forward slash-separated, without empty, `.`, or `..` components, and
  // without backslashes or drive letters.
  //
  bool
  valid_path (const std::string&);
}
