#pragma once

#include <string>
#include <vector>

#include <appsync/appsync-types.hxx>
#include <appsync/manifest/manifest.hxx>

namespace appsync
{
  // Return the paths of the manifest files that need to be downloaded into
  // the directory, in manifest order.
  //
  // A file needs to be downloaded if it doesn't exist (as a regular file) or
  // if the SHA-256 of its content differs from the manifest digest. Every
  // existing file is rehashed; the local manifest is not consulted. Files in
  // the directory that the manifest doesn't mention are ignored.
  //
  // Throw io_error if an existing file can't be read.
  //
  std::vector<std::string>
  missing_files (const manifest& remote, const fs::path& dir);

  // Resolve the manifest path against the directory.
  //
  fs::path
  resolve_path (const fs::path& dir, const std::string& path);
}
