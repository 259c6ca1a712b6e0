#pragma once

#include <appsync/appsync-types.hxx>
#include <appsync/manifest/manifest.hxx>

namespace appsync
{
  // Local manifest: the last known good state of the installation, kept as
  // {"files": {...}} in a JSON file.
  //
  class manifest_store
  {
  public:
    explicit
    manifest_store (fs::path file)
      : file_ (std::move (file)) {}

    // Load the local manifest.
    //
    // A missing, unreadable, or invalid file yields the empty manifest:
    // broken local state must never prevent a sync from bootstrapping the
    // installation again.
    //
    manifest
    load () const;

    // Replace the local manifest with the files of the given manifest (the
    // download URL is not stored).
    //
    // The new content is written to a temporary file beside the target which
    // is then renamed over it, so a crash can't leave a truncated manifest
    // behind. Throw io_error on failure.
    //
    void
    save (const manifest&) const;

    const fs::path&
    file () const noexcept
    {
      return file_;
    }

  private:
    fs::path file_;
  };
}
