#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <ostream>

#include <appsync/appsync-types.hxx>
#include <appsync/http/http-client.hxx>

namespace appsync
{
  // Sync pass state.
  //
  // idle -> fetching_manifest -> diffing -> [downloading ->] persisting -> done
  //
  // with error reachable from fetching_manifest and downloading. A new pass
  // starts from idle again.
  //
  enum class sync_state
  {
    idle,
    fetching_manifest,
    diffing,
    downloading,
    persisting,
    done,
    error
  };

  inline std::ostream&
  operator<< (std::ostream& os, sync_state s)
  {
    switch (s)
    {
      case sync_state::idle:              return os << "idle";
      case sync_state::fetching_manifest: return os << "fetching_manifest";
      case sync_state::diffing:           return os << "diffing";
      case sync_state::downloading:       return os << "downloading";
      case sync_state::persisting:        return os << "persisting";
      case sync_state::done:              return os << "done";
      case sync_state::error:             return os << "error";
    }
    return os;
  }

  // Return true if a transition from one state to the other is part of the
  // sync pass state machine.
  //
  bool
  valid_transition (sync_state from, sync_state to) noexcept;

  // Result of a sync pass.
  //
  struct sync_outcome
  {
    bool success = false;

    failure_kind failure = failure_kind::none;
    std::uint16_t status = 0; // HTTP status, 0 if none.
    std::string error_message;

    // Manifest path of the file whose download failed, if any.
    //
    std::string path;

    // Number of files downloaded.
    //
    std::size_t downloaded = 0;

    explicit operator bool () const noexcept { return success; }
  };

  // Short description of a failed outcome suitable for showing to the user.
  //
  std::string
  describe (const sync_outcome&);

  // Sync pass configuration.
  //
  struct sync_config
  {
    // Where to fetch the remote manifest from.
    //
    std::string manifest_url;

    // Local manifest file.
    //
    fs::path manifest_path = "manifest_local.json";

    // Directory the manifest files are installed into.
    //
    fs::path install_dir = "app";

    // Transport settings (timeouts, TLS, redirects).
    //
    http_client_traits<> http;
  };
}
