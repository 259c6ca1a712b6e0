#pragma once

#include <string>
#include <functional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <appsync/appsync-types.hxx>
#include <appsync/http/http.hxx>
#include <appsync/manifest/manifest.hxx>
#include <appsync/manifest/manifest-store.hxx>
#include <appsync/progress/progress-types.hxx>
#include <appsync/sync/sync-types.hxx>

namespace appsync
{
  // Sync pass driver: fetch the remote manifest, work out which files are
  // missing or stale, download them, and make the remote manifest the new
  // local one.
  //
  // Server and network failures end the pass in the error state and are
  // returned as a failed outcome. Local filesystem failures (io_error) are
  // thrown. There is no retry: to try again, call run() again.
  //
  class sync_orchestrator
  {
  public:
    using state_callback = std::function<void (sync_state from,
                                                sync_state to)>;

    // The progress sink, if any, must outlive the orchestrator. It receives
    // (0, "manifest") when a pass starts, (percent, path) for each download
    // chunk, and (100, "done") once a pass is complete.
    //
    sync_orchestrator (asio::io_context&,
                       sync_config,
                       progress_sink* = nullptr);

    sync_orchestrator (const sync_orchestrator&) = delete;
    sync_orchestrator& operator= (const sync_orchestrator&) = delete;

    // Perform a sync pass.
    //
    // Throw std::logic_error if a pass on this orchestrator is already in
    // progress.
    //
    asio::awaitable<sync_outcome>
    run ();

    sync_state
    state () const noexcept
    {
      return state_;
    }

    bool
    running () const noexcept
    {
      return running_;
    }

    void
    set_state_callback (state_callback cb)
    {
      state_cb_ = std::move (cb);
    }

    const sync_config&
    config () const noexcept
    {
      return config_;
    }

    // Local manifest as loaded by the last pass that got past fetching the
    // remote one.
    //
    const manifest&
    local_manifest () const noexcept
    {
      return local_;
    }

  private:
    // Move to the state, which must be valid from the current one.
    //
    void
    transition (sync_state);

    // Move back to idle from whatever state the last pass ended in.
    //
    void
    reset ();

    void
    report (int percent, const std::string& label);

  private:
    sync_config config_;
    progress_sink* sink_;
    state_callback state_cb_;

    sync_state state_ = sync_state::idle;
    bool running_ = false;

    http_client client_;
    manifest_store store_;
    manifest local_;
  };
}
