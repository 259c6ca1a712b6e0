#include <appsync/sync/sync-orchestrator.hxx>

#include <vector>
#include <optional>
#include <stdexcept>

#include <appsync/manifest/manifest-diff.hxx>
#include <appsync/manifest/manifest-client.hxx>
#include <appsync/download/download-engine.hxx>

using namespace std;

namespace appsync
{
  sync_orchestrator::
  sync_orchestrator (asio::io_context& ioc, sync_config c, progress_sink* s)
    : config_ (move (c)),
      sink_ (s),
      client_ (ioc, config_.http),
      store_ (config_.manifest_path)
  {
  }

  asio::awaitable<sync_outcome> sync_orchestrator::
  run ()
  {
    if (running_)
      throw logic_error ("sync pass already in progress");

    // Clear the flag however we leave, including by way of io_error.
    //
    struct guard
    {
      bool& r;
      explicit guard (bool& b): r (b) {r = true;}
      ~guard () {r = false;}
    } g (running_);

    // A pass that ended with an exception may have left us in any state.
    //
    if (state_ != sync_state::idle)
      reset ();

    sync_outcome r;

    report (0, "manifest");
    transition (sync_state::fetching_manifest);

    fetch_result fr (
      co_await manifest_client (client_).fetch (config_.manifest_url));

    if (!fr)
    {
      r.failure = fr.failure;
      r.status = fr.status;
      r.error_message = move (fr.error_message);

      transition (sync_state::error);
      co_return r;
    }

    const manifest& remote (fr.value);

    // Note that the local manifest is not consulted when diffing: every file
    // is rehashed against the remote digest so that changes made behind our
    // back are caught.
    //
    transition (sync_state::diffing);
    local_ = store_.load ();

    vector<string> ps (missing_files (remote, config_.install_dir));

    if (!ps.empty ())
    {
      transition (sync_state::downloading);

      optional<transfer_error> te;

      try
      {
        co_await download_engine (client_).download_all (
          remote,
          ps,
          config_.install_dir,
          [this] (int p, const string& l) {report (p, l);});
      }
      catch (const transfer_error& e)
      {
        te = e;
      }

      if (te)
      {
        r.failure = te->kind ();
        r.status = te->status ();
        r.error_message = te->what ();
        r.path = te->path ();

        transition (sync_state::error);
        co_return r;
      }

      r.downloaded = ps.size ();
    }

    transition (sync_state::persisting);
    store_.save (remote);
    local_ = remote;
    local_.download_url = nullopt;

    transition (sync_state::done);
    report (100, "done");

    r.success = true;
    co_return r;
  }

  void sync_orchestrator::
  transition (sync_state s)
  {
    if (!valid_transition (state_, s))
      throw logic_error ("invalid sync state transition");

    sync_state o (state_);
    state_ = s;

    if (state_cb_)
      state_cb_ (o, s);
  }

  void sync_orchestrator::
  reset ()
  {
    sync_state o (state_);
    state_ = sync_state::idle;

    if (state_cb_)
      state_cb_ (o, state_);
  }

  void sync_orchestrator::
  report (int p, const string& l)
  {
    if (sink_ != nullptr)
      sink_->on_progress (p, l);
  }
}
