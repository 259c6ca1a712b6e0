#include <memory>
#include <string>
#include <iostream>
#include <exception>
#include <stdexcept>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <boost/process.hpp>

#include <appsync/appsync-types.hxx>
#include <appsync/appsync-options.hxx>
#include <appsync/appsync-progress.hxx>
#include <appsync/sync/sync-types.hxx>
#include <appsync/sync/sync-orchestrator.hxx>

#include <appsync/version.hxx>

using namespace std;

namespace appsync
{
  // Prompt the user for a Yes/No answer.
  //
  // An empty answer selects the default, if any, but only when terminated by
  // a newline. Throw ios_base::failure if stdin can't be read (closed or not
  // interactive).
  //
  static bool
  confirm_action (const string& prompt, char def = '\0')
  {
    string a;
    do
    {
      cout << prompt << ' ';

      getline (cin, a);

      bool f (cin.fail ());
      bool e (cin.eof ());

      if (f || e)
        cout << endl;

      if (f)
        throw ios_base::failure ("unable to read y/n answer from stdin");

      if (a.empty () && def != '\0' && !e)
        a = def;

    } while (a != "y" && a != "Y" && a != "n" && a != "N");

    return a == "y" || a == "Y";
  }

  // Run one sync pass to completion on the context.
  //
  // Local failures (io_error and friends) escape the pass as exceptions and
  // are rethrown here.
  //
  static sync_outcome
  sync_pass (asio::io_context& ioc, sync_orchestrator& o)
  {
    sync_outcome r;
    exception_ptr ex;

    asio::co_spawn (
      ioc,
      o.run (),
      [&r, &ex] (exception_ptr e, sync_outcome v)
      {
        if (e)
          ex = e;
        else
          r = move (v);
      });

    ioc.run ();
    ioc.restart ();

    if (ex)
      rethrow_exception (ex);

    return r;
  }

  // Start the client from the installation directory and let it run on its
  // own.
  //
  static int
  launch_client (const options& opt, const fs::path& dir)
  {
    fs::path p (dir / fs::path (opt.client_exe ()));

    if (!fs::exists (p))
    {
      cerr << "error: client executable not found: " << p << "\n";
      return 1;
    }

    try
    {
      namespace bp = boost::process;

      bp::child c (p.string (),
                   bp::args (opt.client_args ()),
                   bp::start_dir (fs::path (dir).make_preferred ().string ()));

      c.detach ();
    }
    catch (const exception& e)
    {
      cerr << "error: unable to launch client: " << e.what () << "\n";
      return 1;
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  using namespace appsync;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "appsync " << APPSYNC_VERSION_STR << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: appsync --manifest-url <url> [options]" << "\n"
        << "options:"                                       << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (!opt.manifest_url_specified ())
    {
      cerr << "error: --manifest-url is required" << "\n"
           << "  info: run 'appsync --help' for more information" << endl;
      return 1;
    }

    // Map the command line options to the sync configuration.
    //
    sync_config c;
    c.manifest_url  = opt.manifest_url ();
    c.manifest_path = fs::path (opt.manifest_file ());
    c.install_dir   = fs::path (opt.install_dir ());

    c.http.connect_timeout = opt.connect_timeout ();
    c.http.request_timeout = opt.timeout ();
    c.http.verify_ssl      = !opt.insecure ();

    if (opt.ca_file_specified ())
      c.http.ssl_cert_file = opt.ca_file ();

    if (opt.insecure ())
      cerr << "warning: server certificate verification is disabled" << endl;

    asio::io_context ioc;

    unique_ptr<console_progress> progress;
    if (!opt.no_progress ())
      progress = make_unique<console_progress> (cerr);

    sync_orchestrator o (ioc, move (c), progress.get ());

    if (opt.verbose ())
    {
      o.set_state_callback ([&progress] (sync_state f, sync_state t)
      {
        if (progress != nullptr)
          progress->finish ();

        cout << "sync: " << f << " -> " << t << endl;
      });
    }

    // Sync until we are up to date or the user gives up.
    //
    for (;;)
    {
      sync_outcome r (sync_pass (ioc, o));

      if (progress != nullptr)
        progress->finish ();

      if (r)
      {
        if (opt.verbose ())
          cout << "sync: " << describe (r) << " ("
               << r.downloaded << " file(s) downloaded)" << endl;
        break;
      }

      cerr << "error: " << describe (r) << endl;

      if (!opt.retry () || !confirm_action ("retry? [Y/n]", 'y'))
        return 1;
    }

    if (opt.no_launch () || !opt.client_exe_specified ())
      return 0;

    return launch_client (opt, o.config ().install_dir);
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
