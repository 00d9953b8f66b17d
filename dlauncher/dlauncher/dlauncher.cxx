#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <dlauncher/client/client-build-info.hxx>
#include <dlauncher/dlauncher-config.hxx>
#include <dlauncher/dlauncher-instance.hxx>
#include <dlauncher/dlauncher-log.hxx>
#include <dlauncher/dlauncher-options.hxx>
#include <dlauncher/dlauncher-run.hxx>
#include <dlauncher/dlauncher-update.hxx>
#include <dlauncher/error.hxx>

#include <dlauncher/version.hxx>

using namespace std;

namespace dlauncher
{
  static void
  print_usage (ostream& o)
  {
    o << "usage: dlauncher [options] <command> [<command-options>]" << "\n"
      << "\n"
      << "commands:"                                                  << "\n"
      << "  latest-version          print latest available version"  << "\n"
      << "  installed-version       print installed version"         << "\n"
      << "  installed-channel       print installed release channel" << "\n"
      << "  check-updates           check if an update is available" << "\n"
      << "  stop                    stop the running instance"       << "\n"
      << "  update [-f] [-C]        update if an update is available" << "\n"
      << "  run [<args>]            run without updating"            << "\n"
      << "  update-run [-C] [<args>]"                                 << "\n"
      << "                          update if available and run"     << "\n"
      << "  install                 install, replacing any existing"
      << " installation"                                              << "\n"
      << "  install-desktop-entry   write the launcher desktop entry" << "\n"
      << "  uninstall               remove installation and desktop"
      << " entry"                                                     << "\n"
      << "\n"
      << "options:"                                                   << "\n";

    options::print_usage (o);

    o << "\n"
      << "update options:"                                            << "\n";

    update_options::print_usage (o);

    o << "\n"
      << "Any <args> replace the configured Discord launch arguments. Use"
      << " '--' to"                                                   << "\n"
      << "pass arguments that look like launcher options."            << "\n";
  }

  // Whatever is left on the command line, for the client.
  //
  static launch_orchestrator::arguments_type
  client_arguments (cli::scanner& s)
  {
    if (!s.more ())
      return nullopt;

    vector<string> r;

    // The command's options were not parsed so the separator is still
    // there.
    //
    if (string (s.peek ()) == "--")
      s.skip ();

    while (s.more ())
      r.push_back (s.next ());

    return r;
  }

  static int
  dispatch (const string& cmd, cli::scanner& scan, const launcher_config& cfg)
  {
    instance_coordinator ic;
    update_coordinator uc (cfg, ic);

    // Commands without options reject any extra arguments.
    //
    auto no_args = [&scan, &cmd] ()
    {
      if (scan.more ())
        throw cli::unknown_argument (scan.next ());
    };

    if (cmd == "latest-version")
    {
      no_args ();
      cout << uc.latest_version () << endl;
      return 0;
    }

    if (cmd == "installed-version")
    {
      no_args ();
      cout << uc.installed ().version << endl;
      return 0;
    }

    if (cmd == "installed-channel")
    {
      no_args ();
      cout << uc.installed ().channel << endl;
      return 0;
    }

    if (cmd == "check-updates")
    {
      no_args ();
      uc.print_status (cout);
      return 0;
    }

    if (cmd == "stop")
    {
      no_args ();

      try
      {
        running_instance ri (ic.ensure_stopped ());
        spdlog::info ("stopped Discord (PID {})", ri.pid);
      }
      catch (const error& e)
      {
        if (e.kind () != error_kind::not_running)
          throw;

        print_error (cerr, e);
      }

      return 0;
    }

    if (cmd == "update")
    {
      update_options o (scan,
                        cli::unknown_mode::fail,
                        cli::unknown_mode::fail);

      try
      {
        uc.update (!o.allow_channel_swap (), o.force_update ());
      }
      catch (const error& e)
      {
        if (e.kind () != error_kind::no_update_available)
          throw;

        cout << e.what () << endl;

        for (const string& n : e.notes ())
          cout << "  info: " << n << endl;
      }

      return 0;
    }

    if (cmd == "run")
    {
      launch_orchestrator lo (cfg, ic, uc);
      return lo.run (client_arguments (scan));
    }

    if (cmd == "update-run")
    {
      // Unknown options are Discord's.
      //
      update_run_options o (scan,
                            cli::unknown_mode::stop,
                            cli::unknown_mode::stop);

      launch_orchestrator lo (cfg, ic, uc);
      return lo.update_run (!o.allow_channel_swap (), client_arguments (scan));
    }

    if (cmd == "install")
    {
      no_args ();
      uc.install ();
      return 0;
    }

    if (cmd == "install-desktop-entry")
    {
      no_args ();
      uc.create_desktop_entry (true);
      return 0;
    }

    if (cmd == "uninstall")
    {
      no_args ();
      uc.uninstall ();
      return 0;
    }

    cerr << "error: unknown command '" << cmd << "'" << "\n"
         << "  info: run 'dlauncher --help' for usage" << endl;
    return 1;
  }
}

int
main (int argc, char* argv[])
{
  using namespace dlauncher;

  try
  {
    cli::argv_scanner scan (argc, argv);
    options opt (scan, cli::unknown_mode::fail, cli::unknown_mode::stop);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "dlauncher " << DLAUNCHER_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help, or no command at all.
    //
    if (opt.help () || !scan.more ())
    {
      print_usage (cout);
      return 0;
    }

    init_log (parse_log_level (opt.log_level ()));

    string cmd (scan.next ());

    fs::path cp (opt.config_specified ()
                 ? fs::path (opt.config ())
                 : default_config_path ());

    launcher_config cfg (load_config (cp));

    return dispatch (cmd, scan, cfg);
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const dlauncher::error& e)
  {
    print_error (cerr, e);
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
