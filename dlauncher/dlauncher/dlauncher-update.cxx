#include <dlauncher/dlauncher-update.hxx>

#include <optional>
#include <system_error>

#include <spdlog/spdlog.h>

#include <dlauncher/client/client-build-info.hxx>
#include <dlauncher/desktop/desktop-entry.hxx>
#include <dlauncher/error.hxx>
#include <dlauncher/install/install-installer.hxx>

using namespace std;

namespace dlauncher
{
  static const char icon_name[] = "discord.png";

  update_coordinator::
  update_coordinator (const launcher_config& c, instance_coordinator& i)
    : update_coordinator (c, i, update_checker ())
  {
  }

  update_coordinator::
  update_coordinator (const launcher_config& c,
                      instance_coordinator& i,
                      update_checker uc)
    : config_ (c),
      instance_ (i),
      checker_ (move (uc))
  {
    checker_.set_prepare_callback ([this] () {stop_running ();});
  }

  void update_coordinator::
  stop_running ()
  {
    try
    {
      instance_.ensure_stopped ();
    }
    catch (const error& e)
    {
      if (e.kind () != error_kind::not_running)
        throw;

      spdlog::debug ("Discord is not running");
    }
  }

  client_version update_coordinator::
  latest_version () const
  {
    return checker_.latest (config_.channel);
  }

  build_info update_coordinator::
  installed () const
  {
    return read_build_info (config_.discord_path);
  }

  update_status update_coordinator::
  check () const
  {
    return checker_.check (config_.discord_path, config_.channel);
  }

  client_version update_coordinator::
  update (bool strict, bool force)
  {
    client_version v;

    if (force)
    {
      spdlog::info ("forcing update of Discord {}",
                    to_string (config_.channel));
      v = checker_.install (config_.discord_path, config_.channel, true, strict);
    }
    else
      v = checker_.update (config_.discord_path, config_.channel, strict);

    spdlog::info ("Discord updated to version {}", v.string ());

    create_desktop_entry ();
    return v;
  }

  client_version update_coordinator::
  install ()
  {
    client_version v (
      checker_.install (config_.discord_path, config_.channel, true, false));

    if (!v.empty ())
      spdlog::info ("installed Discord version {}", v.string ());

    create_desktop_entry (true);
    return v;
  }

  void update_coordinator::
  uninstall ()
  {
    stop_running ();

    const fs::path& ip (config_.discord_path);
    const fs::path& ep (config_.desktop_entry.path);

    optional<error> r;

    // Record the failure and keep going.
    //
    auto fail = [&r] (error e)
    {
      spdlog::error ("{}", e.what ());

      if (!r)
        r = move (e);
      else
        r->add_note (e.what ());
    };

    spdlog::info ("removing Discord installation at {}", ip.string ());

    {
      error_code ec;
      fs::file_status st (fs::symlink_status (ip, ec));

      if (!fs::exists (st))
        fail (error (error_kind::file_not_found,
                     "Discord installation did not exist at " + ip.string ()));
      else if (!fs::is_directory (st))
        throw error (error_kind::not_a_directory,
                     "Discord installation at " + ip.string () +
                     " is not a directory");
      else
        remove_directory (ip);
    }

    spdlog::info ("removing launcher desktop entry at {}", ep.string ());

    {
      error_code ec;
      fs::file_status st (fs::symlink_status (ep, ec));

      if (!fs::exists (st))
        fail (error (error_kind::file_not_found,
                     "desktop entry did not exist at " + ep.string ()));
      else if (fs::is_directory (st))
        throw error (error_kind::is_a_directory,
                     "desktop entry at " + ep.string () + " is not a file");
      else if (!fs::remove (ep, ec) && ec)
      {
        error e (error_kind::io_error,
                 "unable to remove desktop entry " + ep.string ());
        e.add_note (ec.message ());
        fail (move (e));
      }
    }

    if (r)
      throw *r;
  }

  fs::path update_coordinator::
  sample_desktop_entry () const
  {
    // The installed build info is what really tells us which client this
    // is. An installation without it (forced install of an archive without
    // metadata) has to go by the configuration.
    //
    release_channel c (config_.channel);

    try
    {
      build_info bi (installed ());

      if (optional<release_channel> x = parse_release_channel (bi.channel))
        c = *x;
    }
    catch (const error& e)
    {
      if (e.kind () != error_kind::build_info_missing)
        throw;

      spdlog::debug ("no build info, using configured channel {}",
                     to_string (c));
    }

    return config_.discord_path / desktop_entry_name (c);
  }

  void update_coordinator::
  create_desktop_entry (bool force) const
  {
    const desktop_entry_config& dc (config_.desktop_entry);

    if (!dc.enabled && !force)
    {
      spdlog::info ("not creating desktop entry because it is disabled");
      return;
    }

    spdlog::info ("reading Discord installation desktop entry");

    desktop_entry de (desktop_entry::read (sample_desktop_entry ()));

    launcher_entry le;
    le.icon = config_.discord_path / icon_name;
    le.launcher = config_.launcher_path;
    le.tryexec = dc.tryexec;
    le.update_action = dc.update_action;

    customize_entry (de, le);

    spdlog::info ("writing launcher desktop entry to {}", dc.path.string ());
    de.write (dc.path);
  }

  void update_coordinator::
  print_status (ostream& o) const
  {
    string c (to_string (config_.channel));

    try
    {
      print_update_status (o, check (), c);
    }
    catch (const channel_mismatch_error& e)
    {
      build_info bi (installed ());

      o << "The currently installed version of Discord is of the release "
        << "channel " << e.actual () << ", version " << bi.version
        << ", but the configuration specifies release channel "
        << e.expected () << ".\n";
    }
  }
}
