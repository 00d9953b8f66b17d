#include <dlauncher/update/update-checker.hxx>

#include <optional>

#include <spdlog/spdlog.h>

#include <dlauncher/client/client-build-info.hxx>
#include <dlauncher/discord/discord-api.hxx>
#include <dlauncher/error.hxx>
#include <dlauncher/install/install-installer.hxx>

using namespace std;

namespace dlauncher
{
  update_checker::
  update_checker ()
    : update_checker (&fetch_latest_version, &fetch_archive)
  {
  }

  update_checker::
  update_checker (resolver_type r, fetcher_type f)
    : resolver_ (move (r)),
      fetcher_ (move (f))
  {
  }

  void update_checker::
  set_prepare_callback (prepare_callback_type cb)
  {
    prepare_ = move (cb);
  }

  update_status update_checker::
  check (const fs::path& p, release_channel c) const
  {
    build_info bi (read_build_info (p));
    string cs (to_string (c));

    if (bi.channel != cs)
    {
      channel_mismatch_error e (cs, bi.channel);
      e.add_note ("configured channel is \"" + cs +
                  "\" while installed is channel \"" + bi.channel + '"');
      throw e;
    }

    client_version l (resolver_ (c));

    return update_status {compare_versions (bi.version, l), bi.version, l};
  }

  client_version update_checker::
  update (const fs::path& p, release_channel c, bool strict) const
  {
    optional<update_status> s;

    try
    {
      s = check (p, c);
    }
    catch (const channel_mismatch_error&)
    {
      if (strict)
        throw;

      spdlog::info ("configured release channel has been changed to {}, "
                    "installing now",
                    to_string (c));
    }

    if (s)
    {
      string n ("installed version is " + s->installed.string () +
                ", latest available is " + s->latest.string ());

      switch (s->order)
      {
        case version_order::equal_to:
        {
          error e (error_kind::no_update_available,
                   "no update to Discord is available");
          e.add_note ("latest available version is " + s->latest.string () +
                      ", which is installed");
          throw e;
        }
        case version_order::greater_than:
        {
          error e (error_kind::installed_version_ahead,
                   "installed Discord version is newer than latest available "
                   "Discord version");
          e.add_note (n);
          throw e;
        }
        case version_order::less_than:
        {
          spdlog::info ("an update to Discord is available ({}), installing "
                        "now",
                        n);
          break;
        }
      }
    }

    return install (p, c, false, strict);
  }

  client_version update_checker::
  install (const fs::path& p, release_channel c, bool force, bool strict) const
  {
    if (prepare_)
      prepare_ ();

    string a (fetcher_ (c));
    return install_archive (p, a, force, strict);
  }

  void
  print_update_status (ostream& o, const update_status& s, const string& c)
  {
    switch (s.order)
    {
      case version_order::less_than:
        o << "There is an update available for Discord " << c
          << ". Installed version is " << s.installed
          << " and latest available version is " << s.latest << ".\n";
        break;
      case version_order::equal_to:
        o << "The currently installed version of Discord " << c << " is "
          << s.installed << ", which is the latest available version.\n";
        break;
      case version_order::greater_than:
        o << "The currently installed version of Discord " << c << " is "
          << s.installed << " and latest available version is " << s.latest
          << ".\n";
        break;
    }
  }
}
