#pragma once

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>

#include <dlauncher/client/client-types.hxx>

namespace dlauncher
{
  namespace fs = std::filesystem;

  // Relationship between the installed and the latest published version.
  //
  struct update_status
  {
    version_order order;          // Installed relative to latest.
    client_version installed;
    client_version latest;

    bool
    update_available () const noexcept
    {
      return order == version_order::less_than;
    }
  };

  // Update checker.
  //
  // Both the version lookup and the archive download are pluggable so that
  // the decision logic can be exercised without the network. By default
  // they go to the Discord download API.
  //
  class update_checker
  {
  public:
    using resolver_type = std::function<client_version (release_channel)>;
    using fetcher_type = std::function<std::string (release_channel)>;

    // Called right before the installation is replaced (for example, to
    // stop a running client).
    //
    using prepare_callback_type = std::function<void ()>;

    update_checker ();
    update_checker (resolver_type, fetcher_type);

    void
    set_prepare_callback (prepare_callback_type);

    // Compare the installation against the latest version of the channel.
    //
    // Throw channel_mismatch_error (configured, installed) if the installed
    // channel is not the configured one. This check is done before any
    // network access.
    //
    update_status
    check (const fs::path& install, release_channel configured) const;

    // Update the installation if the latest version is newer, returning the
    // new version.
    //
    // Throw error (no_update_available) if up to date and error
    // (installed_version_ahead) if the installed version is newer than the
    // latest. A channel mismatch is only an error if strict_channel is true,
    // otherwise we switch to the configured channel's latest version.
    //
    client_version
    update (const fs::path& install,
            release_channel configured,
            bool strict_channel) const;

    // Download the channel's latest archive and install it without
    // looking at what is installed first (install_archive() still does its
    // own checks according to force and strict_channel).
    //
    client_version
    install (const fs::path& install,
             release_channel,
             bool force,
             bool strict_channel) const;

    client_version
    latest (release_channel c) const
    {
      return resolver_ (c);
    }

  private:
    resolver_type resolver_;
    fetcher_type fetcher_;
    prepare_callback_type prepare_;
  };

  // Format the status for the user, as printed by check-updates.
  //
  void
  print_update_status (std::ostream&,
                       const update_status&,
                       const std::string& channel);
}
