#pragma once

#include <filesystem>
#include <ostream>

#include <dlauncher/client/client-types.hxx>
#include <dlauncher/dlauncher-config.hxx>
#include <dlauncher/dlauncher-instance.hxx>
#include <dlauncher/update/update-checker.hxx>

namespace dlauncher
{
  namespace fs = std::filesystem;

  // Installation management for the configured client.
  //
  // Anything that replaces or removes the installation first stops the
  // client if it is running.
  //
  class update_coordinator
  {
  public:
    update_coordinator (const launcher_config&, instance_coordinator&);

    update_coordinator (const launcher_config&,
                        instance_coordinator&,
                        update_checker);

    update_coordinator (const update_coordinator&) = delete;
    update_coordinator& operator= (const update_coordinator&) = delete;

    // Operations.
    //

    // Latest version published for the configured channel.
    //
    client_version
    latest_version () const;

    build_info
    installed () const;

    // See update_checker::check().
    //
    update_status
    check () const;

    // Update if there is a newer version and regenerate the desktop entry.
    // With force, download and install regardless of what is installed.
    //
    client_version
    update (bool strict_channel, bool force = false);

    // Install from scratch, replacing whatever is there, and regenerate the
    // desktop entry even if disabled.
    //
    client_version
    install ();

    // Remove the installation and the desktop entry. Both are attempted
    // even if the first fails, the first failure is thrown with the rest
    // as notes.
    //
    void
    uninstall ();

    // Write the launcher desktop entry based on the one shipped with the
    // installation. Do nothing if disabled unless forced.
    //
    void
    create_desktop_entry (bool force = false) const;

    // The desktop entry shipped with the installation.
    //
    fs::path
    sample_desktop_entry () const;

    // Print what check() found, as check-updates does. Channel mismatch is
    // reported rather than thrown.
    //
    void
    print_status (std::ostream&) const;

  private:
    // Stop the client if it is running.
    //
    void
    stop_running ();

    const launcher_config& config_;
    instance_coordinator& instance_;
    update_checker checker_;
  };
}
