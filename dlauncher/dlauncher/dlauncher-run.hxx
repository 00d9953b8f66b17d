#pragma once

#include <optional>
#include <string>
#include <vector>

#include <dlauncher/dlauncher-config.hxx>
#include <dlauncher/dlauncher-instance.hxx>
#include <dlauncher/dlauncher-update.hxx>

namespace dlauncher
{
  // Launch sequencing: optionally update, make sure nothing is running,
  // start the client and stay around advertising it until it exits.
  //
  class launch_orchestrator
  {
  public:
    // Arguments that replace the configured ones, if present.
    //
    using arguments_type = std::optional<std::vector<std::string>>;

    launch_orchestrator (const launcher_config&,
                         instance_coordinator&,
                         update_coordinator&);

    launch_orchestrator (const launch_orchestrator&) = delete;
    launch_orchestrator& operator= (const launch_orchestrator&) = delete;

    // Run the installed client and return its exit status.
    //
    int
    run (const arguments_type& = std::nullopt);

    // Update first. No update being available is fine, anything else going
    // wrong is not.
    //
    int
    update_run (bool strict_channel, const arguments_type& = std::nullopt);

  private:
    const launcher_config& config_;
    instance_coordinator& instance_;
    update_coordinator& update_;
  };
}
