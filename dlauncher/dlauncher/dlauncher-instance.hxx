#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <dlauncher/client/client-types.hxx>
#include <dlauncher/instance/instance-client.hxx>
#include <dlauncher/instance/instance-protocol.hxx>

namespace dlauncher
{
  namespace fs = std::filesystem;

  // Single-instance coordination.
  //
  // There is at most one client started by a launcher per user. The
  // launcher that started it advertises it on the well-known endpoint for
  // as long as it lives and other launcher invocations use the endpoint to
  // find out about it or to stop it.
  //
  class instance_coordinator
  {
  public:
    static constexpr std::chrono::milliseconds default_stop_bound {10000};
    static constexpr std::chrono::milliseconds poll_interval {50};

    // Called once the instance is advertised, from the launching thread.
    //
    using published_callback_type =
      std::function<void (const running_instance&)>;

    explicit
    instance_coordinator (
      std::string name = default_endpoint_name (),
      std::chrono::milliseconds timeout = instance_client::default_timeout);

    instance_coordinator (const instance_coordinator&) = delete;
    instance_coordinator& operator= (const instance_coordinator&) = delete;

    void
    set_published_callback (published_callback_type);

    // Return true if an instance answers on the endpoint.
    //
    bool
    running () const;

    // Query everything the instance advertises. Throw error (not_running)
    // if there is none.
    //
    running_instance
    query () const;

    // Send the stop request and return without waiting. Throw error
    // (not_running) if there is no instance.
    //
    void
    request_stop () const;

    // Stop the instance and wait until its process is gone, returning what
    // it advertised. Throw error (not_running) if there is no instance and
    // error (stop_timeout) if it is still alive after the bound.
    //
    running_instance
    ensure_stopped (std::chrono::milliseconds bound = default_stop_bound) const;

    // Start the client and advertise it until it exits, returning its exit
    // status.
    //
    // Throw error (already_running) if an instance is already advertised,
    // error (endpoint_registration_race) if the endpoint is taken, and error
    // (spawn_error) if the client cannot be started. If anything goes wrong
    // after the client has been started, it is terminated.
    //
    int
    launch (const fs::path& binary,
            const std::vector<std::string>& args,
            const fs::path& working_directory,
            const client_version&,
            const std::string& channel);

    const std::string&
    name () const noexcept {return name_;}

  private:
    std::string name_;
    std::chrono::milliseconds timeout_;
    published_callback_type published_;
  };

  // Return true if a process with this PID exists.
  //
  bool
  process_alive (pid_t);
}
