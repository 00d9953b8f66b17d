#pragma once

#include <chrono>
#include <string>

#include <sys/types.h>

#include <dlauncher/client/client-types.hxx>
#include <dlauncher/instance/instance-protocol.hxx>

namespace dlauncher
{
  // Instance control endpoint client.
  //
  // Every call is a separate connection bounded by the timeout. If nobody
  // answers in time (or nobody is listening at all) the call throws error
  // (not_running). Any other transport failure is error (endpoint_error).
  //
  class instance_client
  {
  public:
    static constexpr std::chrono::milliseconds default_timeout {5};

    explicit
    instance_client (std::string name = default_endpoint_name (),
                     std::chrono::milliseconds timeout = default_timeout);

    // Return false instead of throwing if not running.
    //
    bool
    running () const;

    pid_t
    pid () const;

    client_version
    version () const;

    std::string
    channel () const;

    // Ask the instance to terminate the client. Does not wait.
    //
    void
    request_stop () const;

    const std::string&
    name () const noexcept {return name_;}

  private:
    json::value
    call (instance_method) const;

    std::string name_;
    std::chrono::milliseconds timeout_;
  };
}
