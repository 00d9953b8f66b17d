#pragma once

#include <optional>
#include <ostream>
#include <string>

#include <sys/types.h>

#include <boost/asio/local/stream_protocol.hpp>
#include <boost/json.hpp>

#include <dlauncher/client/client-types.hxx>

namespace dlauncher
{
  namespace json = boost::json;
  using local_protocol = boost::asio::local::stream_protocol;

  // The instance control endpoint.
  //
  // While a client started by us is alive, the launcher listens on a local
  // stream socket and answers queries about it. The conversation is a
  // sequence of newline-terminated JSON documents:
  //
  //   > {"method":"PID"}
  //   < {"result":12345}
  //
  // Failures are reported as {"error":"<message>"}.
  //
  enum class instance_method
  {
    ping,             // Result: true.
    pid,              // Result: PID of the client.
    version,          // Result: [major, minor, patch].
    release_channel,  // Result: channel name.
    stop              // Result: true. Sends SIGTERM to the client.
  };

  std::string
  to_string (instance_method);

  inline std::ostream&
  operator<< (std::ostream& os, instance_method m)
  {
    return os << to_string (m);
  }

  std::optional<instance_method>
  parse_instance_method (const std::string&);

  // What we advertise about the running client.
  //
  struct running_instance
  {
    pid_t pid = 0;
    client_version version;
    std::string channel;
  };

  // Well-known endpoint name, unique per user.
  //
  // On Linux this is an abstract socket name (written with a leading `@`)
  // so that it disappears with the process and never leaves a stale file
  // behind. Elsewhere it is a socket file in the runtime directory.
  //
  std::string
  default_endpoint_name ();

  // Map an endpoint name to the socket address.
  //
  local_protocol::endpoint
  make_endpoint (const std::string& name);

  // Return true if the name refers to an abstract socket.
  //
  inline bool
  abstract_endpoint (const std::string& n)
  {
    return !n.empty () && n[0] == '@';
  }

  // Wire encoding.
  //
  std::string
  encode_request (instance_method);

  // Return nullopt if the line is not a valid request.
  //
  std::optional<instance_method>
  decode_request (const std::string& line);

  std::string
  encode_result (const json::value&);

  std::string
  encode_error (const std::string&);

  // Throw error (endpoint_error) if the line is not a valid response or is
  // an error response.
  //
  json::value
  decode_response (const std::string& line);

  // Encode the answer to the method for the instance (but don't perform any
  // side effects such as stopping).
  //
  json::value
  instance_result (instance_method, const running_instance&);
}
