#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>

#include <dlauncher/instance/instance-protocol.hxx>

namespace dlauncher
{
  namespace asio = boost::asio;

  // Instance control endpoint server.
  //
  // Registration happens in two steps: bind() reserves the name (failing if
  // someone else holds it) without accepting connections, so that to a
  // prober the endpoint does not exist yet. Then publish() starts answering
  // with the instance information.
  //
  // The server runs on the io_context passed at construction. Everything
  // except the accept loop itself is expected to happen before the context
  // is run or after it is stopped.
  //
  class instance_server
  {
  public:
    instance_server (asio::io_context&, std::string name);
    ~instance_server ();

    instance_server (const instance_server&) = delete;
    instance_server& operator= (const instance_server&) = delete;

    // Reserve the name. Throw error (endpoint_registration_race) if it is
    // held by a live process and error (endpoint_error) on other failures.
    //
    void
    bind ();

    // Start answering queries about the instance.
    //
    void
    publish (running_instance);

    // Stop answering and release the name.
    //
    void
    close ();

    const std::string&
    name () const noexcept {return name_;}

    // Number of requests served so far.
    //
    std::size_t
    served () const noexcept {return served_.load ();}

  private:
    asio::awaitable<void>
    accept ();

    asio::awaitable<void>
    serve (local_protocol::socket);

    std::string
    answer (const std::string& line);

    asio::io_context& ioc_;
    std::string name_;
    local_protocol::acceptor acceptor_;
    std::optional<running_instance> instance_;
    std::atomic<std::size_t> served_ {0};
    bool bound_ = false;
  };
}
