#include <dlauncher/instance/instance-server.hxx>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>

#include <signal.h>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  namespace fs = std::filesystem;

  instance_server::
  instance_server (asio::io_context& c, string n)
    : ioc_ (c),
      name_ (move (n)),
      acceptor_ (c)
  {
  }

  instance_server::
  ~instance_server ()
  {
    close ();
  }

  void instance_server::
  bind ()
  {
    local_protocol::endpoint ep (make_endpoint (name_));

    boost::system::error_code ec;
    acceptor_.open (local_protocol (), ec);

    if (!ec)
      acceptor_.bind (ep, ec);

    // A socket file may be left behind by a launcher that didn't get to
    // clean up. If nobody answers on it, it is stale and we take it over.
    // Abstract names go away with their owner so there is nothing to do.
    //
    if (ec == asio::error::address_in_use && !abstract_endpoint (name_))
    {
      local_protocol::socket s (ioc_);
      boost::system::error_code cec;
      s.connect (ep, cec);

      if (cec == asio::error::connection_refused)
      {
        spdlog::debug ("removing stale endpoint {}", name_);

        error_code rec;
        fs::remove (name_, rec);

        ec.clear ();
        acceptor_.bind (ep, ec);
      }
    }

    if (ec)
    {
      boost::system::error_code cec;
      acceptor_.close (cec);
    }

    if (ec == asio::error::address_in_use)
    {
      error e (error_kind::endpoint_registration_race,
               "instance endpoint is already registered");
      e.add_note ("endpoint: " + name_);
      throw e;
    }

    if (ec)
    {
      error e (error_kind::endpoint_error,
               "unable to register instance endpoint: " + ec.message ());
      e.add_note ("endpoint: " + name_);
      throw e;
    }

    bound_ = true;
    spdlog::debug ("registered endpoint {}", name_);
  }

  void instance_server::
  publish (running_instance i)
  {
    if (!bound_)
      bind ();

    boost::system::error_code ec;
    acceptor_.listen (asio::socket_base::max_listen_connections, ec);

    if (ec)
    {
      error e (error_kind::endpoint_error,
               "unable to publish instance endpoint: " + ec.message ());
      e.add_note ("endpoint: " + name_);
      throw e;
    }

    spdlog::debug ("publishing instance {} (version {}, channel {})",
                   i.pid,
                   i.version.string (),
                   i.channel);

    instance_ = move (i);

    asio::co_spawn (ioc_, accept (), asio::detached);
  }

  void instance_server::
  close ()
  {
    if (!bound_)
      return;

    boost::system::error_code ec;
    acceptor_.close (ec);

    if (!abstract_endpoint (name_))
    {
      error_code rec;
      fs::remove (name_, rec);
    }

    bound_ = false;
    instance_.reset ();
  }

  asio::awaitable<void> instance_server::
  accept ()
  {
    for (;;)
    {
      boost::system::error_code ec;
      local_protocol::socket s (
        co_await acceptor_.async_accept (
          asio::redirect_error (asio::use_awaitable, ec)));

      // Closed (or the context is going away).
      //
      if (ec == asio::error::operation_aborted || !acceptor_.is_open ())
        co_return;

      if (ec)
      {
        spdlog::warn ("instance endpoint accept failed: {}", ec.message ());
        continue;
      }

      asio::co_spawn (ioc_, serve (move (s)), asio::detached);
    }
  }

  asio::awaitable<void> instance_server::
  serve (local_protocol::socket s)
  {
    string b;

    for (;;)
    {
      boost::system::error_code ec;
      size_t n (co_await asio::async_read_until (
                  s,
                  asio::dynamic_buffer (b, 4096),
                  '\n',
                  asio::redirect_error (asio::use_awaitable, ec)));

      if (ec)
        co_return; // EOF, oversized request, or shutdown.

      string l (b.substr (0, n - 1));
      b.erase (0, n);

      string r (answer (l));

      co_await asio::async_write (s,
                                  asio::buffer (r),
                                  asio::redirect_error (asio::use_awaitable,
                                                        ec));
      if (ec)
        co_return;
    }
  }

  string instance_server::
  answer (const string& l)
  {
    optional<instance_method> m (decode_request (l));

    if (!m)
      return encode_error ("invalid request");

    if (!instance_)
      return encode_error ("no instance published");

    ++served_;
    spdlog::debug ("instance endpoint: {}", to_string (*m));

    if (*m == instance_method::stop)
    {
      if (::kill (instance_->pid, SIGTERM) != 0)
      {
        // Already gone is as good as stopped.
        //
        if (errno != ESRCH)
          return encode_error (string ("unable to stop instance: ") +
                               strerror (errno));
      }
    }

    return encode_result (instance_result (*m, *instance_));
  }
}
