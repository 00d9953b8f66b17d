#include <dlauncher/instance/instance-client.hxx>

#include <exception>
#include <optional>
#include <vector>

#include <boost/asio.hpp>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  namespace asio = boost::asio;

  instance_client::
  instance_client (string n, chrono::milliseconds t)
    : name_ (move (n)),
      timeout_ (t)
  {
  }

  // One request/response exchange on a fresh connection.
  //
  static asio::awaitable<string>
  transact (local_protocol::socket& s,
            local_protocol::endpoint ep,
            instance_method m)
  {
    co_await s.async_connect (ep, asio::use_awaitable);

    string rq (encode_request (m));
    co_await asio::async_write (s, asio::buffer (rq), asio::use_awaitable);

    string b;
    size_t n (co_await asio::async_read_until (s,
                                               asio::dynamic_buffer (b, 65536),
                                               '\n',
                                               asio::use_awaitable));
    co_return b.substr (0, n - 1);
  }

  json::value instance_client::
  call (instance_method m) const
  {
    asio::io_context ioc;

    // The timer closes the socket which makes transact() fail with whatever
    // operation it was blocked on. So an exception together with expired
    // means a timeout and anything else is a genuine transport failure.
    //
    local_protocol::socket s (ioc);
    asio::steady_timer tm (ioc, timeout_);
    bool expired (false);
    bool done (false);

    tm.async_wait ([&s, &expired, &done] (const boost::system::error_code& ec)
                   {
                     if (!ec && !done)
                     {
                       expired = true;

                       boost::system::error_code ig;
                       s.close (ig);
                     }
                   });

    optional<string> l;
    exception_ptr ex;

    asio::co_spawn (ioc,
                    transact (s, make_endpoint (name_), m),
                    [&l, &ex, &tm, &done] (exception_ptr e, string r)
                    {
                      done = true;
                      tm.cancel ();

                      if (e)
                        ex = e;
                      else
                        l = move (r);
                    });

    ioc.run ();

    if (ex && expired)
    {
      spdlog::debug ("no answer from {} within {}ms",
                     name_,
                     timeout_.count ());
      throw error (error_kind::not_running, "Discord is not running");
    }

    if (ex)
    {
      try
      {
        rethrow_exception (ex);
      }
      catch (const boost::system::system_error& e)
      {
        const boost::system::error_code& ec (e.code ());

        // Nobody listening or nobody there at all.
        //
        if (ec == asio::error::connection_refused ||
            ec == boost::system::errc::no_such_file_or_directory)
        {
          spdlog::debug ("no instance at {}: {}", name_, ec.message ());
          throw error (error_kind::not_running, "Discord is not running");
        }

        error x (error_kind::endpoint_error,
                 "unable to contact running instance: " + ec.message ());
        x.add_note ("endpoint: " + name_);
        x.add_note ("while calling " + to_string (m));
        throw x;
      }
    }

    try
    {
      return decode_response (*l);
    }
    catch (error& e)
    {
      e.add_note ("while calling " + to_string (m));
      throw;
    }
  }

  // Convert the result, reporting a type mismatch as a protocol error.
  //
  template <typename T>
  static T
  result_to (const json::value& v, instance_method m)
  {
    try
    {
      return json::value_to<T> (v);
    }
    catch (const std::exception&)
    {
      error e (error_kind::endpoint_error,
               "invalid result from running instance");
      e.add_note ("while calling " + to_string (m) + ": got " +
                  json::serialize (v));
      throw e;
    }
  }

  bool instance_client::
  running () const
  {
    try
    {
      call (instance_method::ping);
      return true;
    }
    catch (const error& e)
    {
      if (e.kind () == error_kind::not_running)
        return false;

      throw;
    }
  }

  pid_t instance_client::
  pid () const
  {
    instance_method m (instance_method::pid);
    int64_t p (result_to<int64_t> (call (m), m));

    if (p <= 0)
    {
      error e (error_kind::endpoint_error,
               "invalid PID from running instance");
      e.add_note ("got " + std::to_string (p));
      throw e;
    }

    return static_cast<pid_t> (p);
  }

  client_version instance_client::
  version () const
  {
    instance_method m (instance_method::version);
    vector<uint32_t> v (result_to<vector<uint32_t>> (call (m), m));

    if (v.size () != 3)
    {
      error e (error_kind::endpoint_error,
               "invalid version from running instance");
      e.add_note ("expected [major, minor, patch]");
      throw e;
    }

    return client_version (v[0], v[1], v[2]);
  }

  string instance_client::
  channel () const
  {
    instance_method m (instance_method::release_channel);
    return result_to<string> (call (m), m);
  }

  void instance_client::
  request_stop () const
  {
    call (instance_method::stop);
  }
}
