#include <dlauncher/dlauncher-instance.hxx>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <thread>

#include <signal.h>
#include <sys/wait.h>

#include <boost/asio.hpp>
#include <boost/process.hpp>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>
#include <dlauncher/instance/instance-server.hxx>

using namespace std;

namespace dlauncher
{
  namespace asio = boost::asio;
  namespace bp = boost::process;

  bool
  process_alive (pid_t p)
  {
    // EPERM means it exists but belongs to someone else.
    //
    return ::kill (p, 0) == 0 || errno == EPERM;
  }

  instance_coordinator::
  instance_coordinator (string n, chrono::milliseconds t)
    : name_ (move (n)),
      timeout_ (t)
  {
  }

  void instance_coordinator::
  set_published_callback (published_callback_type f)
  {
    published_ = move (f);
  }

  bool instance_coordinator::
  running () const
  {
    return instance_client (name_, timeout_).running ();
  }

  running_instance instance_coordinator::
  query () const
  {
    instance_client c (name_, timeout_);

    running_instance r;
    r.pid = c.pid ();
    r.version = c.version ();
    r.channel = c.channel ();
    return r;
  }

  void instance_coordinator::
  request_stop () const
  {
    instance_client (name_, timeout_).request_stop ();
  }

  running_instance instance_coordinator::
  ensure_stopped (chrono::milliseconds bound) const
  {
    running_instance r (query ());

    spdlog::info ("stopping Discord (PID {})", r.pid);
    request_stop ();

    auto deadline (chrono::steady_clock::now () + bound);

    while (process_alive (r.pid))
    {
      if (chrono::steady_clock::now () >= deadline)
      {
        error e (error_kind::stop_timeout,
                 "Discord did not exit after stop request");
        e.add_note ("PID " + std::to_string (r.pid) + " still alive after " +
                    std::to_string (bound.count ()) + "ms");
        throw e;
      }

      this_thread::sleep_for (poll_interval);
    }

    spdlog::debug ("Discord (PID {}) exited", r.pid);
    return r;
  }

  static bp::child
  spawn (const fs::path& b, const vector<string>& a, const fs::path& wd)
  {
    spdlog::info ("starting {}", b.string ());

    if (!a.empty ())
    {
      string s;
      for (const string& x : a)
        s += ' ' + x;

      spdlog::debug ("arguments:{}", s);
    }

    try
    {
      return bp::child (b.string (),
                        bp::args (a),
                        bp::start_dir (wd.string ()));
    }
    catch (const bp::process_error& x)
    {
      error e (error_kind::spawn_error,
               "unable to start " + b.string ());
      e.add_note (x.what ());
      e.add_note ("working directory: " + wd.string ());
      throw e;
    }
  }

  int instance_coordinator::
  launch (const fs::path& binary,
          const vector<string>& args,
          const fs::path& wd,
          const client_version& v,
          const string& channel)
  {
    if (running ())
    {
      error e (error_kind::already_running, "Discord is already running");
      e.add_note ("use the stop command to stop it first");
      throw e;
    }

    // Reserve the endpoint before starting anything so that a lost race
    // doesn't leave an orphaned client behind. It only becomes visible
    // once published.
    //
    asio::io_context ioc;
    instance_server srv (ioc, name_);
    srv.bind ();

    bp::child c (spawn (binary, args, wd));
    running_instance ri {static_cast<pid_t> (c.id ()), v, channel};

    auto g (asio::make_work_guard (ioc));
    thread t;

    try
    {
      srv.publish (ri);
      t = thread ([&ioc] {ioc.run ();});

      if (published_)
        published_ (ri);
    }
    catch (...)
    {
      if (t.joinable ())
      {
        ioc.stop ();
        t.join ();
      }

      srv.close ();

      spdlog::error ("terminating Discord (PID {})", ri.pid);
      ::kill (ri.pid, SIGTERM);

      std::error_code ec;
      c.wait (ec);

      throw;
    }

    spdlog::debug ("waiting for Discord (PID {}) to exit", ri.pid);

    // Wait for the exit but leave the child unreaped (and so its PID
    // reserved) until the server can no longer act on a Stop request.
    //
    std::error_code ec;
    {
      siginfo_t si;
      while (::waitid (P_PID, ri.pid, &si, WEXITED | WNOWAIT) == -1)
      {
        if (errno != EINTR)
        {
          ec = std::error_code (errno, std::generic_category ());
          break;
        }
      }
    }

    ioc.stop ();
    t.join ();
    srv.close ();

    if (!ec)
      c.wait (ec);

    if (ec)
    {
      error e (error_kind::spawn_error,
               "unable to wait for Discord: " + ec.message ());
      e.add_note ("PID " + std::to_string (ri.pid));
      throw e;
    }

    int r (c.exit_code ());
    spdlog::info ("Discord exited with status {}", r);
    return r;
  }
}
