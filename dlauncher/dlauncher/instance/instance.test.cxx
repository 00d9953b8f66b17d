#include <dlauncher/instance/instance-client.hxx>
#include <dlauncher/instance/instance-server.hxx>

#include <cassert>
#include <csignal>
#include <string>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio.hpp>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>

using namespace std;
using namespace dlauncher;

namespace asio = boost::asio;

// Generous compared to the default, the server thread may be slow to start.
//
static const chrono::milliseconds timeout (2000);

static string
endpoint (const string& n)
{
  return "@dlauncher-test-" + n + '-' + std::to_string (getpid ());
}

template <typename F>
static error_kind
failure (F f)
{
  try
  {
    f ();
  }
  catch (const error& e)
  {
    return e.kind ();
  }

  assert (false);
  return error_kind::io_error;
}

static void
test_protocol ()
{
  assert (encode_request (instance_method::pid) == "{\"method\":\"PID\"}\n");

  assert (decode_request ("{\"method\":\"ReleaseChannel\"}") ==
          instance_method::release_channel);
  assert (!decode_request ("{\"method\":\"pid\"}"));
  assert (!decode_request ("{\"method\":1}"));
  assert (!decode_request ("PID"));

  assert (decode_response ("{\"result\":42}").as_int64 () == 42);

  assert (failure ([] {decode_response ("{\"error\":\"nope\"}");}) ==
          error_kind::endpoint_error);
  assert (failure ([] {decode_response ("{}");}) ==
          error_kind::endpoint_error);
  assert (failure ([] {decode_response ("garbage");}) ==
          error_kind::endpoint_error);

  running_instance i {123, client_version (0, 0, 91), "ptb"};

  assert (instance_result (instance_method::ping, i) == json::value (true));
  assert (instance_result (instance_method::pid, i).to_number<int64_t> () ==
          123);
  assert (instance_result (instance_method::release_channel, i) ==
          json::value ("ptb"));
  assert (instance_result (instance_method::version, i).as_array ().size () ==
          3);

  assert (abstract_endpoint ("@x") && !abstract_endpoint ("/tmp/x"));
}

static void
test_not_running ()
{
  instance_client c (endpoint ("absent"));

  assert (!c.running ());
  assert (failure ([&c] {c.pid ();}) == error_kind::not_running);
  assert (failure ([&c] {c.request_stop ();}) == error_kind::not_running);
}

// Bound but not yet published looks the same as not running.
//
static void
test_bound ()
{
  string n (endpoint ("bound"));

  asio::io_context ioc;
  instance_server s (ioc, n);
  s.bind ();

  instance_client c (n, timeout);
  assert (!c.running ());

  // The name is taken though.
  //
  asio::io_context ioc2;
  instance_server s2 (ioc2, n);
  assert (failure ([&s2] {s2.bind ();}) ==
          error_kind::endpoint_registration_race);

  s.close ();

  // And free again.
  //
  s2.bind ();
}

static void
test_published ()
{
  string n (endpoint ("published"));

  asio::io_context ioc;
  auto g (asio::make_work_guard (ioc));

  instance_server s (ioc, n);
  s.publish (running_instance {4242, client_version (1, 2, 3), "canary"});

  thread t ([&ioc] {ioc.run ();});

  instance_client c (n, timeout);

  assert (c.running ());
  assert (c.pid () == 4242);
  assert (c.version () == client_version (1, 2, 3));
  assert (c.channel () == "canary");

  ioc.stop ();
  t.join ();

  s.close ();
  assert (s.served () == 4);
  assert (!instance_client (n).running ());
}

// Read one request from each of n connections and hang up without answering
// (or, if wait, only after the client has hung up itself).
//
static thread
hangup_server (local_protocol::acceptor& a, size_t n, bool wait)
{
  return thread ([&a, n, wait]
  {
    for (size_t i (0); i != n; ++i)
    {
      local_protocol::socket s (a.get_executor ());
      a.accept (s);

      boost::system::error_code ec;
      string b;
      asio::read_until (s, asio::dynamic_buffer (b), '\n', ec);

      if (wait)
      {
        char c;
        s.read_some (asio::buffer (&c, 1), ec);
      }

      s.close (ec);
    }
  });
}

// A connection that is dropped by the other side is a transport failure,
// not an absent instance.
//
static void
test_hangup ()
{
  string n (endpoint ("hangup"));

  asio::io_context ioc;
  local_protocol::acceptor a (ioc, make_endpoint (n));

  thread t (hangup_server (a, 2, false));

  instance_client c (n, timeout);
  assert (failure ([&c] {c.pid ();}) == error_kind::endpoint_error);
  assert (failure ([&c] {c.running ();}) == error_kind::endpoint_error);

  t.join ();
}

// Silence until the timeout is the same as not running.
//
static void
test_silent ()
{
  string n (endpoint ("silent"));

  asio::io_context ioc;
  local_protocol::acceptor a (ioc, make_endpoint (n));

  thread t (hangup_server (a, 1, true));

  instance_client c (n, chrono::milliseconds (100));
  assert (failure ([&c] {c.pid ();}) == error_kind::not_running);

  t.join ();
}

// Stop signals the advertised process.
//
static void
test_stop ()
{
  pid_t p (fork ());
  assert (p != -1);

  if (p == 0)
  {
    for (;;)
      pause ();
  }

  string n (endpoint ("stop"));

  asio::io_context ioc;
  auto g (asio::make_work_guard (ioc));

  instance_server s (ioc, n);
  s.bind ();
  s.publish (running_instance {p, client_version (1, 0, 0), "stable"});

  thread t ([&ioc] {ioc.run ();});

  instance_client (n, timeout).request_stop ();

  int st (0);
  assert (waitpid (p, &st, 0) == p);
  assert (WIFSIGNALED (st) && WTERMSIG (st) == SIGTERM);

  ioc.stop ();
  t.join ();
}

int
main ()
{
  spdlog::set_level (spdlog::level::err);

  test_protocol ();
  test_not_running ();
  test_bound ();
  test_hangup ();
  test_silent ();
  test_published ();
  test_stop ();
}
