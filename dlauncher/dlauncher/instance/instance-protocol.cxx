#include <dlauncher/instance/instance-protocol.hxx>

#include <cstdlib>

#include <unistd.h>

#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  static const char service_name[] = "xyz.strangejune.DiscordLauncher";

  string
  to_string (instance_method m)
  {
    switch (m)
    {
      case instance_method::ping:            return "Ping";
      case instance_method::pid:             return "PID";
      case instance_method::version:         return "Version";
      case instance_method::release_channel: return "ReleaseChannel";
      case instance_method::stop:            return "Stop";
    }

    return "Unknown";
  }

  optional<instance_method>
  parse_instance_method (const string& s)
  {
    for (instance_method m : {instance_method::ping,
                              instance_method::pid,
                              instance_method::version,
                              instance_method::release_channel,
                              instance_method::stop})
    {
      if (s == to_string (m))
        return m;
    }

    return nullopt;
  }

  string
  default_endpoint_name ()
  {
    string n (service_name);
    n += '.';
    n += std::to_string (getuid ());

#ifdef __linux__
    return '@' + n;
#else
    string d;
    if (const char* v = getenv ("XDG_RUNTIME_DIR"))
      d = v;
    else if (const char* v = getenv ("TMPDIR"))
      d = v;
    else
      d = "/tmp";

    return d + '/' + n + ".sock";
#endif
  }

  local_protocol::endpoint
  make_endpoint (const string& n)
  {
    // Abstract socket names start with a NUL byte. The endpoint takes the
    // length from the string so the embedded NUL is preserved.
    //
    if (abstract_endpoint (n))
      return local_protocol::endpoint (string (1, '\0') + n.substr (1));

    return local_protocol::endpoint (n);
  }

  string
  encode_request (instance_method m)
  {
    json::object o;
    o["method"] = to_string (m);
    return json::serialize (o) + '\n';
  }

  optional<instance_method>
  decode_request (const string& l)
  {
    boost::system::error_code ec;
    json::value v (json::parse (l, ec));

    if (ec || !v.is_object ())
      return nullopt;

    const json::value* m (v.as_object ().if_contains ("method"));

    if (m == nullptr || !m->is_string ())
      return nullopt;

    return parse_instance_method (json::value_to<string> (*m));
  }

  string
  encode_result (const json::value& r)
  {
    json::object o;
    o["result"] = r;
    return json::serialize (o) + '\n';
  }

  string
  encode_error (const string& e)
  {
    json::object o;
    o["error"] = e;
    return json::serialize (o) + '\n';
  }

  json::value
  decode_response (const string& l)
  {
    boost::system::error_code ec;
    json::value v (json::parse (l, ec));

    if (ec || !v.is_object ())
      throw error (error_kind::endpoint_error,
                   "invalid response from running instance");

    const json::object& o (v.as_object ());

    if (const json::value* e = o.if_contains ("error"))
    {
      throw error (error_kind::endpoint_error,
                   "running instance replied with error: " +
                   (e->is_string () ? json::value_to<string> (*e)
                                    : json::serialize (*e)));
    }

    const json::value* r (o.if_contains ("result"));

    if (r == nullptr)
      throw error (error_kind::endpoint_error,
                   "invalid response from running instance");

    return *r;
  }

  json::value
  instance_result (instance_method m, const running_instance& i)
  {
    switch (m)
    {
      case instance_method::ping:
      case instance_method::stop:
        return true;
      case instance_method::pid:
        return static_cast<int64_t> (i.pid);
      case instance_method::version:
        return json::array {i.version.major, i.version.minor, i.version.patch};
      case instance_method::release_channel:
        return json::value (i.channel);
    }

    return nullptr;
  }
}
