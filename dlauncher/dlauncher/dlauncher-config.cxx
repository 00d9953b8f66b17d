#include <dlauncher/dlauncher-config.hxx>

#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

#include <boost/json.hpp>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  namespace json = boost::json;

  static const char app_name[] = "discord_launcher";
  static const char desktop_entry_file[] =
    "xyz.strangejune.DiscordLauncher.desktop";

  // As data_home() but return nullopt if there is no HOME to fall back to.
  //
  static optional<fs::path>
  find_data_home ()
  {
    if (const char* d = getenv ("XDG_DATA_HOME"))
    {
      // Relative values are invalid and should be ignored.
      //
      if (*d != '\0' && fs::path (d).is_absolute ())
        return fs::path (d);
    }

    const char* h (getenv ("HOME"));

    if (h == nullptr || *h == '\0')
      return nullopt;

    return fs::path (h) / ".local" / "share";
  }

  fs::path
  data_home ()
  {
    if (optional<fs::path> r = find_data_home ())
      return *r;

    throw error (error_kind::config_error,
                 "unable to determine data directory: HOME is not set");
  }

  fs::path
  default_config_path ()
  {
    return data_home () / app_name / "config.json";
  }

  // The running executable, which is what desktop entries should point to.
  //
  static fs::path
  self_path ()
  {
    error_code ec;
    fs::path p (fs::read_symlink ("/proc/self/exe", ec));

    if (ec)
    {
      spdlog::debug ("unable to determine launcher path: {}", ec.message ());
      return "dlauncher";
    }

    return p;
  }

  launcher_config
  default_config ()
  {
    optional<fs::path> dh (find_data_home ());

    launcher_config r;
    if (dh)
      r.discord_path = *dh / app_name / "Discord";
    r.working_directory = "/usr/bin";
    r.launcher_path = self_path ();
    r.channel = release_channel::stable;

    r.desktop_entry.enabled = true;
    if (dh)
      r.desktop_entry.path = *dh / "applications" / desktop_entry_file;
    r.desktop_entry.tryexec = true;
    r.desktop_entry.update_action = false;

    return r;
  }

  static error
  type_error (const string& k, const char* t)
  {
    error e (error_kind::config_error, "invalid configuration value");
    e.add_note ("'" + k + "' must be " + t);
    return e;
  }

  // Typed lookups. Leave the value alone if the key is absent.
  //
  static void
  get (const json::object& o, const string& p, const char* k, string& v)
  {
    if (const json::value* x = o.if_contains (k))
    {
      if (!x->is_string ())
        throw type_error (p + k, "a string");

      v = json::value_to<string> (*x);
    }
  }

  static void
  get (const json::object& o, const string& p, const char* k, fs::path& v)
  {
    string s;
    if (o.contains (k))
    {
      get (o, p, k, s);
      v = s;
    }
  }

  static void
  get (const json::object& o, const string& p, const char* k, bool& v)
  {
    if (const json::value* x = o.if_contains (k))
    {
      if (!x->is_bool ())
        throw type_error (p + k, "a boolean");

      v = x->get_bool ();
    }
  }

  static void
  get (const json::object& o,
       const string& p,
       const char* k,
       vector<string>& v)
  {
    if (const json::value* x = o.if_contains (k))
    {
      if (!x->is_array ())
        throw type_error (p + k, "an array of strings");

      vector<string> r;
      for (const json::value& a : x->get_array ())
      {
        if (!a.is_string ())
          throw type_error (p + k, "an array of strings");

        r.push_back (json::value_to<string> (a));
      }

      v = move (r);
    }
  }

  launcher_config
  parse_config (const string& s, const launcher_config& d)
  {
    boost::system::error_code ec;
    json::value jv (json::parse (s, ec));

    if (ec)
    {
      error e (error_kind::config_error, "invalid configuration");
      e.add_note (ec.message ());
      throw e;
    }

    if (!jv.is_object ())
      throw error (error_kind::config_error,
                   "configuration must be a JSON object");

    const json::object& o (jv.as_object ());
    launcher_config r (d);

    get (o, "", "discord_path", r.discord_path);
    get (o, "", "working_directory", r.working_directory);
    get (o, "", "launch_args", r.launch_args);
    get (o, "", "launcher_path", r.launcher_path);

    {
      string c (to_string (r.channel));
      get (o, "", "release_channel", c);

      optional<release_channel> rc (parse_release_channel (c));

      if (!rc)
      {
        error e (error_kind::config_error,
                 "unknown release channel '" + c + "'");
        e.add_note ("valid channels are stable, ptb, and canary");
        throw e;
      }

      r.channel = *rc;
    }

    if (const json::value* x = o.if_contains ("desktop_entry"))
    {
      if (!x->is_object ())
        throw type_error ("desktop_entry", "an object");

      const json::object& de (x->get_object ());
      const string p ("desktop_entry.");

      get (de, p, "enabled", r.desktop_entry.enabled);
      get (de, p, "path", r.desktop_entry.path);
      get (de, p, "tryexec", r.desktop_entry.tryexec);
      get (de, p, "update_action", r.desktop_entry.update_action);
    }

    return r;
  }

  string
  serialize_config (const launcher_config& c)
  {
    json::array a;
    for (const string& s : c.launch_args)
      a.emplace_back (s);

    json::object de;
    de["enabled"] = c.desktop_entry.enabled;
    de["path"] = c.desktop_entry.path.string ();
    de["tryexec"] = c.desktop_entry.tryexec;
    de["update_action"] = c.desktop_entry.update_action;

    json::object o;
    o["discord_path"] = c.discord_path.string ();
    o["working_directory"] = c.working_directory.string ();
    o["launch_args"] = move (a);
    o["launcher_path"] = c.launcher_path.string ();
    o["release_channel"] = to_string (c.channel);
    o["desktop_entry"] = move (de);

    return json::serialize (o) + '\n';
  }

  launcher_config
  load_config (const fs::path& p)
  {
    launcher_config d (default_config ());

    error_code ec;
    fs::file_status st (fs::status (p, ec));

    if (!fs::exists (st))
    {
      // Don't write out a configuration with holes in it.
      //
      if (d.discord_path.empty () || d.desktop_entry.path.empty ())
        data_home ();

      spdlog::info ("initializing config at {}", p.string ());

      if (p.has_parent_path ())
      {
        fs::create_directories (p.parent_path (), ec);

        if (ec)
        {
          error e (error_kind::config_error,
                   "unable to create configuration directory");
          e.add_note (p.parent_path ().string () + ": " + ec.message ());
          throw e;
        }
      }

      ofstream o (p);
      o << serialize_config (d);
      o.close ();

      if (!o)
      {
        error e (error_kind::config_error, "unable to write configuration");
        e.add_note ("while writing " + p.string ());
        throw e;
      }

      return d;
    }

    if (fs::is_directory (st))
      throw error (error_kind::is_a_directory,
                   "configuration path " + p.string () + " is a directory");

    spdlog::debug ("config found at {}", p.string ());

    ifstream i (p);
    ostringstream s;
    s << i.rdbuf ();

    if (!i)
    {
      error e (error_kind::config_error, "unable to read configuration");
      e.add_note ("while reading " + p.string ());
      throw e;
    }

    launcher_config r;
    try
    {
      r = parse_config (s.str (), d);
    }
    catch (error& e)
    {
      e.add_note ("while reading " + p.string ());
      throw;
    }

    // Paths without a default have to come from the file.
    //
    auto require = [&p] (const fs::path& v, const char* k)
    {
      if (v.empty ())
      {
        error e (error_kind::config_error,
                 string ("'") + k + "' is not set and has no default");
        e.add_note ("HOME is not set");
        e.add_note ("while reading " + p.string ());
        throw e;
      }
    };

    require (r.discord_path, "discord_path");

    if (r.desktop_entry.enabled)
      require (r.desktop_entry.path, "desktop_entry.path");

    return r;
  }
}
