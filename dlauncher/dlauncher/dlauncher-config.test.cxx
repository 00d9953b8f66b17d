#include <dlauncher/dlauncher-config.hxx>

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>

using namespace std;
using namespace dlauncher;

static fs::path
scratch (const string& n)
{
  fs::path d (fs::temp_directory_path () / ("dlauncher-config-test-" + n));
  fs::remove_all (d);
  return d;
}

static error_kind
parse_failure (const string& s)
{
  try
  {
    parse_config (s, default_config ());
  }
  catch (const error& e)
  {
    return e.kind ();
  }

  assert (false);
  return error_kind::io_error;
}

static error_kind
load_failure (const fs::path& p)
{
  try
  {
    load_config (p);
  }
  catch (const error& e)
  {
    return e.kind ();
  }

  assert (false);
  return error_kind::io_error;
}

static void
test_paths ()
{
  setenv ("XDG_DATA_HOME", "/xdg/data", 1);

  assert (data_home () == fs::path ("/xdg/data"));
  assert (default_config_path () ==
          fs::path ("/xdg/data/discord_launcher/config.json"));

  launcher_config c (default_config ());

  assert (c.discord_path == fs::path ("/xdg/data/discord_launcher/Discord"));
  assert (c.working_directory == fs::path ("/usr/bin"));
  assert (c.channel == release_channel::stable);
  assert (c.launch_args.empty ());
  assert (c.desktop_entry.enabled && c.desktop_entry.tryexec);
  assert (!c.desktop_entry.update_action);
  assert (c.desktop_entry.path ==
          fs::path ("/xdg/data/applications/"
                    "xyz.strangejune.DiscordLauncher.desktop"));
  assert (c.binary () == c.discord_path / "Discord");

  // Relative is ignored.
  //
  setenv ("XDG_DATA_HOME", "relative", 1);
  setenv ("HOME", "/home/user", 1);
  assert (data_home () == fs::path ("/home/user/.local/share"));

  unsetenv ("XDG_DATA_HOME");
  assert (data_home () == fs::path ("/home/user/.local/share"));
}

static void
test_parse ()
{
  launcher_config d (default_config ());

  // Missing keys are defaults.
  //
  launcher_config c (parse_config ("{}", d));
  assert (c.discord_path == d.discord_path);
  assert (c.channel == d.channel);

  c = parse_config (
    "{"
    "\"discord_path\": \"/opt/discord\","
    "\"launch_args\": [\"--start-minimized\"],"
    "\"release_channel\": \"canary\","
    "\"desktop_entry\": {\"enabled\": false, \"update_action\": true}"
    "}",
    d);

  assert (c.discord_path == fs::path ("/opt/discord"));
  assert (c.launch_args.size () == 1 &&
          c.launch_args[0] == "--start-minimized");
  assert (c.channel == release_channel::canary);
  assert (c.binary () == fs::path ("/opt/discord/DiscordCanary"));
  assert (!c.desktop_entry.enabled);
  assert (c.desktop_entry.update_action);
  assert (c.desktop_entry.tryexec);
  assert (c.desktop_entry.path == d.desktop_entry.path);
  assert (c.working_directory == d.working_directory);

  // Serialized form reads back the same.
  //
  launcher_config r (parse_config (serialize_config (c), d));
  assert (r.discord_path == c.discord_path);
  assert (r.launch_args == c.launch_args);
  assert (r.channel == c.channel);
  assert (r.desktop_entry.enabled == c.desktop_entry.enabled);
}

static void
test_parse_fail ()
{
  assert (parse_failure ("") == error_kind::config_error);
  assert (parse_failure ("[]") == error_kind::config_error);
  assert (parse_failure ("{\"discord_path\": 1}") == error_kind::config_error);
  assert (parse_failure ("{\"launch_args\": \"-x\"}") ==
          error_kind::config_error);
  assert (parse_failure ("{\"launch_args\": [1]}") ==
          error_kind::config_error);
  assert (parse_failure ("{\"release_channel\": \"development\"}") ==
          error_kind::config_error);
  assert (parse_failure ("{\"release_channel\": \"Stable\"}") ==
          error_kind::config_error);
  assert (parse_failure ("{\"desktop_entry\": true}") ==
          error_kind::config_error);
  assert (parse_failure ("{\"desktop_entry\": {\"tryexec\": \"yes\"}}") ==
          error_kind::config_error);
}

static void
test_load ()
{
  fs::path d (scratch ("load"));
  fs::path p (d / "discord_launcher" / "config.json");

  // Created with defaults.
  //
  launcher_config c (load_config (p));
  assert (fs::exists (p));
  assert (c.channel == release_channel::stable);

  {
    ofstream o (p, ios::trunc);
    o << "{\"release_channel\": \"ptb\"}";
  }

  assert (load_config (p).channel == release_channel::ptb);

  {
    ofstream o (p, ios::trunc);
    o << "{\"release_channel\": ";
  }

  try
  {
    load_config (p);
    assert (false);
  }
  catch (const error& e)
  {
    assert (e.kind () == error_kind::config_error);
    assert (!e.notes ().empty ());
  }

  fs::remove_all (d);
}

// Without HOME an explicit configuration still works as long as it sets
// every path itself.
//
static void
test_no_home ()
{
  fs::path d (scratch ("no-home"));
  fs::path p (d / "config.json");

  const char* h (getenv ("HOME"));
  string home (h != nullptr ? h : "");

  unsetenv ("HOME");
  unsetenv ("XDG_DATA_HOME");

  launcher_config dc (default_config ());
  assert (dc.discord_path.empty () && dc.desktop_entry.path.empty ());

  // Creating the defaults needs HOME.
  //
  assert (load_failure (p) == error_kind::config_error);
  assert (!fs::exists (p));

  fs::create_directories (d);

  {
    ofstream o (p, ios::trunc);
    o << "{\"discord_path\": \"/opt/discord\","
         "\"desktop_entry\": {\"path\": \"/opt/discord.desktop\"}}";
  }

  launcher_config c (load_config (p));
  assert (c.discord_path == fs::path ("/opt/discord"));
  assert (c.desktop_entry.path == fs::path ("/opt/discord.desktop"));

  // A disabled desktop entry doesn't need a path.
  //
  {
    ofstream o (p, ios::trunc);
    o << "{\"discord_path\": \"/opt/discord\","
         "\"desktop_entry\": {\"enabled\": false}}";
  }

  assert (load_config (p).discord_path == fs::path ("/opt/discord"));

  {
    ofstream o (p, ios::trunc);
    o << "{\"release_channel\": \"ptb\"}";
  }

  assert (load_failure (p) == error_kind::config_error);

  if (!home.empty ())
    setenv ("HOME", home.c_str (), 1);

  fs::remove_all (d);
}

int
main ()
{
  spdlog::set_level (spdlog::level::err);

  test_paths ();
  test_parse ();
  test_parse_fail ();
  test_load ();
  test_no_home ();
}
