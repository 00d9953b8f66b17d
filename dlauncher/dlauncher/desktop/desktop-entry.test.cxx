#include <dlauncher/desktop/desktop-entry.hxx>

#include <cassert>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>

using namespace std;
using namespace dlauncher;

// Roughly what the client tarball ships.
//
static const char sample[] =
  "[Desktop Entry]\n"
  "Name=Discord PTB\n"
  "StartupWMClass=discord\n"
  "Comment=All-in-one voice and text chat for gamers.\n"
  "GenericName=Internet Messenger\n"
  "Exec=/usr/share/discord-ptb/DiscordPTB\n"
  "Icon=discord-ptb\n"
  "Type=Application\n"
  "Categories=Network;InstantMessaging;\n"
  "Path=/usr/bin\n";

static void
test_parse ()
{
  const string s ("# Leading comment\n"
                  "\n"
                  "[Desktop Entry]\n"
                  "Name=Discord\n"
                  "Name[de]=Discord (de)\n"
                  "# Inner comment\n"
                  "Exec = /opt/Discord  \n"
                  "\n"
                  "[Desktop Action new]\n"
                  "Name=New\n");

  desktop_entry de (desktop_entry::parse (s));

  assert (de.groups ().size () == 3);
  assert (de.contains ("Desktop Entry"));
  assert (de.contains ("Desktop Action new"));
  assert (!de.contains ("Desktop Action update"));

  assert (*de.get ("Name") == "Discord");
  assert (*de.get ("Name[de]") == "Discord (de)");
  assert (*de.get ("Exec") == "/opt/Discord");
  assert (*de.get ("Desktop Action new", "Name") == "New");
  assert (!de.get ("Icon"));
  assert (!de.get ("Nonexistent", "Name"));

  // Untouched apart from whitespace around '='.
  //
  string r (de.string ());
  assert (r.find ("# Leading comment\n\n[Desktop Entry]\n") == 0);
  assert (r.find ("# Inner comment\nExec=/opt/Discord\n\n[Desktop Action") !=
          string::npos);

  try
  {
    desktop_entry::parse ("[Desktop Entry\nName=x\n");
    assert (false);
  }
  catch (const error& e)
  {
    assert (e.kind () == error_kind::invalid_response);
  }
}

static void
test_set ()
{
  desktop_entry de (desktop_entry::parse (::sample));

  de.set ("Icon", "/opt/discord/discord.png");
  de.set ("TryExec", "/usr/bin/dlauncher");
  de.set ("Desktop Action update", "Name", "Update Discord");

  // Replaced in place.
  //
  string s (de.string ());
  assert (s.find ("Exec=/usr/share/discord-ptb/DiscordPTB\n"
                  "Icon=/opt/discord/discord.png\n") != string::npos);

  // Appended at the end of its group, new groups at the end.
  //
  assert (s.find ("Path=/usr/bin\nTryExec=/usr/bin/dlauncher\n\n"
                  "[Desktop Action update]\nName=Update Discord\n") !=
          string::npos);

  de.add_action ("update");
  de.add_action ("update");
  assert (*de.get ("Actions") == "update;");

  de.set ("Actions", "new");
  de.add_action ("update");
  assert (*de.get ("Actions") == "new;update;");
}

static void
test_customize ()
{
  desktop_entry de (desktop_entry::parse (::sample));

  launcher_entry le;
  le.icon = "/home/user/.local/share/discord_launcher/Discord/discord.png";
  le.launcher = "/opt/dlauncher/bin/dlauncher";
  le.tryexec = true;
  le.update_action = true;

  customize_entry (de, le);

  assert (*de.get ("Icon") == le.icon.string ());
  assert (*de.get ("Exec") == "/opt/dlauncher/bin/dlauncher update-run");
  assert (*de.get ("Path") == "/opt/dlauncher/bin");
  assert (*de.get ("TryExec") == "/opt/dlauncher/bin/dlauncher");
  assert (*de.get ("Actions") == "update;");
  assert (*de.get ("Desktop Action update", "Name") == "Update Discord");
  assert (*de.get ("Desktop Action update", "Exec") ==
          "/opt/dlauncher/bin/dlauncher update");

  // Kept from the sample.
  //
  assert (*de.get ("Name") == "Discord PTB");
  assert (*de.get ("Categories") == "Network;InstantMessaging;");

  // No parent: Path is left as it was (and an error is logged).
  //
  desktop_entry d2 (desktop_entry::parse (::sample));
  le.launcher = "dlauncher";
  le.tryexec = false;
  le.update_action = false;

  customize_entry (d2, le);

  assert (*d2.get ("Path") == "/usr/bin");
  assert (!d2.get ("TryExec"));
  assert (!d2.contains ("Desktop Action update"));

  // A launcher path with a space is quoted in Exec but not in TryExec.
  //
  desktop_entry d3 (desktop_entry::parse (::sample));
  le.launcher = "/opt/my apps/dlauncher";
  le.tryexec = true;
  le.update_action = true;

  customize_entry (d3, le);

  assert (*d3.get ("Exec") == "\"/opt/my apps/dlauncher\" update-run");
  assert (*d3.get ("Desktop Action update", "Exec") ==
          "\"/opt/my apps/dlauncher\" update");
  assert (*d3.get ("TryExec") == "/opt/my apps/dlauncher");
  assert (*d3.get ("Path") == "/opt/my apps");
}

static void
test_exec_argument ()
{
  assert (exec_argument ("/usr/bin/dlauncher") == "/usr/bin/dlauncher");
  assert (exec_argument ("/opt/100%/dl") == "/opt/100%%/dl");
  assert (exec_argument ("") == "\"\"");
  assert (exec_argument ("/a b/$x") == "\"/a b/\\\\$x\"");
  assert (exec_argument ("/a\\b") == "\"/a\\\\\\\\b\"");
  assert (exec_argument ("it's") == "\"it's\"");
}

static void
test_file ()
{
  fs::path d (fs::temp_directory_path () / "dlauncher-desktop-test");
  fs::remove_all (d);

  fs::path p (d / "applications" / "test.desktop");

  try
  {
    desktop_entry::read (p);
    assert (false);
  }
  catch (const error& e)
  {
    assert (e.kind () == error_kind::file_not_found);
  }

  desktop_entry de (desktop_entry::parse (::sample));
  de.write (p);

  assert (desktop_entry::read (p).string () == ::sample);

  fs::remove_all (d);
}

int
main ()
{
  spdlog::set_level (spdlog::level::off);

  test_parse ();
  test_set ();
  test_customize ();
  test_exec_argument ();
  test_file ();
}
