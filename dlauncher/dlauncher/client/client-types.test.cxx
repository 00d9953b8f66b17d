#include <dlauncher/client/client-types.hxx>

#include <cassert>
#include <iostream>
#include <sstream>

using namespace std;
using namespace dlauncher;

static void
check (const string& s, uint32_t mj, uint32_t mi, uint32_t pt)
{
  auto v (parse_client_version (s));

  if (!v)
    assert (false);

  if (v->major != mj || v->minor != mi || v->patch != pt)
    assert (false);
}

static void
check_fail (const string& s)
{
  auto v (parse_client_version (s));

  if (v)
    assert (false);
}

// Leading triple, trailing junk ignored.
//
static void
test_parse ()
{
  check ("0.0.91", 0, 0, 91);
  check ("1.2.3", 1, 2, 3);
  check ("10.20.30", 10, 20, 30);
  check ("4294967295.0.0", 4294967295u, 0, 0);

  // build_info.json does not promise a clean string.
  //
  check ("1.2.3-canary", 1, 2, 3);
  check ("1.2.3.4", 1, 2, 3);
  check ("1.2.3 (stable)", 1, 2, 3);
}

static void
test_parse_fail ()
{
  check_fail ("");
  check_fail ("1");
  check_fail ("1.2");
  check_fail ("1.2.");
  check_fail ("v1.2.3");
  check_fail (" 1.2.3");
  check_fail ("1..3");
  check_fail ("a.b.c");

  // Overflow is a format error, not a wrap.
  //
  check_fail ("4294967296.0.0");
  check_fail ("1.99999999999999999999.0");
}

// The version is a path segment of the redirect target. Note that the
// filename also contains the triple but is not slash-terminated.
//
static void
test_url ()
{
  {
    auto v (parse_url_version (
      "https://dl.discordapp.net/apps/linux/0.0.91/discord-0.0.91.tar.gz"));

    assert (v && *v == client_version (0, 0, 91));
  }

  {
    auto v (parse_url_version (
      "https://dl-canary.discordapp.net/apps/linux/0.0.650/"
      "discord-canary-0.0.650.tar.gz"));

    assert (v && *v == client_version (0, 0, 650));
  }

  {
    auto v (parse_url_version ("/1.2.3/"));
    assert (v && v->string () == "1.2.3");
  }

  assert (!parse_url_version ("https://discord.com/"));
  assert (!parse_url_version ("https://x/discord-0.0.91.tar.gz"));
  assert (!parse_url_version ("https://x/0.0/discord.tar.gz"));
  assert (!parse_url_version (""));
}

static void
test_cmp ()
{
  client_version a (1, 2, 3);
  client_version b (1, 2, 4);
  client_version c (1, 3, 0);
  client_version d (2, 0, 0);

  assert (compare_versions (a, b) == version_order::less_than);
  assert (compare_versions (b, a) == version_order::greater_than);
  assert (compare_versions (a, a) == version_order::equal_to);

  // Lexicographic, not numeric on the concatenation.
  //
  assert (b < c && c < d);
  assert (client_version (0, 10, 0) > client_version (0, 9, 99));
  assert (client_version (0, 0, 100) > client_version (0, 0, 99));

  assert (a <= a && a >= a && a != b);
}

static void
test_str ()
{
  assert (client_version (0, 0, 91).string () == "0.0.91");

  // Parse of the formatted string gives back the same value.
  //
  client_version v (12, 0, 345);
  assert (*parse_client_version (v.string ()) == v);

  ostringstream o;
  o << v << ' ' << version_order::less_than;
  assert (o.str () == "12.0.345 less_than");

  assert (client_version ().empty ());
  assert (!v.empty ());
}

static void
test_channel ()
{
  assert (to_string (release_channel::stable) == "stable");
  assert (to_string (release_channel::ptb) == "ptb");
  assert (to_string (release_channel::canary) == "canary");

  assert (parse_release_channel ("ptb") == release_channel::ptb);
  assert (parse_release_channel ("canary") == release_channel::canary);
  assert (!parse_release_channel ("Stable"));
  assert (!parse_release_channel ("development"));
  assert (!parse_release_channel (""));

  // Each channel round trips through its name.
  //
  for (release_channel c : {release_channel::stable,
                            release_channel::ptb,
                            release_channel::canary})
    assert (*parse_release_channel (to_string (c)) == c);

  assert (download_suffix (release_channel::stable).empty ());
  assert (download_suffix (release_channel::ptb) == "/ptb");
  assert (download_suffix (release_channel::canary) == "/canary");

  assert (archive_root (release_channel::stable) == "Discord/");
  assert (archive_root (release_channel::ptb) == "DiscordPTB/");
  assert (archive_root (release_channel::canary) == "DiscordCanary/");

  assert (binary_name (release_channel::canary) == "DiscordCanary");

  assert (desktop_entry_name (release_channel::stable) == "discord.desktop");
  assert (desktop_entry_name (release_channel::ptb) == "discord-ptb.desktop");
  assert (desktop_entry_name (release_channel::canary) ==
          "discord-canary.desktop");
}

int
main ()
{
  test_parse ();
  test_parse_fail ();
  test_url ();
  test_cmp ();
  test_str ();
  test_channel ();
}
