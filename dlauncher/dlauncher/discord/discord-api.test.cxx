#include <dlauncher/discord/discord-api.hxx>

#include <cassert>

using namespace std;
using namespace dlauncher;

int
main ()
{
  assert (download_url (release_channel::stable) ==
          "https://discord.com/api/download?platform=linux&format=tar.gz");

  assert (download_url (release_channel::ptb) ==
          "https://discord.com/api/download/ptb?platform=linux&format=tar.gz");

  assert (download_url (release_channel::canary) ==
          "https://discord.com/api/download/canary"
          "?platform=linux&format=tar.gz");

  // The target we send must keep the query intact.
  //
  url_parts p (parse_url (download_url (release_channel::canary)));
  assert (p.host == "discord.com");
  assert (p.target == "/api/download/canary?platform=linux&format=tar.gz");
}
