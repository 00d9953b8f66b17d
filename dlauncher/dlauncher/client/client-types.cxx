#include <dlauncher/client/client-types.hxx>

#include <cctype>
#include <limits>
#include <regex>
#include <sstream>

using namespace std;

namespace dlauncher
{
  const char build_info_path[] = "resources/build_info.json";

  // Parse a distinct unsigned integer that fits a version component. Return
  // nullopt if we are at the end, looking at garbage, or overflowing.
  //
  static optional<uint32_t>
  parse_u32 (const string& s, size_t& p)
  {
    if (p >= s.size () || !isdigit (static_cast<unsigned char> (s[p])))
      return nullopt;

    uint64_t r (0);
    while (p < s.size () && isdigit (static_cast<unsigned char> (s[p])))
    {
      r = r * 10 + (s[p] - '0');

      if (r > numeric_limits<uint32_t>::max ())
        return nullopt;

      ++p;
    }
    return static_cast<uint32_t> (r);
  }

  // Check if the current char matches c and advance if it does.
  //
  static bool
  parse_c (const string& s, size_t& p, char c)
  {
    if (p < s.size () && s[p] == c)
    {
      ++p;
      return true;
    }
    return false;
  }

  int client_version::
  compare (const client_version& v) const noexcept
  {
    if (major != v.major) return major < v.major ? -1 : 1;
    if (minor != v.minor) return minor < v.minor ? -1 : 1;
    if (patch != v.patch) return patch < v.patch ? -1 : 1;
    return 0;
  }

  string client_version::
  string () const
  {
    ostringstream o;
    o << major << '.' << minor << '.' << patch;
    return o.str ();
  }

  optional<client_version>
  parse_client_version (const std::string& s)
  {
    size_t p (0);

    auto mj (parse_u32 (s, p));
    if (!mj || !parse_c (s, p, '.')) return nullopt;

    auto mi (parse_u32 (s, p));
    if (!mi || !parse_c (s, p, '.')) return nullopt;

    auto pa (parse_u32 (s, p));
    if (!pa) return nullopt;

    return client_version (*mj, *mi, *pa);
  }

  optional<client_version>
  parse_url_version (const std::string& u)
  {
    // The first slash-delimited triple wins. We go through the component
    // parser rather than stoul() so that absurdly long numbers are rejected
    // instead of thrown.
    //
    static const regex re (R"(/(\d+)\.(\d+)\.(\d+)/)");
    smatch m;

    if (!regex_search (u, m, re))
      return nullopt;

    return parse_client_version (m[1].str () + '.' +
                                 m[2].str () + '.' +
                                 m[3].str ());
  }

  version_order
  compare_versions (const client_version& x, const client_version& y) noexcept
  {
    int r (x.compare (y));
    return r < 0 ? version_order::less_than    :
           r > 0 ? version_order::greater_than :
                   version_order::equal_to;
  }

  std::string
  to_string (release_channel c)
  {
    switch (c)
    {
      case release_channel::stable: return "stable";
      case release_channel::ptb:    return "ptb";
      case release_channel::canary: return "canary";
    }

    return "unknown";
  }

  optional<release_channel>
  parse_release_channel (const std::string& s)
  {
    if (s == "stable") return release_channel::stable;
    if (s == "ptb")    return release_channel::ptb;
    if (s == "canary") return release_channel::canary;

    return nullopt;
  }

  std::string
  archive_root (release_channel c)
  {
    return binary_name (c) + '/';
  }

  std::string
  binary_name (release_channel c)
  {
    switch (c)
    {
      case release_channel::stable: return "Discord";
      case release_channel::ptb:    return "DiscordPTB";
      case release_channel::canary: return "DiscordCanary";
    }

    return "Discord";
  }

  std::string
  desktop_entry_name (release_channel c)
  {
    switch (c)
    {
      case release_channel::stable: return "discord.desktop";
      case release_channel::ptb:    return "discord-ptb.desktop";
      case release_channel::canary: return "discord-canary.desktop";
    }

    return "discord.desktop";
  }

  std::string
  download_suffix (release_channel c)
  {
    return c == release_channel::stable ? std::string () : '/' + to_string (c);
  }
}
