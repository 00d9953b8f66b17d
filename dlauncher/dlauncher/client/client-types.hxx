#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace dlauncher
{
  // Discord client version.
  //
  // Format: <major>.<minor>.<patch>
  //
  // Unlike our own versions, Discord builds carry no pre-release or build
  // metadata, so ordering is plain lexicographic comparison of the triple.
  //
  struct client_version
  {
    std::uint32_t major = 0;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;

    client_version () = default;

    client_version (std::uint32_t mj, std::uint32_t mi, std::uint32_t pa)
      : major (mj), minor (mi), patch (pa) {}

    bool
    empty () const noexcept
    {
      return major == 0 && minor == 0 && patch == 0;
    }

    // Compare versions. Returns negative if this < other, positive if this >
    // other, zero if equal.
    //
    int
    compare (const client_version& v) const noexcept;

    // String representation (e.g., "0.0.91").
    //
    std::string
    string () const;
  };

  inline bool
  operator< (const client_version& x, const client_version& y)
  {
    return x.compare (y) < 0;
  }

  inline bool
  operator> (const client_version& x, const client_version& y)
  {
    return x.compare (y) > 0;
  }

  inline bool
  operator== (const client_version& x, const client_version& y)
  {
    return x.compare (y) == 0;
  }

  inline bool
  operator!= (const client_version& x, const client_version& y)
  {
    return !(x == y);
  }

  inline bool
  operator<= (const client_version& x, const client_version& y)
  {
    return x.compare (y) <= 0;
  }

  inline bool
  operator>= (const client_version& x, const client_version& y)
  {
    return x.compare (y) >= 0;
  }

  inline std::ostream&
  operator<< (std::ostream& os, const client_version& v)
  {
    return os << v.string ();
  }

  // Parse the leading <major>.<minor>.<patch> of a string. Anything after
  // the triple is ignored (build_info.json has been known to grow suffixes).
  // Returns nullopt if the string does not start with a triple.
  //
  std::optional<client_version>
  parse_client_version (const std::string& s);

  // Extract the version from a download URL. The CDN embeds it as a path
  // segment, for example:
  //
  //   https://dl.discordapp.net/apps/linux/0.0.91/discord-0.0.91.tar.gz
  //
  // Returns nullopt if there is no /<major>.<minor>.<patch>/ segment.
  //
  std::optional<client_version>
  parse_url_version (const std::string& url);

  // Three-way relationship between two versions, read as "first is ... the
  // second".
  //
  enum class version_order
  {
    less_than,
    equal_to,
    greater_than
  };

  version_order
  compare_versions (const client_version& x, const client_version& y) noexcept;

  inline std::ostream&
  operator<< (std::ostream& os, version_order o)
  {
    switch (o)
    {
      case version_order::less_than:    return os << "less_than";
      case version_order::equal_to:     return os << "equal_to";
      case version_order::greater_than: return os << "greater_than";
    }
    return os;
  }

  // Release channel.
  //
  // Each channel has independent version numbering and its own naming for
  // the download endpoint, the archive root, and the installed binary.
  //
  enum class release_channel
  {
    stable,
    ptb,
    canary
  };

  // Canonical name as used in build_info.json and the configuration.
  //
  std::string
  to_string (release_channel);

  inline std::ostream&
  operator<< (std::ostream& os, release_channel c)
  {
    return os << to_string (c);
  }

  // Parse a canonical channel name. Returns nullopt for anything else.
  //
  std::optional<release_channel>
  parse_release_channel (const std::string& s);

  // Top-level directory inside the channel's archive, including the
  // trailing slash (e.g., "DiscordPTB/").
  //
  std::string
  archive_root (release_channel);

  // Name of the client binary directly under the installation directory.
  //
  std::string
  binary_name (release_channel);

  // Name of the sample desktop entry shipped inside the installation.
  //
  std::string
  desktop_entry_name (release_channel);

  // Download endpoint suffix, empty for stable (e.g., "/canary").
  //
  std::string
  download_suffix (release_channel);

  // Build metadata as found in resources/build_info.json.
  //
  // The channel is kept as the raw string: channel comparisons have to work
  // even for channels we don't know about, and the mismatch diagnostics
  // should show exactly what is on disk.
  //
  struct build_info
  {
    client_version version;
    std::string channel;
  };

  // Relative location of the build metadata inside an installation (or an
  // archive root).
  //
  extern const char build_info_path[];
}
