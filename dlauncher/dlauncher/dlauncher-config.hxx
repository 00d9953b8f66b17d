#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <dlauncher/client/client-types.hxx>

namespace dlauncher
{
  namespace fs = std::filesystem;

  // Launcher desktop entry settings.
  //
  struct desktop_entry_config
  {
    bool enabled = true;
    fs::path path;
    bool tryexec = true;          // Add TryExec= pointing to the launcher.
    bool update_action = false;   // Add the "Update Discord" action.
  };

  // Launcher configuration.
  //
  // Read once per invocation and then only passed around by const
  // reference.
  //
  struct launcher_config
  {
    fs::path discord_path;                  // Installation directory.
    fs::path working_directory;             // Of the client process.
    std::vector<std::string> launch_args;
    fs::path launcher_path;                 // As written to desktop entries.
    release_channel channel = release_channel::stable;
    desktop_entry_config desktop_entry;

    // Client binary inside the installation.
    //
    fs::path
    binary () const
    {
      return discord_path / binary_name (channel);
    }
  };

  // $XDG_DATA_HOME or ~/.local/share.
  //
  fs::path
  data_home ();

  // <data home>/discord_launcher/config.json
  //
  fs::path
  default_config_path ();

  // Configuration with every value at its default. If the data directory
  // cannot be determined, the paths under it are left empty.
  //
  launcher_config
  default_config ();

  // Parse the JSON configuration. Missing values are taken from defaults.
  // Throw error (config_error) if the document is not valid JSON, a value
  // has the wrong type, or the release channel is unknown.
  //
  launcher_config
  parse_config (const std::string&, const launcher_config& defaults);

  std::string
  serialize_config (const launcher_config&);

  // Load the configuration, first writing the defaults if the file does not
  // exist. Throw error (config_error) if a path that has no default (see
  // default_config()) is not set by the file either.
  //
  launcher_config
  load_config (const fs::path&);
}
