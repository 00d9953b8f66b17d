#pragma once

#include <filesystem>
#include <string>

#include <dlauncher/client/client-types.hxx>

namespace dlauncher
{
  namespace fs = std::filesystem;

  // Parse the contents of build_info.json.
  //
  // We only care about two fields: `version` and `releaseChannel`. The file
  // carries more (e.g., `newUpdater`) which we ignore.
  //
  // Throw error (build_info_malformed) if the text is not a JSON object with
  // both fields as strings and error (invalid_version_format) if the version
  // does not start with a triple.
  //
  build_info
  parse_build_info (const std::string& text);

  // Read build info of the installation at the specified directory.
  //
  // Throw error (build_info_missing) if there is no build_info.json (which
  // includes the directory itself not existing), error (is_a_directory) if
  // there is a directory in its place, and whatever parse_build_info()
  // throws if it can't be parsed. In all cases the error carries the file
  // path as a note.
  //
  build_info
  read_build_info (const fs::path& dir);
}
