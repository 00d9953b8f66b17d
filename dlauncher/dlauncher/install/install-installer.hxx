#pragma once

#include <filesystem>
#include <string>

#include <dlauncher/client/client-types.hxx>

namespace dlauncher
{
  namespace fs = std::filesystem;

  // Remove a directory and everything in it.
  //
  // Entries that disappear while we are walking (for example, a client
  // still shutting down and cleaning up its cache) are treated as removed.
  // Symlinks are removed, never followed. If the path does not exist or is
  // not a directory, do nothing.
  //
  // Throw error (io_error) on any other failure.
  //
  void
  remove_directory (const fs::path&);

  // Install the client from the archive into the destination directory.
  //
  // All the checks are performed before anything on disk is touched:
  //
  // - The archive must be readable and every entry must stay under the
  //   destination.
  //
  // - The destination must be a directory (not a symlink to one) or not
  //   exist.
  //
  // - The archive must carry build info unless we are forced and not
  //   strict about the channel, in which case the checks are skipped
  //   altogether.
  //
  // - The existing installation must have build info, with the same
  //   exception.
  //
  // - Differing channels are an error only if strict_channel is true.
  //
  // - For the same channel, installing an older or the same version
  //   requires force.
  //
  // Then the destination is removed and recreated from the archive. Return
  // the archive version (0.0.0 if the archive had no build info).
  //
  client_version
  install_archive (const fs::path& dest,
                   const std::string& archive,
                   bool force,
                   bool strict_channel);
}
