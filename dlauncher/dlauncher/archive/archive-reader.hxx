#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <dlauncher/client/client-types.hxx>

namespace dlauncher
{
  namespace fs = std::filesystem;

  // Result of scanning a client archive.
  //
  struct archive_scan
  {
    // Root (channel) of the first entry under a known root, if any.
    //
    std::optional<release_channel> root;

    // Contents of <root>/resources/build_info.json, if present.
    //
    std::optional<std::string> build_info;

    // Number of entries that would be extracted.
    //
    std::size_t entries = 0;
  };

  // Client archive reader.
  //
  // The archive is a gzip-compressed tarball with everything under one of
  // the channel roots (Discord/, DiscordPTB/, DiscordCanary/). Entries
  // outside of these roots are ignored and the root prefix is stripped on
  // extraction.
  //
  // The archive is kept in memory (it is about 100MB) and every operation
  // re-reads it from the start, libarchive being a streaming reader.
  //
  class archive_reader
  {
  public:
    explicit
    archive_reader (const std::string& data);

    archive_reader (const archive_reader&) = delete;
    archive_reader& operator= (const archive_reader&) = delete;

    // Scan the entries. Throw error (archive_error) if the archive is not
    // readable or has an entry (or hardlink target) that extract() would
    // refuse.
    //
    archive_scan
    scan () const;

    // Extract root entries into the specified directory, which should exist
    // and normally be empty. Return the number of entries extracted.
    //
    // Entries with absolute paths or `..` components are refused, as is
    // writing through a symlink. Throw error (archive_error) on the first
    // failure, leaving whatever was already written in place.
    //
    std::size_t
    extract (const fs::path& dir) const;

    // Map an entry path to its path relative to the root. Return nullopt if
    // the entry is not under any of the roots or is the root itself.
    //
    static std::optional<std::string>
    strip_root (const std::string& entry,
                release_channel* channel = nullptr);

  private:
    const std::string& data_;
  };
}
