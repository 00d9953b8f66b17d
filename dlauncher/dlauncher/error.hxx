#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace dlauncher
{
  // Error kinds.
  //
  // We group them loosely by where they originate, but callers should only
  // ever switch on the kind itself. Note that some of these (no_update,
  // not_running) are expected outcomes rather than failures: the caller gets
  // to decide.
  //
  enum class error_kind
  {
    // Parsing.
    //
    invalid_version_format,
    invalid_channel,
    invalid_response,

    // Build metadata.
    //
    build_info_missing,
    build_info_malformed,
    archive_metadata_missing,

    // Channel/version relationship.
    //
    channel_mismatch,
    installed_version_same,
    installed_version_newer,
    installed_version_ahead,
    no_update_available,

    // Instance coordination.
    //
    already_running,
    not_running,
    endpoint_registration_race,
    endpoint_error,
    stop_timeout,

    // Filesystem.
    //
    file_not_found,
    not_a_directory,
    is_a_directory,
    io_error,

    // Everything else.
    //
    archive_error,
    download_error,
    spawn_error,
    config_error
  };

  std::string
  to_string (error_kind);

  inline std::ostream&
  operator<< (std::ostream& os, error_kind k)
  {
    return os << to_string (k);
  }

  // Launcher error.
  //
  // A primary kind and message plus an ordered list of human-readable notes
  // that accumulate as the error travels up. We never replace the original
  // message when adding context, only append notes.
  //
  class error: public std::runtime_error
  {
  public:
    error (error_kind k, const std::string& what)
      : std::runtime_error (what), kind_ (k) {}

    error_kind
    kind () const noexcept
    {
      return kind_;
    }

    const std::vector<std::string>&
    notes () const noexcept
    {
      return notes_;
    }

    error&
    add_note (std::string n)
    {
      notes_.push_back (std::move (n));
      return *this;
    }

  private:
    error_kind kind_;
    std::vector<std::string> notes_;
  };

  // Channel mismatch.
  //
  // Always carries both sides. Which side is "expected" depends on the
  // check: configured vs installed for the update check, archive vs
  // installed for the installer.
  //
  class channel_mismatch_error: public error
  {
  public:
    channel_mismatch_error (std::string expected, std::string actual);

    const std::string&
    expected () const noexcept
    {
      return expected_;
    }

    const std::string&
    actual () const noexcept
    {
      return actual_;
    }

  private:
    std::string expected_;
    std::string actual_;
  };

  // Print the error and its notes in the diagnostics format used by main().
  //
  void
  print_error (std::ostream&, const error&);
}
