#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  string
  to_string (error_kind k)
  {
    switch (k)
    {
      case error_kind::invalid_version_format:     return "invalid-version-format";
      case error_kind::invalid_channel:            return "invalid-channel";
      case error_kind::invalid_response:           return "invalid-response";
      case error_kind::build_info_missing:         return "build-info-missing";
      case error_kind::build_info_malformed:       return "build-info-malformed";
      case error_kind::archive_metadata_missing:   return "archive-metadata-missing";
      case error_kind::channel_mismatch:           return "channel-mismatch";
      case error_kind::installed_version_same:     return "installed-version-same";
      case error_kind::installed_version_newer:    return "installed-version-newer";
      case error_kind::installed_version_ahead:    return "installed-version-ahead";
      case error_kind::no_update_available:        return "no-update-available";
      case error_kind::already_running:            return "already-running";
      case error_kind::not_running:                return "not-running";
      case error_kind::endpoint_registration_race: return "endpoint-registration-race";
      case error_kind::endpoint_error:             return "endpoint-error";
      case error_kind::stop_timeout:               return "stop-timeout";
      case error_kind::file_not_found:             return "file-not-found";
      case error_kind::not_a_directory:            return "not-a-directory";
      case error_kind::is_a_directory:             return "is-a-directory";
      case error_kind::io_error:                   return "io-error";
      case error_kind::archive_error:              return "archive-error";
      case error_kind::download_error:             return "download-error";
      case error_kind::spawn_error:                return "spawn-error";
      case error_kind::config_error:               return "config-error";
    }

    return "unknown";
  }

  channel_mismatch_error::
  channel_mismatch_error (string e, string a)
    : error (error_kind::channel_mismatch,
             "release channels do not match (\"" + e + "\" vs \"" + a + "\")"),
      expected_ (move (e)),
      actual_ (move (a))
  {
  }

  void
  print_error (ostream& o, const error& e)
  {
    o << "error: " << e.what () << '\n';

    for (const string& n : e.notes ())
      o << "  info: " << n << '\n';
  }
}
