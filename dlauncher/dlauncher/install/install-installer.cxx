#include <dlauncher/install/install-installer.hxx>

#include <optional>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include <dlauncher/archive/archive-reader.hxx>
#include <dlauncher/client/client-build-info.hxx>
#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  static inline bool
  vanished (const error_code& ec)
  {
    return ec == errc::no_such_file_or_directory;
  }

  static error
  io_failure (const string& what, const fs::path& p, const error_code& ec)
  {
    error e (error_kind::io_error, what + ' ' + p.string ());
    e.add_note (ec.message ());
    return e;
  }

  // Remove an entry of the directory being removed. Unlike the top-level
  // call, anything that is not a directory is unlinked.
  //
  static void
  remove_entry (const fs::path& p)
  {
    error_code ec;
    fs::file_status st (fs::symlink_status (p, ec));

    if (ec)
    {
      if (vanished (ec))
        return;

      throw io_failure ("unable to stat", p, ec);
    }

    if (fs::is_directory (st))
    {
      // Collect first and then remove: we don't want to modify the directory
      // while iterating over it.
      //
      vector<fs::path> es;

      fs::directory_iterator i (p, ec);
      if (ec)
      {
        if (vanished (ec))
          return;

        throw io_failure ("unable to read directory", p, ec);
      }

      for (fs::directory_iterator e; i != e; i.increment (ec))
      {
        if (ec)
          break;

        es.push_back (i->path ());
      }

      if (ec && !vanished (ec))
        throw io_failure ("unable to read directory", p, ec);

      for (const fs::path& c : es)
        remove_entry (c);
    }

    fs::remove (p, ec);

    if (ec && !vanished (ec))
      throw io_failure ("unable to remove", p, ec);
  }

  void
  remove_directory (const fs::path& d)
  {
    error_code ec;
    fs::file_status st (fs::symlink_status (d, ec));

    if (ec)
    {
      if (vanished (ec))
        return;

      throw io_failure ("unable to stat", d, ec);
    }

    if (!fs::is_directory (st))
      return;

    remove_entry (d);
  }

  client_version
  install_archive (const fs::path& dst,
                   const string& data,
                   bool force,
                   bool strict)
  {
    bool lenient (force && !strict);

    spdlog::info ("opening archive");

    archive_reader ar (data);
    archive_scan sc (ar.scan ());

    // An archive without any of the roots would leave us with an empty
    // installation, which is never what anyone wants, forced or not.
    //
    if (sc.entries == 0)
    {
      error e (error_kind::archive_error,
               "archive does not contain a Discord installation");
      e.add_note ("expected entries under Discord/, DiscordPTB/, or "
                  "DiscordCanary/");
      throw e;
    }

    // Check the archive's build info.
    //
    optional<build_info> abi;

    if (sc.build_info)
    {
      try
      {
        abi = parse_build_info (*sc.build_info);
      }
      catch (error& e)
      {
        e.add_note ("while reading build info from archive");
        throw;
      }

      spdlog::info ("Discord version in archive is {} of release channel {}",
                    abi->version.string (),
                    abi->channel);
    }
    else if (!lenient)
    {
      error e (error_kind::archive_metadata_missing,
               "failed to find Discord build_info.json in archive");
      e.add_note ("expected path in archive: " +
                  archive_root (*sc.root) + build_info_path);
      throw e;
    }
    else
      spdlog::warn ("could not find build_info.json in archive, skipping "
                    "version and channel checks");

    // Check the existing installation, if any.
    //
    // A symlink would be followed by extraction but not by removal, merging
    // the new tree into the old one.
    //
    {
      error_code ec;
      if (fs::is_symlink (fs::symlink_status (dst, ec)))
      {
        error e (error_kind::not_a_directory,
                 "Discord installation path " + dst.string () +
                 " is a symbolic link");
        e.add_note ("point discord_path at the link target instead");
        throw e;
      }

      if (fs::exists (dst, ec) && !fs::is_directory (dst, ec))
        throw error (error_kind::not_a_directory,
                     "Discord installation path " + dst.string () +
                     " is not a directory");
    }

    if (abi)
    {
      optional<build_info> ibi;

      try
      {
        ibi = read_build_info (dst);
      }
      catch (const error& e)
      {
        if (e.kind () != error_kind::build_info_missing || !lenient)
          throw;

        spdlog::warn ("could not find build_info.json of existing "
                      "installation at {}",
                      (dst / build_info_path).string ());
      }

      if (ibi)
      {
        spdlog::info ("existing Discord version is {} of release channel {}",
                      ibi->version.string (),
                      ibi->channel);

        if (abi->channel != ibi->channel)
        {
          if (strict)
          {
            channel_mismatch_error e (abi->channel, ibi->channel);
            e.add_note ("archive is channel \"" + abi->channel +
                        "\" while installed is channel \"" + ibi->channel +
                        '"');
            throw e;
          }

          spdlog::warn ("archive has a different release channel than the "
                        "existing installation (archive=\"{}\", "
                        "existing=\"{}\")",
                        abi->channel,
                        ibi->channel);
        }
        else
        {
          string n ("installed is version " + ibi->version.string () +
                    " and requested is version " + abi->version.string ());

          switch (compare_versions (abi->version, ibi->version))
          {
            case version_order::less_than:
            {
              if (!force)
              {
                error e (error_kind::installed_version_newer,
                         "attempted to install Discord version which is "
                         "older than the one installed");
                e.add_note (n);
                throw e;
              }

              spdlog::warn ("installed version ({}) is newer than the version "
                            "requested ({})",
                            ibi->version.string (),
                            abi->version.string ());
              break;
            }
            case version_order::equal_to:
            {
              if (!force)
              {
                error e (error_kind::installed_version_same,
                         "attempted to install Discord version which is the "
                         "same as the one installed");
                e.add_note (n);
                throw e;
              }

              spdlog::warn ("installed version ({}) is the same as the version "
                            "requested",
                            ibi->version.string ());
              break;
            }
            case version_order::greater_than:
              break;
          }
        }
      }
    }

    // Past this point we are committed. Note that there is no going back if
    // extraction fails half way: the old installation is already gone.
    //
    {
      error_code ec;
      if (fs::exists (dst, ec))
      {
        spdlog::info ("removing old Discord installation at {}", dst.string ());
        remove_directory (dst);
      }

      fs::create_directories (dst, ec);

      if (ec)
        throw io_failure ("unable to create directory", dst, ec);
    }

    spdlog::info ("extracting archive to {}", dst.string ());

    size_t n (ar.extract (dst));
    spdlog::debug ("extracted {} entries", n);

    return abi ? abi->version : client_version ();
  }
}
