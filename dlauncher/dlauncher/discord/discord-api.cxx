#include <dlauncher/discord/discord-api.hxx>

#include <exception>
#include <optional>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  static const char download_base[] = "https://discord.com/api/download";
  static const char download_params[] = "platform=linux&format=tar.gz";

  string
  download_url (release_channel c)
  {
    return string (download_base) + download_suffix (c) + '?' +
           download_params;
  }

  discord_api::
  discord_api (asio::io_context& c)
    : http_ (c)
  {
  }

  asio::awaitable<string> discord_api::
  archive_location (release_channel c)
  {
    string u (download_url (c));
    spdlog::debug ("using Discord API URL {}", u);

    http_response r (co_await http_.resolve (u));

    if (!r.location || r.location->empty ())
    {
      error e (error_kind::invalid_response,
               "Discord download API did not redirect");
      e.add_note ("HTTP " + std::to_string (r.status) + ' ' + r.reason +
                  " from " + u);
      throw e;
    }

    co_return *r.location;
  }

  asio::awaitable<client_version> discord_api::
  latest_version (release_channel c)
  {
    string l (co_await archive_location (c));
    optional<client_version> v (parse_url_version (l));

    if (!v)
    {
      error e (error_kind::invalid_version_format,
               "failed to parse Discord version");
      e.add_note ("no /<major>.<minor>.<patch>/ in \"" + l + '"');
      e.add_note ("this might be a bug");
      throw e;
    }

    co_return *v;
  }

  asio::awaitable<string> discord_api::
  download_archive (release_channel c)
  {
    string l (co_await archive_location (c));
    spdlog::info ("downloading Discord from {}", l);

    string r (co_await http_.fetch (l));
    spdlog::debug ("downloaded {} bytes", r.size ());

    co_return r;
  }

  // Run the coroutine to completion on a private io_context, rethrowing
  // whatever it threw.
  //
  template <typename T, typename F>
  static T
  run_sync (F f)
  {
    asio::io_context ioc;
    discord_api api (ioc);

    optional<T> r;
    exception_ptr ex;

    asio::co_spawn (ioc,
                    f (api),
                    [&r, &ex] (exception_ptr e, T v)
                    {
                      if (e)
                        ex = e;
                      else
                        r = move (v);
                    });

    ioc.run ();

    if (ex)
      rethrow_exception (ex);

    return move (*r);
  }

  client_version
  fetch_latest_version (release_channel c)
  {
    return run_sync<client_version> ([c] (discord_api& a)
    {
      return a.latest_version (c);
    });
  }

  string
  fetch_archive (release_channel c)
  {
    return run_sync<string> ([c] (discord_api& a)
    {
      return a.download_archive (c);
    });
  }
}
