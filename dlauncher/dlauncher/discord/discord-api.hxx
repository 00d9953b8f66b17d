#pragma once

#include <string>

#include <boost/asio.hpp>

#include <dlauncher/client/client-types.hxx>
#include <dlauncher/http/http-client.hxx>

namespace dlauncher
{
  namespace asio = boost::asio;

  // Download resolver URL for the channel, for example:
  //
  // https://discord.com/api/download/canary?platform=linux&format=tar.gz
  //
  std::string
  download_url (release_channel);

  // Discord download API.
  //
  // The resolver doesn't tell us the version directly. Instead it redirects
  // to the CDN location of the archive, which embeds the version. So we ask
  // without following the redirect and look at where we are sent.
  //
  class discord_api
  {
  public:
    explicit
    discord_api (asio::io_context&);

    discord_api (const discord_api&) = delete;
    discord_api& operator= (const discord_api&) = delete;

    // Return the archive URL the resolver points to. Throw error
    // (invalid_response) if the reply has no Location header.
    //
    asio::awaitable<std::string>
    archive_location (release_channel);

    // Return the latest published version. Throw error
    // (invalid_version_format) if the location embeds none.
    //
    asio::awaitable<client_version>
    latest_version (release_channel);

    // Download the latest archive into memory.
    //
    asio::awaitable<std::string>
    download_archive (release_channel);

  private:
    http_client http_;
  };

  // Blocking versions of the above, each running its own event loop.
  //
  client_version
  fetch_latest_version (release_channel);

  std::string
  fetch_archive (release_channel);
}
