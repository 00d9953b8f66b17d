#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

namespace dlauncher
{
  namespace asio = boost::asio;
  namespace ssl = asio::ssl;

  // URL parts.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
  };

  // Parse a scheme://host[:port][/target] URL. The scheme defaults to http
  // and the target to /.
  //
  url_parts
  parse_url (const std::string&);

  // HTTP client traits.
  //
  struct http_client_traits
  {
    // Whether to follow 3xx responses with a Location header.
    //
    bool follow_redirects = true;
    std::uint8_t max_redirects = 10;

    // Timeouts in milliseconds. Note that the request timeout is re-armed
    // for every chunk read so it bounds stalls, not the whole transfer.
    //
    std::uint32_t connect_timeout = 10000;
    std::uint32_t request_timeout = 30000;

    // Client archives are around 100MB so Beast's 8MB default won't do.
    //
    std::uint64_t body_limit = 1024ULL * 1024 * 1024;

    std::string user_agent;
  };

  struct http_response
  {
    unsigned status = 0;
    std::string reason;
    std::optional<std::string> location;
    std::string body;

    bool
    is_success () const noexcept {return status >= 200 && status < 300;}

    bool
    is_redirection () const noexcept {return status >= 300 && status < 400;}
  };

  // HTTP(S) client.
  //
  // Only GET, which is all the launcher ever needs. TLS peers are verified
  // against the system trust store.
  //
  class http_client
  {
  public:
    using traits_type = http_client_traits;

    explicit
    http_client (asio::io_context&, traits_type = traits_type ());

    http_client (const http_client&) = delete;
    http_client& operator= (const http_client&) = delete;

    // Perform a GET request, following redirects if requested by traits.
    //
    asio::awaitable<http_response>
    get (std::string url);

    // Perform a GET request without following redirects and return the
    // response as is.
    //
    asio::awaitable<http_response>
    resolve (std::string url);

    // Perform a GET request following redirects and return the body. Throw
    // error (download_error) on anything but 2xx.
    //
    asio::awaitable<std::string>
    fetch (std::string url);

    const traits_type&
    traits () const noexcept {return traits_;}

  private:
    asio::awaitable<http_response>
    request (std::string url, bool follow, std::uint8_t redirects);

    template <typename S>
    asio::awaitable<http_response>
    exchange (S&, const url_parts&);

    asio::io_context& ioc_;
    ssl::context ssl_;
    traits_type traits_;
  };
}
