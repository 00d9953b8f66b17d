#include <dlauncher/http/http-client.hxx>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  namespace beast = boost::beast;
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    // Parse scheme.
    //
    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    // Parse authority (host:port). It ends at the start of the path or the
    // query, whichever comes first.
    //
    size_t end (url.find_first_of ("/?", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = r.scheme == "https" ? "443" : "80";
    }

    // Parse target (path + query).
    //
    if (end < url.size ())
    {
      r.target = url.substr (end);

      if (r.target[0] == '?')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  http_client::
  http_client (asio::io_context& c, traits_type t)
    : ioc_ (c),
      ssl_ (ssl::context::tls_client),
      traits_ (move (t))
  {
    ssl_.set_default_verify_paths ();
    ssl_.set_verify_mode (ssl::verify_peer);

    if (traits_.user_agent.empty ())
      traits_.user_agent = BOOST_BEAST_VERSION_STRING;
  }

  asio::awaitable<http_response> http_client::
  get (string u)
  {
    co_return co_await request (move (u), traits_.follow_redirects, 0);
  }

  asio::awaitable<http_response> http_client::
  resolve (string u)
  {
    co_return co_await request (move (u), false, 0);
  }

  asio::awaitable<string> http_client::
  fetch (string u)
  {
    http_response r (co_await request (u, true, 0));

    if (!r.is_success ())
    {
      error e (error_kind::download_error,
               "HTTP " + std::to_string (r.status) + ' ' + r.reason);
      e.add_note ("while fetching " + u);
      throw e;
    }

    co_return move (r.body);
  }

  asio::awaitable<http_response> http_client::
  request (string u, bool follow, uint8_t n)
  {
    if (n > traits_.max_redirects)
      throw error (error_kind::download_error,
                   "maximum redirects exceeded fetching " + u);

    url_parts parts (parse_url (u));
    http_response r;

    spdlog::debug ("GET {}", u);

    // Translate transport failures into our errors here, while we still
    // know the URL. Note that we can't co_await in a handler so the actual
    // work is done outside of it.
    //
    try
    {
      tcp::resolver rslv (ioc_);
      auto addrs (co_await rslv.async_resolve (parts.host,
                                               parts.port,
                                               asio::use_awaitable));

      if (parts.scheme == "https")
      {
        beast::ssl_stream<beast::tcp_stream> s (ioc_, ssl_);

        // Set the SNI hostname, without which most CDNs will not even talk
        // to us. Beast doesn't wrap this so drop down to OpenSSL.
        //
        if (!SSL_set_tlsext_host_name (s.native_handle (), parts.host.c_str ()))
        {
          beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                                asio::error::get_ssl_category ());
          throw beast::system_error (ec, "unable to set SNI hostname");
        }

        s.set_verify_callback (ssl::host_name_verification (parts.host));

        auto& layer (beast::get_lowest_layer (s));
        layer.expires_after (chrono::milliseconds (traits_.connect_timeout));

        co_await layer.async_connect (addrs, asio::use_awaitable);
        co_await s.async_handshake (ssl::stream_base::client,
                                    asio::use_awaitable);

        r = co_await exchange (s, parts);

        // Many servers just drop the connection without a TLS close_notify,
        // and waiting for it can block until timeout. So close the socket.
        //
        beast::error_code ec;
        layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
      }
      else if (parts.scheme == "http")
      {
        beast::tcp_stream s (ioc_);
        s.expires_after (chrono::milliseconds (traits_.connect_timeout));

        co_await s.async_connect (addrs, asio::use_awaitable);

        r = co_await exchange (s, parts);

        beast::error_code ec;
        s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      }
      else
        throw error (error_kind::download_error,
                     "unsupported URL scheme '" + parts.scheme + "'");
    }
    catch (const boost::system::system_error& e)
    {
      error x (error_kind::download_error, e.what ());
      x.add_note ("while fetching " + u);
      throw x;
    }

    if (follow && r.is_redirection () && r.location)
    {
      string l (*r.location);

      // Relative redirect.
      //
      if (!l.empty () && l[0] == '/')
        l = parts.scheme + "://" + parts.host + ':' + parts.port + l;

      co_return co_await request (move (l), follow, n + 1);
    }

    co_return r;
  }

  template <typename S>
  asio::awaitable<http_response> http_client::
  exchange (S& s, const url_parts& parts)
  {
    auto& layer (beast::get_lowest_layer (s));

    http::request<http::empty_body> br (http::verb::get, parts.target, 11);
    br.set (http::field::host, parts.host);
    br.set (http::field::user_agent, traits_.user_agent);

    layer.expires_after (chrono::milliseconds (traits_.request_timeout));
    co_await http::async_write (s, br, asio::use_awaitable);

    // Read the header first and then the body in pieces, re-arming the
    // timeout as data flows, so that a slow but steady download of a large
    // archive isn't cut short.
    //
    beast::flat_buffer b;
    http::response_parser<http::string_body> p;
    p.body_limit (traits_.body_limit);

    co_await http::async_read_header (s, b, p, asio::use_awaitable);

    while (!p.is_done ())
    {
      layer.expires_after (chrono::milliseconds (traits_.request_timeout));
      co_await http::async_read_some (s, b, p, asio::use_awaitable);
    }

    http::response<http::string_body> res (p.release ());

    http_response r;
    r.status = res.result_int ();
    r.reason = string (res.reason ());

    auto l (res.find (http::field::location));
    if (l != res.end ())
      r.location = string (l->value ());

    r.body = move (res.body ());
    co_return r;
  }
}
