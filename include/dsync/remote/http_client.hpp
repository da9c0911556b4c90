#pragma once

#include "dsync/remote/service.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>

#include <optional>
#include <string>

namespace dsync::remote {

struct HttpReply {
    unsigned status = 0;
    std::string body;
};

/**
 * @brief Blocking HTTPS client for JSON APIs
 *
 * Opens one TLS connection per request (Boost.Beast over Asio SSL) and sends
 * a Bearer token. Transport failures (resolve, connect, handshake, read)
 * come back as Retriable errors; any HTTP status is returned as a reply and
 * classified by the caller. Not thread safe: give each thread its own client.
 */
class HttpsClient {
public:
    explicit HttpsClient(std::string host, std::string port = "443");

    RemoteResult<HttpReply> send(boost::beast::http::verb method,
                                 const std::string& target,
                                 const std::string& access_token,
                                 const std::optional<std::string>& json_body = std::nullopt);

    const std::string& host() const { return host_; }

private:
    std::string host_;
    std::string port_;
    boost::asio::io_context io_;
    boost::asio::ssl::context ssl_ctx_;
};

} // namespace dsync::remote
