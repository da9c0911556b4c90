#include "dsync/remote/http_client.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace dsync::remote {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

constexpr int kHttpVersion = 11;

RemoteError transport_error(const char* stage, const beast::error_code& ec) {
    return RemoteError::retriable(0, "transportError", std::string(stage) + ": " + ec.message());
}

} // namespace

HttpsClient::HttpsClient(std::string host, std::string port)
    : host_(std::move(host)),
      port_(std::move(port)),
      ssl_ctx_(ssl::context::tls_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

RemoteResult<HttpReply> HttpsClient::send(http::verb method,
                                          const std::string& target,
                                          const std::string& access_token,
                                          const std::optional<std::string>& json_body) {
    beast::error_code ec;

    tcp::resolver resolver(io_);
    const auto endpoints = resolver.resolve(host_, port_, ec);
    if (ec) {
        return dsync::Err(transport_error("resolve", ec));
    }

    beast::ssl_stream<beast::tcp_stream> stream(io_, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
        ec.assign(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
        return dsync::Err(transport_error("sni", ec));
    }
    stream.set_verify_callback(ssl::host_name_verification(host_));

    beast::get_lowest_layer(stream).connect(endpoints, ec);
    if (ec) {
        return dsync::Err(transport_error("connect", ec));
    }

    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        return dsync::Err(transport_error("handshake", ec));
    }

    http::request<http::string_body> request{method, target, kHttpVersion};
    request.set(http::field::host, host_);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(http::field::authorization, "Bearer " + access_token);
    request.set(http::field::accept, "application/json");
    if (json_body) {
        request.set(http::field::content_type, "application/json");
        request.body() = *json_body;
    }
    request.prepare_payload();

    http::write(stream, request, ec);
    if (ec) {
        return dsync::Err(transport_error("write", ec));
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(stream, buffer, response, ec);
    if (ec) {
        return dsync::Err(transport_error("read", ec));
    }

    stream.shutdown(ec);
    if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
        spdlog::debug("TLS shutdown with {}: {}", host_, ec.message());
    }

    return dsync::Ok(HttpReply{response.result_int(), std::move(response.body())});
}

} // namespace dsync::remote
