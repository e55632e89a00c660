/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/http_server.hpp>
#include <groundtrack/json.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;

namespace groundtrack {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

bool isParseError(const beast::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_method).category();
}

std::string toString(beast::string_view str) {
    return std::string(str.data(), str.size());
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, net::thread_pool& handlers, const ApiHandler& handler,
                std::chrono::seconds timeout)
        : stream(std::move(socket)), handlers(handlers), handler(handler), timeout(timeout) {
        parser.header_limit(static_cast<std::uint32_t>(MAX_REQUEST_HEADER_BYTES));
        parser.body_limit(MAX_REQUEST_BODY_BYTES);
    }

    void start() {
        stream.expires_after(timeout);
        http::async_read(stream, buffer, parser,
            beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

private:
    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit || ec == http::error::header_limit) {
            respond({.status = 413, .contentType = "application/json",
                     .body = errorToJson("PayloadTooLarge", "Request too large")});
            return;
        }
        if (ec && isParseError(ec) && ec != http::error::end_of_stream && ec != http::error::partial_message) {
            respond({.status = 400, .contentType = "application/json",
                     .body = errorToJson("BadRequest", "Malformed request: " + ec.message())});
            return;
        }
        if (ec == beast::error::timeout) {
            debug("HTTP connection from {} timed out.", remoteAddress());
            return;
        }
        if (ec) {
            if (ec != http::error::end_of_stream) {
                debug("HTTP read error: {}", ec.message());
            }
            return;
        }

        auto message = parser.release();
        HttpRequest request{
            .method = toString(message.method_string()),
            .target = toString(message.target()),
            .body = std::move(message.body())
        };

        // Answer from the handler pool, then write back on the I/O thread
        auto self = shared_from_this();
        net::post(handlers, [self, request = std::move(request)]() {
            HttpResponse response = self->handler.handle(request);
            debug("{} {} -> {}", request.method, request.target, response.status);
            net::post(self->stream.get_executor(), [self, response = std::move(response)]() {
                self->respond(response);
            });
        });
    }

    void respond(const HttpResponse& response) {
        auto message = std::make_shared<BeastResponse>(makeResponse(response));
        stream.expires_after(timeout);
        http::async_write(stream, *message,
            [self = shared_from_this(), message](beast::error_code ec, std::size_t) {
                if (ec) {
                    debug("HTTP write error: {}", ec.message());
                }
                self->close();
            });
    }

    void close() {
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    std::string remoteAddress() {
        beast::error_code ec;
        auto remote = stream.socket().remote_endpoint(ec);
        return ec ? "unknown peer" : remote.address().to_string();
    }

    beast::tcp_stream stream;
    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    net::thread_pool& handlers;
    const ApiHandler& handler;
    const std::chrono::seconds timeout;
};

}

BeastResponse makeResponse(const HttpResponse& response) {
    BeastResponse message{static_cast<http::status>(response.status), 11};
    message.set(http::field::server, "groundtrack");
    message.set(http::field::content_type, response.contentType);
    message.set(http::field::access_control_allow_origin, "*");
    message.set(http::field::cache_control, "no-store");
    message.keep_alive(false);
    message.body() = response.body;
    message.prepare_payload();
    return message;
}

HttpServer::HttpServer(const std::string& address, unsigned short port, const ApiHandler& handler,
                       unsigned int handlerThreads, std::chrono::seconds requestTimeout)
    : handlers(std::max(1u, handlerThreads)),
      acceptor(io),
      endpoint(net::ip::make_address(address), port),
      handler(handler),
      requestTimeout(requestTimeout) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    acceptor.open(endpoint.protocol());
    acceptor.set_option(net::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(net::socket_base::max_listen_connections);
    boundPort = acceptor.local_endpoint().port();
    info("HTTP server listening on {}:{}.", acceptor.local_endpoint().address().to_string(), boundPort);
    accept();
    ioThread = std::thread([this]{ io.run(); });
}

void HttpServer::stop() {
    io.stop();
    if (ioThread.joinable()) {
        ioThread.join();
    }
    handlers.stop();
    handlers.join();

    if (acceptor.is_open()) {
        beast::error_code ec;
        acceptor.close(ec);
        if (ec) {
            warn("Failed to close HTTP listener: {}", ec.message());
        }
        info("HTTP server stopped.");
    }
}

unsigned short HttpServer::getPort() const {
    return boundPort;
}

void HttpServer::accept() {
    acceptor.async_accept(
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    error("HTTP accept error: {}", ec.message());
                    accept();
                }
                return;
            }
            std::make_shared<HttpSession>(std::move(socket), handlers, handler, requestTimeout)->start();
            accept();
        });
}

}
