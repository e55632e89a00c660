/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_HTTP_SERVER_HPP
#define __GROUNDTRACK_HTTP_SERVER_HPP

#include <groundtrack/api.hpp>

#include <chrono>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace groundtrack {

constexpr std::size_t MAX_REQUEST_HEADER_BYTES = 16 * 1024;
constexpr std::size_t MAX_REQUEST_BODY_BYTES = 64 * 1024;
constexpr std::chrono::seconds DEFAULT_REQUEST_TIMEOUT{30};
constexpr unsigned int DEFAULT_HANDLER_THREADS = 2;

using BeastResponse = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * HTTP/1.1 front end for the JSON API, built on Boost.Beast.
 *
 * Connections are accepted and read on a private I/O thread. Requests are
 * answered one per connection by the handler pool, so a slow request never
 * holds up reads on other connections. A connection that does not deliver
 * its request within the timeout is closed.
 */
class HttpServer {
public:
    HttpServer(const std::string& address, unsigned short port, const ApiHandler& handler,
               unsigned int handlerThreads = DEFAULT_HANDLER_THREADS,
               std::chrono::seconds requestTimeout = DEFAULT_REQUEST_TIMEOUT);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * Bind, start accepting connections and start the I/O thread.
     *
     * @throws boost::system::system_error if the address cannot be bound
     */
    void start();

    /**
     * Stop the I/O thread and the handler pool. Open connections are dropped.
     */
    void stop();

    /**
     * The bound port, useful when started on port 0. Zero before start().
     */
    unsigned short getPort() const;

private:
    void accept();

    boost::asio::io_context io;
    boost::asio::thread_pool handlers;
    boost::asio::ip::tcp::acceptor acceptor;
    boost::asio::ip::tcp::endpoint endpoint;
    const ApiHandler& handler;
    const std::chrono::seconds requestTimeout;
    unsigned short boundPort = 0;
    std::thread ioThread;
};

/**
 * Build the wire response: status, content type, CORS and cache headers.
 */
BeastResponse makeResponse(const HttpResponse& response);

}

#endif
