/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_DAEMON_HPP
#define __GROUNDTRACK_DAEMON_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <asio.hpp>
#include <groundtrack/api.hpp>
#include <groundtrack/config.hpp>
#include <groundtrack/element_log.hpp>
#include <groundtrack/element_store.hpp>
#include <groundtrack/http_server.hpp>
#include <groundtrack/snapshot_server.hpp>

namespace groundtrack {

// The current status of the daemon
enum class DaemonStatus {
    STOPPED,
    STARTING,
    RUNNING,
    STOPPING
};

class Daemon {
public:
    Daemon(Config config);
    ~Daemon();

    DaemonStatus status();

    /**
     * Replay the element log, start serving and start the cycle driver.
     *
     * @throws std::runtime_error if the element log cannot be read
     * @throws std::system_error if the HTTP address cannot be bound
     */
    void start();
    void stop();
    void wait();

    /**
     * Ask the cycle driver to fetch fresh elements before its next cycle.
     */
    void requestRefresh();

    ElementStore& getStore();
    SnapshotServer& getServer();
    unsigned short getPort() const;

private:
    void initSignals();
    void scheduleStatusTimer();
    void scheduleRefreshTimer();
    void refreshElements();
    void cycleLoop();

    Config config;
    std::atomic<DaemonStatus> _status = DaemonStatus::STOPPED;
    ElementStore store;
    ElementLog elementLog;
    SnapshotServer server;
    ApiHandler api;

    std::thread cycleThread;
    std::mutex cycleMutex;
    std::condition_variable cycleCV;
    std::atomic<bool> refreshRequested = false;

    std::thread ioThread;
    asio::io_context io;
    asio::signal_set signals{io, SIGINT, SIGTERM};
    HttpServer http;
    std::unique_ptr<asio::steady_timer> statusTimer;
    std::unique_ptr<asio::steady_timer> refreshTimer;
};

}

#endif
