/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/daemon.hpp>
#include <groundtrack/celestrak.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;

namespace groundtrack {

Daemon::Daemon(Config c)
    : config(std::move(c)),
      elementLog(config.getElementLogPath()),
      server(store, config.getServerOptions(), config.getGroundStations()),
      api(store, server),
      http(config.getListenAddress(), static_cast<unsigned short>(config.getPort()), api) {}

Daemon::~Daemon() {
    stop();
    if (cycleThread.joinable()) {
        info("Waiting for cycle thread to finish...");
        cycleThread.join();
    }
    if (ioThread.joinable()) {
        info("Waiting for IO thread to finish...");
        io.stop();
        ioThread.join();
    }
    store.setAppendListener(nullptr);
    info("Daemon destroyed.");
}

DaemonStatus Daemon::status() {
    return _status.load();
}

void Daemon::start() {
    DaemonStatus expected = DaemonStatus::STOPPED;
    if (!_status.compare_exchange_strong(expected, DaemonStatus::STARTING)) {
        return;
    }
    info("Starting daemon...");

    try {
        // Replay before listening so replayed entries are not logged twice
        elementLog.replay(store);
        store.setAppendListener([this](int catalogNumber, const std::string &name, const ElementRecord &record) {
            try {
                elementLog.append(name, record);
            } catch (const std::exception &e) {
                error("Failed to persist element set for object {}: {}", catalogNumber, e.what());
            }
        });

        for (auto catalogNumber : config.getSatellites()) {
            server.track(catalogNumber);
        }

        http.start();
    } catch (...) {
        _status.store(DaemonStatus::STOPPED);
        throw;
    }

    initSignals();

    statusTimer = std::make_unique<asio::steady_timer>(io);
    scheduleStatusTimer();

    if (config.getRefreshIntervalHours() > 0) {
        refreshRequested = true;
        refreshTimer = std::make_unique<asio::steady_timer>(io);
        scheduleRefreshTimer();
    }

    _status.store(DaemonStatus::RUNNING);
    ioThread = std::thread([this]{ io.run(); });
    cycleThread = std::thread([this]{ cycleLoop(); });
    info("Daemon started.");
}

void Daemon::initSignals() {
    signals.async_wait([this](auto ec, int sig) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                error("Error receiving signal: {}", ec.message());
            }
            return;
        }
        info("Received signal {}.", sig);
        stop();
    });
}

void Daemon::scheduleStatusTimer() {
    statusTimer->expires_after(std::chrono::seconds(config.getStatusIntervalSeconds()));
    statusTimer->async_wait([this](const asio::error_code& ec) {
        if (!ec) {
            auto snapshot = server.currentSnapshot();
            info("--- Groundtrack Status ---");
            info("- Objects in store: {}", store.catalogNumbers().size());
            info("- Tracked objects: {}", server.trackedObjects().size());
            info("- Snapshot: sequence {}, {} objects", snapshot->sequence, snapshot->objects.size());
            info("--------------------------");
            scheduleStatusTimer(); // Reschedule the timer
        } else if (ec != asio::error::operation_aborted) {
            error("Status logging timer error: {}", ec.message());
        }
    });
}

void Daemon::scheduleRefreshTimer() {
    refreshTimer->expires_after(std::chrono::hours(config.getRefreshIntervalHours()));
    refreshTimer->async_wait([this](const asio::error_code& ec) {
        if (!ec) {
            requestRefresh();
            scheduleRefreshTimer();
        } else if (ec != asio::error::operation_aborted) {
            error("Element refresh timer error: {}", ec.message());
        }
    });
}

void Daemon::requestRefresh() {
    {
        std::scoped_lock lock(cycleMutex);
        refreshRequested = true;
    }
    cycleCV.notify_all();
}

void Daemon::refreshElements() {
    auto group = config.getCelestrakGroup();
    if (!group.empty()) {
        try {
            info("Refreshing element sets for group {} from Celestrak...", group);
            auto result = celestrak::submitAll(celestrak::getTLE(group), store);
            info("Stored {} new element sets for group {}.", result.accepted, group);
        } catch (const std::exception &e) {
            error("Failed to refresh group {}: {}", group, e.what());
        }
    }

    for (auto catalogNumber : config.getSatellites()) {
        try {
            auto result = celestrak::submitAll(celestrak::getTLEByCatalogNumber(catalogNumber), store);
            debug("Stored {} new element sets for object {}.", result.accepted, catalogNumber);
        } catch (const std::exception &e) {
            error("Failed to refresh object {}: {}", catalogNumber, e.what());
        }
    }
}

void Daemon::stop() {
    DaemonStatus expected = DaemonStatus::RUNNING;
    if (!_status.compare_exchange_strong(expected, DaemonStatus::STOPPING)) {
        return;
    }
    info("Stopping daemon...");
    {
        std::scoped_lock lock(cycleMutex);
    }
    cycleCV.notify_all();  // Wake up the cycle driver so it sees the status change

    http.stop();

    asio::post(io, [this]{
        asio::error_code ignored;
        signals.cancel(ignored);
        if (statusTimer) statusTimer->cancel();
        if (refreshTimer) refreshTimer->cancel();
        io.stop();
    });
}

void Daemon::cycleLoop() {
    auto interval = server.getOptions().cycleInterval;

    while (status() == DaemonStatus::RUNNING) {
        if (refreshRequested.exchange(false)) {
            refreshElements();
        }

        try {
            server.runCycle(std::chrono::system_clock::now());
        } catch (const std::exception &e) {
            error("Snapshot cycle failed: {}", e.what());
        }

        std::unique_lock lock(cycleMutex);
        cycleCV.wait_for(lock, interval, [this]{
            return status() != DaemonStatus::RUNNING || refreshRequested.load();
        });
    }

    // Update status to STOPPED when exiting loop
    _status.store(DaemonStatus::STOPPED);
    info("Daemon stopped.");
}

void Daemon::wait() {
    if (cycleThread.joinable()) {
        cycleThread.join();
    }
    if (ioThread.joinable()) {
        ioThread.join();
    }
}

ElementStore& Daemon::getStore() {
    return store;
}

SnapshotServer& Daemon::getServer() {
    return server;
}

unsigned short Daemon::getPort() const {
    return http.getPort();
}

}
