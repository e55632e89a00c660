/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_CONFIG_HPP
#define __GROUNDTRACK_CONFIG_HPP

#include <groundtrack/ground_station.hpp>
#include <groundtrack/snapshot_server.hpp>

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace groundtrack {

class Config {
public:
    Config() = default;
    ~Config() = default;

    bool getVerbose();
    void setVerbose(bool);

    std::string getElementLogPath();
    void setElementLogPath(const std::string &path);

    std::string getListenAddress();
    void setListenAddress(const std::string &address);

    int getPort();
    void setPort(const int port);

    void addSatellite(const int catalogNumber);
    void removeSatellite(const int catalogNumber);
    void clearSatellites();
    std::set<int> getSatellites();
    bool hasSatellites();

    /**
     * @throws std::invalid_argument if the string is not "name:lat:lon"
     */
    void addGroundStation(const std::string &infoStr);
    void clearGroundStations();
    std::vector<GroundStation> getGroundStations();

    std::string getCelestrakGroup();
    void setCelestrakGroup(const std::string &group);

    /// Hours between Celestrak refreshes; 0 disables refreshing
    int getRefreshIntervalHours();
    void setRefreshIntervalHours(const int hours);

    int getStatusIntervalSeconds();
    void setStatusIntervalSeconds(const int seconds);

    int getCycleIntervalSeconds();
    void setCycleIntervalSeconds(const int seconds);

    int getPredictionWindowMinutes();
    void setPredictionWindowMinutes(const int minutes);

    int getTargetPointCount();
    void setTargetPointCount(const int points);

    double getAngularTolerance();
    void setAngularTolerance(const double degrees);

    int getObjectTimeBudgetMilliseconds();
    void setObjectTimeBudgetMilliseconds(const int milliseconds);

    double getMinimumElevation();
    void setMinimumElevation(const double degrees);

    int getDeltaHistorySize();
    void setDeltaHistorySize(const int size);

    int getWorkerThreads();
    void setWorkerThreads(const int threads);

    time_point getTime();
    void setTime(const time_point tp);

    /**
     * Snapshot server options built from the current settings.
     */
    ServerOptions getServerOptions();

private:
    bool verbose = false;
    std::string elementLogPath;
    std::string listenAddress = "0.0.0.0";
    int port = 8080;
    std::set<int> satellites;
    std::vector<GroundStation> groundStations;
    std::string celestrakGroup;
    int refreshIntervalHours = 0;
    int statusIntervalSeconds = 60;
    int cycleIntervalSeconds = static_cast<int>(DEFAULT_CYCLE_INTERVAL.count());
    int predictionWindowMinutes = static_cast<int>(DEFAULT_PREDICTION_WINDOW.count());
    int targetPointCount = DEFAULT_TARGET_POINT_COUNT;
    double angularTolerance = DEFAULT_ANGULAR_TOLERANCE_DEGREES;
    int objectTimeBudgetMilliseconds = static_cast<int>(DEFAULT_OBJECT_TIME_BUDGET.count());
    double minimumElevation = DEFAULT_MINIMUM_ELEVATION_DEGREES;
    int deltaHistorySize = static_cast<int>(DEFAULT_DELTA_HISTORY_SIZE);
    int workerThreads = 0;
    time_point time;
};

}

#endif
