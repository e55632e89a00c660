/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/config.hpp>

#include <algorithm>

namespace groundtrack {

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

std::string Config::getElementLogPath() {
    return elementLogPath;
}

void Config::setElementLogPath(const std::string &path) {
    elementLogPath = path;
}

std::string Config::getListenAddress() {
    return listenAddress;
}

void Config::setListenAddress(const std::string &address) {
    listenAddress = address;
}

int Config::getPort() {
    return port;
}

void Config::setPort(const int p) {
    port = std::clamp(p, 0, 65535);
}

void Config::addSatellite(const int catalogNumber) {
    satellites.insert(catalogNumber);
}

void Config::removeSatellite(const int catalogNumber) {
    satellites.erase(catalogNumber);
}

void Config::clearSatellites() {
    satellites.clear();
}

std::set<int> Config::getSatellites() {
    return satellites;
}

bool Config::hasSatellites() {
    return !satellites.empty();
}

void Config::addGroundStation(const std::string &infoStr) {
    groundStations.push_back(parseGroundStation(infoStr));
}

void Config::clearGroundStations() {
    groundStations.clear();
}

std::vector<GroundStation> Config::getGroundStations() {
    return groundStations;
}

std::string Config::getCelestrakGroup() {
    return celestrakGroup;
}

void Config::setCelestrakGroup(const std::string &group) {
    celestrakGroup = group;
}

int Config::getRefreshIntervalHours() {
    return refreshIntervalHours;
}

void Config::setRefreshIntervalHours(const int hours) {
    if (hours > 0 && hours <= 168) {
        refreshIntervalHours = hours;
    } else if (hours > 168) {
        refreshIntervalHours = 168;
    } else {
        refreshIntervalHours = 0;
    }
}

int Config::getStatusIntervalSeconds() {
    return statusIntervalSeconds;
}

void Config::setStatusIntervalSeconds(const int seconds) {
    statusIntervalSeconds = std::clamp(seconds, 1, 3600);
}

int Config::getCycleIntervalSeconds() {
    return cycleIntervalSeconds;
}

void Config::setCycleIntervalSeconds(const int seconds) {
    cycleIntervalSeconds = std::clamp(seconds, 1, 3600);
}

int Config::getPredictionWindowMinutes() {
    return predictionWindowMinutes;
}

void Config::setPredictionWindowMinutes(const int minutes) {
    predictionWindowMinutes = std::clamp(minutes, 1, 7 * 24 * 60);
}

int Config::getTargetPointCount() {
    return targetPointCount;
}

void Config::setTargetPointCount(const int points) {
    targetPointCount = std::clamp(points, 2, 10000);
}

double Config::getAngularTolerance() {
    return angularTolerance;
}

void Config::setAngularTolerance(const double degrees) {
    angularTolerance = std::clamp(degrees, 0.001, 45.0);
}

int Config::getObjectTimeBudgetMilliseconds() {
    return objectTimeBudgetMilliseconds;
}

void Config::setObjectTimeBudgetMilliseconds(const int milliseconds) {
    objectTimeBudgetMilliseconds = std::clamp(milliseconds, 1, 60000);
}

double Config::getMinimumElevation() {
    return minimumElevation;
}

void Config::setMinimumElevation(const double degrees) {
    if (degrees >= 0.0 && degrees < 90.0) {
        minimumElevation = degrees;
    } else if (degrees >= 90.0) {
        minimumElevation = 89.0;
    } else {
        minimumElevation = 0.0;
    }
}

int Config::getDeltaHistorySize() {
    return deltaHistorySize;
}

void Config::setDeltaHistorySize(const int size) {
    deltaHistorySize = std::clamp(size, 1, 10000);
}

int Config::getWorkerThreads() {
    return workerThreads;
}

void Config::setWorkerThreads(const int threads) {
    workerThreads = std::clamp(threads, 0, 256);
}

time_point Config::getTime() {
    return time;
}

void Config::setTime(const time_point tp) {
    time = tp;
}

ServerOptions Config::getServerOptions() {
    return ServerOptions{
        .cycleInterval = std::chrono::seconds(cycleIntervalSeconds),
        .predictionWindow = std::chrono::minutes(predictionWindowMinutes),
        .targetPointCount = targetPointCount,
        .sampler = {
            .angularToleranceInDegrees = angularTolerance,
            .timeBudget = std::chrono::milliseconds(objectTimeBudgetMilliseconds)
        },
        .minimumElevationInDegrees = minimumElevation,
        .deltaHistorySize = static_cast<std::size_t>(deltaHistorySize),
        .workerThreads = static_cast<unsigned int>(workerThreads)
    };
}

}
