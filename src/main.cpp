/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Load the element log into a store and keep appending new records to it */
void openElementLog(groundtrack::ElementLog &log, groundtrack::ElementStore &store) {
    log.replay(store);
    store.setAppendListener([&log](int, const std::string &name, const groundtrack::ElementRecord &record) {
        log.append(name, record);
    });
}

void printLoadResult(const std::string &source, const groundtrack::LoadResult &result) {
    std::cout << source << ": " << result.accepted << " new, "
              << result.duplicates << " duplicate, "
              << result.rejected << " rejected" << std::endl;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    groundtrack::Config config;
    config.setVerbose(false);
    config.setTime(std::chrono::system_clock::now());
    config.setElementLogPath(expandTilde("~/.groundtrack.tle"));

    auto configFile = expandTilde("~/.groundtrack.toml");

    CLI::App app{"Groundtrack"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<std::string>("--log",
        [&config](const std::string &path) { config.setElementLogPath(expandTilde(path)); },
        "Element log file (default: ~/.groundtrack.tle)");
    app.add_option_function<std::string>("--time",
        [&config](const std::string &str) {
            try {
                config.setTime(groundtrack::parseTimestamp(str));
            } catch (const std::invalid_argument &e) {
                throw CLI::ValidationError("--time", e.what());
            }
        },
        "Time to use instead of now (YYYY-MM-DDTHH:MM:SSZ)");
    app.add_option_function<std::vector<std::string>>("--station",
        [&config](const std::vector<std::string> &stations) {
            for (const auto &station : stations) {
                try {
                    config.addGroundStation(station);
                } catch (const std::invalid_argument &e) {
                    throw CLI::ValidationError("--station", e.what());
                }
            }
        },
        "Ground station as name:lat:lon (repeatable)");
    app.add_option_function<double>("--elev",
        [&config](const double e) { config.setMinimumElevation(e); },
        "Minimum elevation angle for coverage footprints in degrees (default 10)");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");

    app.ignore_case();

    // serve command - run the snapshot daemon
    auto serveCommand = app.add_subcommand("serve", "Serve live ground tracks over HTTP");
    serveCommand->add_option_function<std::string>("--listen",
        [&config](const std::string &a) { config.setListenAddress(a); },
        "Address to listen on (default 0.0.0.0)");
    serveCommand->add_option_function<int>("--port",
        [&config](const int p) { config.setPort(p); },
        "Port to listen on (default 8080)");
    serveCommand->add_option_function<std::vector<int>>("--sat",
        [&config](const std::vector<int> &ids) {
            for (auto id : ids) {
                config.addSatellite(id);
            }
        },
        "Catalog number(s) to track (default: every stored object)");
    serveCommand->add_option_function<std::string>("--group",
        [&config](const std::string &g) { config.setCelestrakGroup(g); },
        "Celestrak group to refresh (ie. stations)");
    serveCommand->add_option_function<int>("--refresh",
        [&config](const int h) { config.setRefreshIntervalHours(h); },
        "Hours between Celestrak refreshes (default 0, disabled)");
    serveCommand->add_option_function<int>("--interval",
        [&config](const int s) { config.setCycleIntervalSeconds(s); },
        "Seconds between snapshot cycles (default 10)");
    serveCommand->add_option_function<int>("--status",
        [&config](const int s) { config.setStatusIntervalSeconds(s); },
        "Seconds between status log messages (default 60)");
    serveCommand->add_option_function<int>("--window",
        [&config](const int m) { config.setPredictionWindowMinutes(m); },
        "Prediction window in minutes (default 90)");
    serveCommand->add_option_function<int>("--points",
        [&config](const int p) { config.setTargetPointCount(p); },
        "Sample budget per object (default 180)");
    serveCommand->add_option_function<double>("--tolerance",
        [&config](const double t) { config.setAngularTolerance(t); },
        "Angular tolerance between samples in degrees (default 0.5)");
    serveCommand->add_option_function<int>("--budget",
        [&config](const int ms) { config.setObjectTimeBudgetMilliseconds(ms); },
        "Time budget per object in milliseconds (default 2000)");
    serveCommand->add_option_function<int>("--history",
        [&config](const int h) { config.setDeltaHistorySize(h); },
        "Number of deltas kept for polling clients (default 64)");
    serveCommand->add_option_function<int>("--threads",
        [&config](const int t) { config.setWorkerThreads(t); },
        "Worker threads (default: one per core)");

    // ingest command - add TLE files to the element log
    std::vector<std::string> ingestFiles;
    auto ingestCommand = app.add_subcommand("ingest", "Add element sets from TLE files to the element log");
    ingestCommand->add_option("file", ingestFiles, "TLE file(s) to read")->required();

    // fetch command - download element sets from Celestrak
    std::vector<std::string> groups;
    std::vector<int> fetchIDs;
    auto fetchCommand = app.add_subcommand("fetch", "Download element sets from Celestrak into the element log");
    fetchCommand->add_option("--group", groups, "Celestrak TLE group(s) to download");
    fetchCommand->add_option("id", fetchIDs, "Catalog number(s) to download (ie. 25544)");

    // info command - show stored element sets
    std::vector<int> infoIDs;
    auto infoCommand = app.add_subcommand("info", "View stored element sets");
    infoCommand->add_option("id", infoIDs, "Catalog number(s) (ie. 25544)");

    // sample command - print a ground track
    std::vector<int> sampleIDs;
    int sampleMinutes = 90;
    int samplePoints = groundtrack::DEFAULT_TARGET_POINT_COUNT;
    double sampleTolerance = groundtrack::DEFAULT_ANGULAR_TOLERANCE_DEGREES;
    auto sampleCommand = app.add_subcommand("sample", "Print the ground track of a satellite");
    sampleCommand->add_option("id", sampleIDs, "Catalog number(s) (ie. 25544)");
    sampleCommand->add_option("--minutes", sampleMinutes, "Length of the window in minutes (default 90)");
    sampleCommand->add_option("--points", samplePoints, "Sample budget (default 180)");
    sampleCommand->add_option("--tolerance", sampleTolerance, "Angular tolerance in degrees (default 0.5)");

    // coverage command - footprint radius
    std::vector<int> coverageIDs;
    std::optional<double> coverageAltitude;
    auto coverageCommand = app.add_subcommand("coverage", "Compute coverage footprints");
    coverageCommand->add_option("id", coverageIDs, "Catalog number(s) (ie. 25544)");
    coverageCommand->add_option("--alt", coverageAltitude, "Altitude in km instead of a satellite");

    serveCommand->final_callback([&config](void) {
        try {
            groundtrack::Daemon daemon(config);
            daemon.start();
            daemon.wait();
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    ingestCommand->final_callback([&config, &ingestFiles](void) {
        try {
            groundtrack::ElementStore store;
            groundtrack::ElementLog log(config.getElementLogPath());
            openElementLog(log, store);
            for (const auto &file : ingestFiles) {
                std::ifstream in(file);
                if (!in.is_open()) {
                    std::cerr << "Unable to open " << file << std::endl;
                    continue;
                }
                printLoadResult(file, groundtrack::loadElements(in, store));
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    fetchCommand->final_callback([fetchCommand, &config, &groups, &fetchIDs](void) {
        try {
            if (groups.empty() && fetchIDs.empty()) {
                std::cerr << "Please provide a Celestrak group or at least one catalog number." << std::endl;
                std::cerr << fetchCommand->help() << std::endl;
                std::exit(1);
            }
            groundtrack::ElementStore store;
            groundtrack::ElementLog log(config.getElementLogPath());
            openElementLog(log, store);

            for (const auto &group : groups) {
                std::cout << "Downloading TLE data for group: " << group << "..." << std::endl;
                auto response = groundtrack::celestrak::getTLE(group);
                printLoadResult(group, groundtrack::celestrak::submitAll(response, store));
            }
            for (auto id : fetchIDs) {
                auto response = groundtrack::celestrak::getTLEByCatalogNumber(id);
                printLoadResult(std::to_string(id), groundtrack::celestrak::submitAll(response, store));
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    infoCommand->final_callback([infoCommand, &config, &infoIDs](void) {
        try {
            if (infoIDs.empty()) {
                std::cerr << "Please provide at least one catalog number." << std::endl;
                std::cerr << infoCommand->help() << std::endl;
                std::exit(1);
            }
            groundtrack::ElementStore store;
            groundtrack::ElementLog(config.getElementLogPath()).replay(store);
            for (auto id : infoIDs) {
                auto records = store.records(id);
                if (records.empty()) {
                    std::cerr << "Object " << id << " not found in the element log." << std::endl;
                    continue;
                }
                std::cout << store.name(id) << " (" << records.size() << " element sets)" << std::endl;
                for (const auto &record : records) {
                    record->printInfo(std::cout);
                    std::cout << std::endl;
                }
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    sampleCommand->final_callback([sampleCommand, &config, &sampleIDs, &sampleMinutes, &samplePoints, &sampleTolerance](void) {
        try {
            if (sampleIDs.empty()) {
                std::cerr << "Please provide at least one catalog number." << std::endl;
                std::cerr << sampleCommand->help() << std::endl;
                std::exit(1);
            }
            groundtrack::ElementStore store;
            groundtrack::ElementLog(config.getElementLogPath()).replay(store);
            groundtrack::TrackSampler sampler(store, {.angularToleranceInDegrees = sampleTolerance});

            auto start = config.getTime();
            auto end = start + std::chrono::minutes(sampleMinutes);
            for (auto id : sampleIDs) {
                auto samples = sampler.sample(id, start, end, samplePoints);
                std::cout << "Ground track for " << store.name(id) << " (" << id << "):" << std::endl;
                std::cout << fmt::format("{:^24} {:>10} {:>11} {:>10}", "Time", "Lat", "Lon", "Alt (km)") << std::endl;
                for (const auto &sample : samples) {
                    std::cout << fmt::format("{:^24} {:>10.4f} {:>11.4f} {:>10.2f}",
                                             groundtrack::formatTimestamp(sample.time),
                                             sample.latInDegrees, sample.lonInDegrees,
                                             sample.altInKilometers) << std::endl;
                }
                std::cout << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    coverageCommand->final_callback([coverageCommand, &config, &coverageIDs, &coverageAltitude](void) {
        try {
            if (coverageAltitude) {
                double radius = groundtrack::coverageRadius(*coverageAltitude, config.getMinimumElevation());
                std::cout << fmt::format("Coverage radius at {:.1f} km, {:.1f} deg elevation: {:.1f} km",
                                         *coverageAltitude, config.getMinimumElevation(), radius) << std::endl;
                return;
            }
            if (coverageIDs.empty()) {
                std::cerr << "Please provide an altitude or at least one catalog number." << std::endl;
                std::cerr << coverageCommand->help() << std::endl;
                std::exit(1);
            }
            groundtrack::ElementStore store;
            groundtrack::ElementLog(config.getElementLogPath()).replay(store);
            for (auto id : coverageIDs) {
                auto resolution = store.resolve(id, config.getTime());
                groundtrack::Propagator propagator(*resolution.record);
                auto footprint = groundtrack::computeFootprint(id, propagator.sample(config.getTime()),
                                                               config.getMinimumElevation());
                std::cout << "Satellite: " << store.name(id) << " (" << id << ")" << std::endl;
                std::cout << "  Center: " << footprint.center.latInDegrees << " deg, "
                          << footprint.center.lonInDegrees << " deg" << std::endl;
                std::cout << "  Altitude: " << footprint.center.altInKilometers << " km" << std::endl;
                std::cout << "  Radius: " << footprint.radiusInKilometers << " km" << std::endl;
                std::cout << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
