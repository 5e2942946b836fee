/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlekit.hpp>
#include <tlekit/ephemeris.hpp>
#include <CLI/CLI.hpp>
#include <date/date.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
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

/** Load a catalog file, failing if it has no usable entry */
std::map<int, tlekit::CatalogEntry> loadCatalog(const std::string &filename) {
    std::map<int, tlekit::CatalogEntry> catalog;
    if (tlekit::loadTleCatalog(expandTilde(filename), catalog) == 0) {
        throw std::runtime_error("No TLE found in " + filename);
    }
    return catalog;
}

const tlekit::CatalogEntry& findSatellite(const std::map<int, tlekit::CatalogEntry> &catalog, const int id) {
    auto it = catalog.find(id);
    if (it == catalog.end()) {
        throw std::runtime_error(fmt::format("Satellite {} not found in the TLE file", id));
    }
    return it->second;
}

/** Parse a YYYY-MM-DD HH:MM:SS UTC time */
tlekit::time_point parseTimeOption(const std::string &t) {
    std::istringstream in{t};
    tlekit::time_point tp;
    in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
    if (in.fail()) {
        throw CLI::ValidationError("--time", "Expected YYYY-MM-DD HH:MM:SS, got " + t);
    }
    return tp;
}

void printState(const tlekit::time_point time, const double minutes, const tlekit::PV &pv) {
    std::cout << date::format("%F %T UTC", std::chrono::floor<std::chrono::milliseconds>(time))
              << fmt::format("  t = {:10.3f} min", minutes) << std::endl;
    std::cout << fmt::format("  r = [{:16.6f}, {:16.6f}, {:16.6f}] m", pv.position.x, pv.position.y, pv.position.z)
              << std::endl;
    std::cout << fmt::format("  v = [{:16.9f}, {:16.9f}, {:16.9f}] m/s", pv.velocity.x, pv.velocity.y, pv.velocity.z)
              << std::endl;
}

void printMatrix(const std::string &title, const Eigen::MatrixXd &m) {
    std::cout << title << std::endl;
    for (Eigen::Index row = 0; row < m.rows(); ++row) {
        std::cout << " ";
        for (Eigen::Index col = 0; col < m.cols(); ++col) {
            std::cout << fmt::format(" {:14.6e}", m(row, col));
        }
        std::cout << std::endl;
    }
}

/** Validate every TLE in a file, returns the number of bad entries */
int checkCatalog(const std::string &filename) {
    std::ifstream file(expandTilde(filename));
    if (!file.is_open()) {
        throw std::runtime_error("Could not open TLE file: " + filename);
    }
    std::string line, line1;
    int lineNumber = 0;
    int good = 0;
    int bad = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.starts_with("1 ")) {
            line1 = line;
        } else if (line.starts_with("2 ") && !line1.empty()) {
            try {
                tlekit::Tle tle(line1, line);
                tlekit::Propagator propagator(tle);
                ++good;
            } catch (const tlekit::TleException &err) {
                std::cout << "Line " << lineNumber - 1 << ": " << err.what() << std::endl;
                ++bad;
            }
            line1.clear();
        }
    }
    std::cout << good << " valid, " << bad << " invalid" << std::endl;
    return bad;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    tlekit::Config config;

    auto configFile = expandTilde("~/.tlekit.toml");

    CLI::App app{"tlekit"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");
    app.add_option_function<double>("--epsilon",
        [&config](const double e) { config.setEpsilon(e); },
        "Fixed point convergence threshold (default 1e-10)");
    app.add_option_function<int>("--max-iterations",
        [&config](const int i) { config.setMaxIterations(i); },
        "Fixed point iteration budget (default 100)");
    app.add_option_function<double>("--step-factor",
        [&config](const double f) { config.setStepFactor(f); },
        "Finite difference step multiplier (default 1)");

    app.ignore_case();

    // check - validate a TLE file
    auto checkCommand = app.add_subcommand("check", "Validate every TLE in a file");
    std::string checkFile;
    checkCommand->add_option("file", checkFile, "TLE file")->required();

    // info - print elements
    auto infoCommand = app.add_subcommand("info", "Display orbital elements");
    std::string infoFile;
    std::vector<int> infoIDs;
    infoCommand->add_option("file", infoFile, "TLE file")->required();
    infoCommand->add_option("id", infoIDs, "Satellite number(s) (default: all)");

    // propagate - TEME position and velocity
    auto propagateCommand = app.add_subcommand("propagate", "Compute TEME position and velocity");
    std::string propagateFile;
    int propagateID = 0;
    std::vector<double> propagateMinutes;
    propagateCommand->add_option("file", propagateFile, "TLE file")->required();
    propagateCommand->add_option("id", propagateID, "Satellite number (ie. 25544)")->required();
    propagateCommand->add_option("--minutes", propagateMinutes, "Minutes since the TLE epoch");
    propagateCommand->add_option_function<std::string>("--time",
        [&config](const std::string &t) { config.setTime(parseTimeOption(t)); },
        "UTC time in \"YYYY-MM-DD HH:MM:SS\" format");

    // jacobian - state transition matrix
    auto jacobianCommand = app.add_subcommand("jacobian", "Compute the state transition matrix");
    std::string jacobianFile;
    int jacobianID = 0;
    double jacobianMinutes = 0.0;
    bool jacobianBStar = false;
    bool jacobianCompare = false;
    jacobianCommand->add_option("file", jacobianFile, "TLE file")->required();
    jacobianCommand->add_option("id", jacobianID, "Satellite number (ie. 25544)")->required();
    jacobianCommand->add_option("--minutes", jacobianMinutes, "Minutes since the TLE epoch")->required();
    jacobianCommand->add_flag("--bstar", jacobianBStar, "Include the B* column");
    jacobianCommand->add_flag("--compare", jacobianCompare, "Compare with finite differences");

    // fit - fixed point regeneration
    auto fitCommand = app.add_subcommand("fit", "Regenerate a TLE from its initial state");
    std::string fitFile;
    int fitID = 0;
    fitCommand->add_option("file", fitFile, "TLE file")->required();
    fitCommand->add_option("id", fitID, "Satellite number (ie. 25544)")->required();
    fitCommand->add_option_function<double>("--scale",
        [&config](const double s) { config.setScale(s); },
        "Fraction of the residual applied per iteration, in (0, 1]");

    // lsq - least squares fit of an ephemeris
    auto lsqCommand = app.add_subcommand("lsq", "Fit a TLE to a JSON ephemeris");
    std::string lsqFile;
    std::string lsqEphemeris;
    int lsqID = 0;
    lsqCommand->add_option("file", lsqFile, "TLE file with the template TLE")->required();
    lsqCommand->add_option("id", lsqID, "Satellite number (ie. 25544)")->required();
    lsqCommand->add_option("--ephemeris", lsqEphemeris, "JSON ephemeris file")->required()->check(CLI::ExistingFile);
    lsqCommand->add_option_function<int>("--iterations",
        [&config](const int i) { config.setLeastSquaresMaxIterations(i); },
        "Iteration budget (default 40)");
    lsqCommand->add_flag_function("--position-only",
        [&config](const int64_t p) { config.setPositionOnly(p > 0); },
        "Fit positions only");
    lsqCommand->add_flag_function("--bstar",
        [&config](const int64_t b) { config.setFitBStar(b > 0); },
        "Estimate B*");

    // ephemeris - write a JSON ephemeris
    auto ephemerisCommand = app.add_subcommand("ephemeris", "Write a JSON ephemeris");
    std::string ephemerisFile;
    int ephemerisID = 0;
    double ephemerisStep = 60.0;
    double ephemerisSpan = 1440.0;
    ephemerisCommand->add_option("file", ephemerisFile, "TLE file")->required();
    ephemerisCommand->add_option("id", ephemerisID, "Satellite number (ie. 25544)")->required();
    ephemerisCommand->add_option("--step", ephemerisStep, "Step in seconds (default 60)");
    ephemerisCommand->add_option("--span", ephemerisSpan, "Span in minutes (default 1440)");

    checkCommand->final_callback([&checkFile](void) {
        try {
            if (checkCatalog(checkFile) > 0) {
                std::exit(1);
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    infoCommand->final_callback([&infoFile, &infoIDs](void) {
        try {
            auto catalog = loadCatalog(infoFile);
            if (infoIDs.empty()) {
                for (const auto &[id, entry] : catalog) {
                    infoIDs.push_back(id);
                }
            }
            for (auto id : infoIDs) {
                if (!catalog.contains(id)) {
                    std::cerr << "Satellite " << id << " not found in the TLE file." << std::endl;
                    continue;
                }
                const auto &entry = catalog.at(id);
                tlekit::Propagator propagator(entry.tle);
                std::cout << (entry.name.empty() ? std::to_string(id) : entry.name) << std::endl;
                entry.tle.printInfo(std::cout);
                std::cout << "  Propagation Method: " << tlekit::toString(propagator.getMethod()) << std::endl;
                std::cout << "  Resonance: " << tlekit::toString(propagator.getResonance()) << std::endl;
                std::cout << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    propagateCommand->final_callback([propagateCommand, &config, &propagateFile, &propagateID, &propagateMinutes](void) {
        try {
            if (propagateMinutes.empty() && !config.hasTime()) {
                std::cerr << "Please provide --minutes or --time." << std::endl;
                std::cerr << propagateCommand->help() << std::endl;
                std::exit(1);
            }
            auto catalog = loadCatalog(propagateFile);
            const auto &entry = findSatellite(catalog, propagateID);
            tlekit::Propagator propagator(entry.tle);
            if (config.hasTime()) {
                propagateMinutes.push_back(tlekit::secondsSinceEpoch(entry.tle, config.getTime()) / 60.0);
            }
            for (double minutes : propagateMinutes) {
                const auto offset = std::chrono::duration_cast<tlekit::time_point::duration>(
                    std::chrono::duration<double>(minutes * 60.0));
                printState(entry.tle.getEpoch() + offset, minutes, propagator.propagate(minutes * 60.0));
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    jacobianCommand->final_callback([&config, &jacobianFile, &jacobianID, &jacobianMinutes, &jacobianBStar, &jacobianCompare](void) {
        try {
            auto catalog = loadCatalog(jacobianFile);
            const auto &entry = findSatellite(catalog, jacobianID);
            tlekit::ParameterSet parameters = tlekit::ParameterSet::forTle(entry.tle);
            parameters.get(tlekit::BSTAR).setSelected(jacobianBStar);

            const double seconds = jacobianMinutes * 60.0;
            tlekit::TlePartialDerivatives partials(entry.tle, parameters);
            const auto state = partials.propagate(seconds);
            printState(state.date, jacobianMinutes, state.pv);
            printMatrix("d(r, v) / d(n, e, i, raan, pa, M)", *partials.getStateTransitionMatrix(state));
            if (auto dYdP = partials.getParametersJacobian(state)) {
                printMatrix("d(r, v) / d(B*)", *dYdP);
            }

            if (jacobianCompare) {
                tlekit::FiniteDifferenceJacobian reference(entry.tle, parameters, config.getStepFactor());
                const Eigen::MatrixXd fd = reference.getStateTransitionMatrix(seconds);
                printMatrix("Finite differences", fd);
                printMatrix("Difference", *partials.getStateTransitionMatrix(state) - fd);
                if (jacobianBStar) {
                    printMatrix("Finite differences d(r, v) / d(B*)", reference.getParametersJacobian(seconds));
                }
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    fitCommand->final_callback([&config, &fitFile, &fitID](void) {
        try {
            auto catalog = loadCatalog(fitFile);
            const auto &entry = findSatellite(catalog, fitID);
            const tlekit::PV initial = tlekit::Propagator(entry.tle).getInitialState();
            const tlekit::Tle fitted = config.makeFixedPointGenerator().generate(initial, entry.tle.getEpoch(), entry.tle);
            if (!entry.name.empty()) {
                std::cout << entry.name << std::endl;
            }
            std::cout << fitted << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    lsqCommand->final_callback([&config, &lsqFile, &lsqID, &lsqEphemeris](void) {
        try {
            auto catalog = loadCatalog(lsqFile);
            const auto &entry = findSatellite(catalog, lsqID);
            const auto samples = tlekit::readEphemeris(lsqEphemeris);
            const auto result = config.makeLeastSquaresGenerator().generate(samples, entry.tle);
            if (!entry.name.empty()) {
                std::cout << entry.name << std::endl;
            }
            std::cout << result.tle << std::endl;
            std::cout << fmt::format("RMS: {:.3f} m after {} iterations{}", result.rms, result.iterations,
                                     result.converged ? "" : " (not converged)") << std::endl;
            if (!result.converged) {
                std::exit(1);
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    ephemerisCommand->final_callback([&ephemerisFile, &ephemerisID, &ephemerisStep, &ephemerisSpan](void) {
        try {
            auto catalog = loadCatalog(ephemerisFile);
            const auto &entry = findSatellite(catalog, ephemerisID);
            tlekit::Propagator propagator(entry.tle);
            const auto samples = tlekit::sampleEphemeris(propagator, ephemerisStep, ephemerisSpan * 60.0);
            tlekit::writeEphemeris(std::cout, entry.tle.getSatelliteNumber(), samples);
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
