#include <Orrery/EngineConfig.hpp>
#include <Orrery/OrbitErrors.hpp>
#include <Orrery/SystemLoader.hpp>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include <stdexcept>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " <system.json> [--config <config.json>] [--jd <julian-date>] [--path <body> <segments>]\n";
}

struct Options {
    std::string systemPath;
    std::optional<std::string> configPath;
    std::optional<double> julianDate;
    std::optional<std::string> pathBody;
    int pathSegments = 0;
};

bool parseDouble(const std::string& s, double& out) {
    try {
        size_t used = 0;
        out = std::stod(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<Options> parseArgs(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opt.configPath = argv[++i];
        } else if (arg == "--jd" && i + 1 < argc) {
            double jd = 0.0;
            if (!parseDouble(argv[++i], jd)) return std::nullopt;
            opt.julianDate = jd;
        } else if (arg == "--path" && i + 2 < argc) {
            opt.pathBody = argv[++i];
            if (!parseInt(argv[++i], opt.pathSegments) || opt.pathSegments < 1) return std::nullopt;
        } else if (!arg.empty() && arg[0] != '-' && opt.systemPath.empty()) {
            opt.systemPath = arg;
        } else {
            return std::nullopt;
        }
    }
    if (opt.systemPath.empty()) return std::nullopt;
    return opt;
}

void printVec(const Orrery::Vec3& v) {
    std::cout << std::setw(16) << v.x << ' ' << std::setw(16) << v.y << ' ' << std::setw(16) << v.z;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::init(plog::info, &consoleAppender);

    std::optional<Options> opt = parseArgs(argc, argv);
    if (!opt) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        Orrery::EngineConfig config;
        if (opt->configPath) config = Orrery::EngineConfig::load(*opt->configPath);
        plog::get()->setMaxSeverity(config.logLevel);

        Orrery::SystemLoader loader(config);
        Orrery::LoadedSystem system = loader.loadFile(opt->systemPath);

        const double t = opt->julianDate.value_or(system.epoch);
        const Orrery::BodyGraph::PositionMap positions = system.graph.absolutePositions(t);

        std::cout << std::fixed << std::setprecision(9);
        std::cout << "# " << (system.name.empty() ? opt->systemPath : system.name)
                  << " at t=" << t << " (" << system.units.length << ")\n";
        for (const auto& id : system.graph.topologicalOrder()) {
            const Orrery::CelestialBody& body = system.graph.body(id);
            std::cout << std::left << std::setw(12) << id << std::right << ' ';
            printVec(positions.at(id));
            std::cout << "  depth=" << system.graph.depth(id) << " " << Orrery::bodyTypeName(body.bodyType) << "\n";
        }
        for (const auto& id : system.skipped)
            std::cout << "# skipped " << id << "\n";

        if (opt->pathBody) {
            std::vector<Orrery::Vec3> path =
                system.graph.absoluteOrbitPath(*opt->pathBody, t, opt->pathSegments);
            std::cout << "# orbit path of " << *opt->pathBody << " (" << path.size() << " points)\n";
            for (const auto& p : path) {
                printVec(p);
                std::cout << "\n";
            }
        }
    } catch (const Orrery::OrbitError& e) {
        PLOGE << e.what();
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    } catch (const std::invalid_argument& e) {
        PLOGE << e.what();
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
