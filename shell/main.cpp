#include <orthoplan/engine.h>
#include <orthoplan/CleanupPipeline.h>
#include <orthoplan/topology/InputValidator.h>
#include "include/file_io.h"

#include <fmt/core.h>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    struct ShellSettings {
        Orthoplan::Engine::TopologyOptions options;
        std::string inputPath;
        std::string outputPath;
        bool topology = false;
        bool validate = false;
    };

    void PrintUsage(const char* program) {
        fmt::print("Usage: {} [options] <polylines.txt>\n", program);
        fmt::print("  --min-area <v>        drop rooms smaller than v (default 50)\n");
        fmt::print("  --min-room-area <v>   room detection area threshold (default 100)\n");
        fmt::print("  --snap-tolerance <v>  orthogonal snap tolerance in degrees (default 5)\n");
        fmt::print("  --use-45              also snap to 45 degree directions\n");
        fmt::print("  --merge-distance <v>  parallel/colinear merge distance (default 10)\n");
        fmt::print("  --max-gap <v>         largest endpoint gap that is bridged (default 5)\n");
        fmt::print("  --topology            print walls, rooms and openings\n");
        fmt::print("  --validate            check input quality before cleaning\n");
        fmt::print("  --output <file>       write the result to a file instead of stdout\n");
        fmt::print("  --verbose             print pipeline progress\n");
    }

    double ParseNumber(const char* flag, const char* value) {
        try {
            size_t consumed = 0;
            double number = std::stod(value, &consumed);
            if (consumed != std::strlen(value)) throw std::invalid_argument(value);
            return number;
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + value);
        }
    }

    // Returns false when the program should exit (help, or bad arguments).
    bool ParseArguments(int argc, char* argv[], ShellSettings& settings, int& exitCode) {
        auto& cleanup = settings.options.cleanup;
        for (int i = 1; i < argc; ++i) {
            const char* arg = argv[i];
            auto nextValue = [&]() -> const char* {
                if (i + 1 >= argc) throw std::invalid_argument(std::string("missing value for ") + arg);
                return argv[++i];
            };

            if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
                PrintUsage(argv[0]);
                exitCode = 0;
                return false;
            } else if (strcmp(arg, "--min-area") == 0) {
                cleanup.minArea = ParseNumber(arg, nextValue());
            } else if (strcmp(arg, "--min-room-area") == 0) {
                cleanup.minRoomArea = ParseNumber(arg, nextValue());
            } else if (strcmp(arg, "--snap-tolerance") == 0) {
                cleanup.snapToleranceDeg = ParseNumber(arg, nextValue());
            } else if (strcmp(arg, "--use-45") == 0) {
                cleanup.use45Deg = true;
            } else if (strcmp(arg, "--merge-distance") == 0) {
                cleanup.mergeDistance = ParseNumber(arg, nextValue());
            } else if (strcmp(arg, "--max-gap") == 0) {
                cleanup.maxGap = ParseNumber(arg, nextValue());
            } else if (strcmp(arg, "--topology") == 0) {
                settings.topology = true;
            } else if (strcmp(arg, "--validate") == 0) {
                settings.validate = true;
            } else if (strcmp(arg, "--output") == 0) {
                settings.outputPath = nextValue();
            } else if (strcmp(arg, "--verbose") == 0) {
                cleanup.verbose = true;
            } else if (arg[0] == '-') {
                throw std::invalid_argument(std::string("unknown option ") + arg);
            } else if (settings.inputPath.empty()) {
                settings.inputPath = arg;
            } else {
                throw std::invalid_argument(std::string("unexpected argument ") + arg);
            }
        }
        if (settings.inputPath.empty()) {
            PrintUsage(argv[0]);
            exitCode = 2;
            return false;
        }
        return true;
    }

} // anonymous namespace

int main(int argc, char* argv[]) {
    ShellSettings settings;
    int exitCode = 0;
    try {
        if (!ParseArguments(argc, argv, settings, exitCode)) return exitCode;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Shell Error: " << e.what() << std::endl;
        return 2;
    }

    if (settings.options.cleanup.verbose) {
        initialize_engine();
    }

    std::vector<Orthoplan::Engine::Polyline> polylines;
    if (!Orthoplan::FileIO::LoadPolylinesFromFile(settings.inputPath, polylines)) {
        return 1;
    }

    if (settings.validate) {
        if (settings.options.cleanup.verbose) {
            Orthoplan::Engine::LogInputGeometry(polylines, settings.options.pxToMeters);
        }
        Orthoplan::Engine::ValidationResult validation = Orthoplan::Engine::ValidateInput(polylines);
        if (!validation.valid) {
            std::cerr << "Shell: Input rejected: " << validation.error.value_or("unknown reason") << std::endl;
            return 3;
        }
        std::cout << "Shell: Input accepted (" << validation.stats.wallCount << " walls, "
                  << validation.stats.closedLoops << " closed loops)" << std::endl;
    }

    const Orthoplan::Engine::GeometryInput input = Orthoplan::Engine::PolylineInput{ polylines };
    std::string text;
    if (settings.topology) {
        text = Orthoplan::Engine::FormatTopology(Orthoplan::Engine::ExtractTopology(input, settings.options));
    } else {
        text = Orthoplan::Engine::FormatCleanupResult(Orthoplan::Engine::Cleanup(input, settings.options.cleanup));
    }

    if (!settings.outputPath.empty()) {
        return Orthoplan::FileIO::WriteTextFile(settings.outputPath, text) ? 0 : 1;
    }
    fmt::print("{}", text);
    return 0;
}
