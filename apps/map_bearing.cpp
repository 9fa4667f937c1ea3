#include "mapbearing/error.h"
#include "mapbearing/logging.h"
#include "mapbearing/pipeline.h"

#include <cstdio>
#include <exception>
#include <string>

using namespace MapBearing;

namespace {

struct Options {
    std::string image_path;
    std::string config_path;
    std::string debug_dir;
    std::string log_level = "info";
};

void PrintUsage(const char* exe) {
    std::fprintf(stderr,
                 "Usage: %s [options] <image>\n"
                 "Prints the marker position and compass bearing found in a map photograph.\n"
                 "Options:\n"
                 "  --config PATH       Pipeline config json (default: built-in calibration)\n"
                 "  --debug-dir DIR     Dump intermediate images into DIR\n"
                 "  --log-level LEVEL   Log level: trace/debug/info/warn/error/off (default: info)\n",
                 exe);
}

bool ParseArgs(int argc, char** argv, Options& opt) {
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opt.config_path = argv[++i];
            continue;
        }
        if (arg == "--debug-dir" && i + 1 < argc) {
            opt.debug_dir = argv[++i];
            continue;
        }
        if (arg == "--log-level" && i + 1 < argc) {
            opt.log_level = argv[++i];
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return false;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            PrintUsage(argv[0]);
            return false;
        }
        opt.image_path = arg;
        ++positional;
    }
    if (positional != 1) {
        PrintUsage(argv[0]);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options opt;

    if (!ParseArgs(argc, argv, opt)) { return 1; }

    InitLogging(ParseLogLevel(opt.log_level));

    try {
        LocateRequest req;
        req.image_path = opt.image_path;
        if (!opt.config_path.empty()) {
            req.config = PipelineConfig::LoadFromJson(opt.config_path);
        }
        if (!opt.debug_dir.empty()) {
            req.config.debug.show_intermediate_steps = true;
            req.config.debug.dump_dir                = opt.debug_dir;
        }

        const LocateResult result = Locate(req, [](PipelineStage stage, float progress) {
            spdlog::debug("{} ({:.0f}%)", ToPipelineStageString(stage), progress * 100.0f);
        });
        std::fputs(FormatReport(result).c_str(), stdout);
    } catch (const StageError& e) {
        spdlog::error("{} failed [{}]: {}", ToPipelineStageString(e.stage()),
                      ToErrorCodeString(e.code()), e.what());
        return 1;
    } catch (const Error& e) {
        spdlog::error("Failed [{}]: {}", ToErrorCodeString(e.code()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Failed: {}", e.what());
        return 1;
    }

    return 0;
}
