#include "mapbearing/error.h"
#include "mapbearing/logging.h"
#include "mapbearing/pipeline.h"
#include "mapbearing/version.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace MapBearing;
using nlohmann::json;

namespace {

struct Options {
    std::string dir;
    std::string out_path;
    std::string config_path;
    int jobs              = 0; // 0 = hardware concurrency
    std::string log_level = "info";
};

struct BatchEntry {
    std::string name;
    std::string path;
    bool ok = false;
    LocateResult result;
    std::string stage;
    std::string code;
    std::string message;
};

void PrintUsage(const char* exe) {
    std::fprintf(stderr,
                 "Usage: %s --dir photos/ [--out report.json]\n"
                 "Options:\n"
                 "  --dir DIR           Directory of map photographs (.png/.jpg/.jpeg/.bmp/.tif/.tiff)\n"
                 "  --jobs N            Worker threads (default: hardware concurrency)\n"
                 "  --out PATH          Write the JSON report to PATH (default: stdout)\n"
                 "  --config PATH       Pipeline config json (default: built-in calibration)\n"
                 "  --log-level LEVEL   Log level: trace/debug/info/warn/error/off (default: info)\n",
                 exe);
}

bool ParseInt(const char* s, int& out) {
    if (!s) { return false; }
    try {
        size_t idx = 0;
        int value  = std::stoi(s, &idx, 10);
        if (idx != std::string(s).size()) { return false; }
        out = value;
        return true;
    } catch (const std::exception&) { return false; }
}

bool ParseArgs(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--dir" && i + 1 < argc) {
            opt.dir = argv[++i];
            continue;
        }
        if (arg == "--out" && i + 1 < argc) {
            opt.out_path = argv[++i];
            continue;
        }
        if (arg == "--config" && i + 1 < argc) {
            opt.config_path = argv[++i];
            continue;
        }
        if (arg == "--jobs" && i + 1 < argc) {
            if (!ParseInt(argv[++i], opt.jobs) || opt.jobs < 1) {
                std::fprintf(stderr, "Invalid --jobs value\n");
                return false;
            }
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
        std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
        PrintUsage(argv[0]);
        return false;
    }
    if (opt.dir.empty()) {
        PrintUsage(argv[0]);
        return false;
    }
    return true;
}

bool IsImageFile(const std::filesystem::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tif" ||
           ext == ".tiff";
}

std::vector<std::filesystem::path> CollectImages(const std::string& dir) {
    namespace fs = std::filesystem;
    if (!fs::is_directory(dir)) { throw IOError("Not a directory: " + dir); }

    std::vector<fs::path> images;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && IsImageFile(entry.path())) {
            images.push_back(entry.path());
        }
    }
    std::sort(images.begin(), images.end());
    return images;
}

void RunOne(BatchEntry& entry, const PipelineConfig& config) {
    try {
        LocateRequest req;
        req.image_path = entry.path;
        req.config     = config;
        entry.result   = Locate(req);
        entry.ok       = true;
    } catch (const StageError& e) {
        entry.stage   = ToPipelineStageString(e.stage());
        entry.code    = ToErrorCodeString(e.code());
        entry.message = e.what();
    } catch (const IOError& e) {
        entry.stage   = ToPipelineStageString(PipelineStage::LoadingImage);
        entry.code    = ToErrorCodeString(e.code());
        entry.message = e.what();
    } catch (const Error& e) {
        entry.code    = ToErrorCodeString(e.code());
        entry.message = e.what();
    } catch (const std::exception& e) {
        entry.code    = ToErrorCodeString(ErrorCode::InternalError);
        entry.message = e.what();
    }
    if (!entry.ok) {
        spdlog::warn("{}: {} [{}] {}", entry.name, entry.stage, entry.code, entry.message);
    }
}

json EntryToJson(const BatchEntry& entry) {
    json j;
    j["name"] = entry.name;
    j["ok"]   = entry.ok;
    if (entry.ok) {
        j["position"] = {entry.result.position.xpos, entry.result.position.ypos};
        j["bearing"]  = entry.result.bearing;
        j["report"]   = FormatReport(entry.result);
    } else {
        json error;
        error["stage"]   = entry.stage.empty() ? json(nullptr) : json(entry.stage);
        error["code"]    = entry.code;
        error["message"] = entry.message;
        j["error"]       = error;
    }
    return j;
}

} // namespace

int main(int argc, char** argv) {
    Options opt;

    if (!ParseArgs(argc, argv, opt)) { return 1; }

    InitLogging(ParseLogLevel(opt.log_level));
    spdlog::info("map_bearing_batch {}", MAPBEARING_VERSION_STRING);

    std::vector<BatchEntry> entries;
    PipelineConfig config;
    try {
        if (!opt.config_path.empty()) { config = PipelineConfig::LoadFromJson(opt.config_path); }
        for (const auto& path : CollectImages(opt.dir)) {
            BatchEntry entry;
            entry.name = path.filename().string();
            entry.path = path.string();
            entries.push_back(std::move(entry));
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed: {}", e.what());
        return 1;
    }
    if (entries.empty()) { spdlog::warn("No images found in {}", opt.dir); }

    int jobs = opt.jobs > 0 ? opt.jobs : static_cast<int>(std::thread::hardware_concurrency());
    jobs     = std::clamp(jobs, 1, std::max(1, static_cast<int>(entries.size())));
    spdlog::info("Processing {} image(s) on {} thread(s)", entries.size(), jobs);

    // Each worker claims the next unprocessed index; entries are never shared.
    std::atomic<size_t> next{0};
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(jobs));
    for (int t = 0; t < jobs; ++t) {
        workers.emplace_back([&]() {
            for (size_t i = next.fetch_add(1); i < entries.size(); i = next.fetch_add(1)) {
                RunOne(entries[i], config);
            }
        });
    }
    for (auto& w : workers) { w.join(); }

    json images = json::array();
    size_t failed = 0;
    for (const auto& entry : entries) {
        if (!entry.ok) { ++failed; }
        images.push_back(EntryToJson(entry));
    }
    json report;
    report["version"]   = MAPBEARING_VERSION_STRING;
    report["directory"] = opt.dir;
    report["total"]     = entries.size();
    report["failed"]    = failed;
    report["images"]    = std::move(images);

    if (opt.out_path.empty()) {
        std::fputs((report.dump(2) + "\n").c_str(), stdout);
    } else {
        std::ofstream out(opt.out_path);
        if (!out.is_open()) {
            spdlog::error("Failed to open file: {}", opt.out_path);
            return 1;
        }
        out << report.dump(2) << "\n";
        if (!out.good()) {
            spdlog::error("Failed to write report: {}", opt.out_path);
            return 1;
        }
        spdlog::info("Saved report to {}", opt.out_path);
    }

    spdlog::info("Done: {} ok, {} failed", entries.size() - failed, failed);
    return failed == 0 ? 0 : 1;
}
