// Standalone room generation tool
// Builds one rectangular room (4 walls, 1 floor, ground level) from room.json

#include "automation/AutomationJob.h"
#include "room/UnitConversion.h"
#include <SDL3/SDL_log.h>
#include <filesystem>
#include <string>

void printUsage(const char* programName) {
    SDL_Log("Usage: %s [options]", programName);
    SDL_Log(" ");
    SDL_Log("Options:");
    SDL_Log("  -w, --work-dir <path>  Working directory (default: current directory)");
    SDL_Log("  -s, --spec <file>      Room dimensions file (default: room.json)");
    SDL_Log("  -t, --template <file>  Template document with levels, wall and floor types");
    SDL_Log("  -o, --output <file>    Result document (default: result.json)");
    SDL_Log("  -h, --help             Show this help message");
    SDL_Log(" ");
    SDL_Log("Room file format:");
    SDL_Log("  { \"room\": { \"length_m\": 4.0, \"width_m\": 3.0, \"height_m\": 2.5 } }");
    SDL_Log(" ");
    SDL_Log("Relative paths are resolved against the working directory.");
}

int main(int argc, char* argv[]) {
    roommaker::JobConfig config;
    config.workDir = std::filesystem::current_path().string();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-w" || arg == "--work-dir") && i + 1 < argc) {
            config.workDir = argv[++i];
        } else if ((arg == "-s" || arg == "--spec") && i + 1 < argc) {
            config.specFileName = argv[++i];
        } else if ((arg == "-t" || arg == "--template") && i + 1 < argc) {
            config.templatePath = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            config.outputPath = argv[++i];
        } else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
    }

    SDL_Log("Room Maker");
    SDL_Log("==========");
    SDL_Log("Working directory: %s", config.workDir.c_str());
    SDL_Log("Spec: %s", config.specFileName.c_str());
    SDL_Log("Template: %s", config.templatePath.empty() ? "(none)" : config.templatePath.c_str());
    SDL_Log("Output: %s", config.outputPath.c_str());
    SDL_Log(" ");

    roommaker::JobResult result = roommaker::AutomationJob::run(config);
    if (!result.success) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Room creation failed [%s]: %s",
                     roommaker::roomErrorKindName(result.error.kind), result.error.message.c_str());
        return 1;
    }

    const auto& dims = result.build.dimensions;
    SDL_Log(" ");
    SDL_Log("Room created: %.3f x %.3f m, height %.3f m",
            roommaker::fromInternalLength(dims.length),
            roommaker::fromInternalLength(dims.width),
            roommaker::fromInternalLength(dims.height));
    SDL_Log("Walls: %zu, floors: 1, level %s", result.build.walls.size(),
            result.build.levelCreated ? "created" : "reused");
    SDL_Log("Done! Result written to: %s", result.outputPath.c_str());

    return 0;
}
