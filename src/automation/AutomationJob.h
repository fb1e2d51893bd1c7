#pragma once

#include "room/RoomBuilder.h"
#include "room/RoomError.h"
#include <string>

namespace roommaker {

// Everything the automation host hands to one job run.
// Relative paths are resolved against workDir.
struct JobConfig {
    std::string workDir = ".";
    std::string specFileName = "room.json";
    std::string templatePath;                // Optional; empty document if not set
    std::string outputPath = "result.json";
    std::string documentTitle = "RoomMaker";
};

struct JobResult {
    bool success = false;
    RoomError error;
    RoomBuildResult build;
    std::string outputPath;                  // Set when the document was saved
};

namespace AutomationJob {
    std::string resolvePath(const std::string& workDir, const std::string& path);

    // Loads room.json (+ template), builds the room and saves the document.
    // success is true only if the room transaction committed and the
    // result was written.
    JobResult run(const JobConfig& config);
}

} // namespace roommaker
