#include "AutomationJob.h"
#include "document/Document.h"
#include "document/DocumentIO.h"
#include "room/RoomSpecLoader.h"
#include <SDL3/SDL_log.h>
#include <filesystem>

namespace roommaker {
namespace AutomationJob {

namespace {

JobResult fail(JobResult result, RoomErrorKind kind, const std::string& message) {
    result.success = false;
    result.error = RoomError::make(kind, message);
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "AutomationJob: %s", message.c_str());
    return result;
}

} // anonymous namespace

std::string resolvePath(const std::string& workDir, const std::string& path) {
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p.string();
    }
    return (std::filesystem::path(workDir) / p).string();
}

JobResult run(const JobConfig& config) {
    JobResult result;

    std::string specPath = resolvePath(config.workDir, config.specFileName);
    std::error_code ec;
    if (!std::filesystem::exists(specPath, ec)) {
        return fail(std::move(result), RoomErrorKind::InvalidInput,
                    config.specFileName + " not found in working directory: " + specPath);
    }

    auto spec = RoomSpecLoader::loadFromFile(specPath);
    if (!spec) {
        return fail(std::move(result), RoomErrorKind::InvalidInput, "Could not read room spec " + specPath);
    }

    Document doc(config.documentTitle);
    if (!config.templatePath.empty()) {
        std::string templatePath = resolvePath(config.workDir, config.templatePath);
        if (!DocumentIO::loadTemplateFile(templatePath, doc)) {
            return fail(std::move(result), RoomErrorKind::InvalidInput,
                        "Could not load template " + templatePath);
        }
    }

    result.build = RoomBuilder::build(doc, *spec);
    if (!result.build.success) {
        result.error = result.build.error;
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "AutomationJob: room creation failed (%s): %s",
                     roomErrorKindName(result.error.kind), result.error.message.c_str());
        return result;
    }

    std::string outputPath = resolvePath(config.workDir, config.outputPath);
    if (!DocumentIO::save(outputPath, doc)) {
        return fail(std::move(result), RoomErrorKind::PersistenceFailure, "Could not write " + outputPath);
    }

    result.success = true;
    result.outputPath = outputPath;
    return result;
}

} // namespace AutomationJob
} // namespace roommaker
