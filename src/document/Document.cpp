#include "Document.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>

namespace roommaker {

const char* elementCategoryName(ElementCategory category) {
    switch (category) {
        case ElementCategory::Level:     return "Level";
        case ElementCategory::WallType:  return "WallType";
        case ElementCategory::FloorType: return "FloorType";
        case ElementCategory::Wall:      return "Wall";
        case ElementCategory::Floor:     return "Floor";
    }
    return "Element";
}

const char* wallKindName(WallKind kind) {
    switch (kind) {
        case WallKind::Basic:   return "basic";
        case WallKind::Curtain: return "curtain";
        case WallKind::Stacked: return "stacked";
    }
    return "basic";
}

// ============================================================================
// CurveLoop
// ============================================================================

bool CurveLoop::append(const Line& line) {
    if (!lines_.empty()) {
        if (isClosed()) {
            return false;
        }
        if (lines_.back().end != line.start) {
            return false;
        }
    }
    lines_.push_back(line);
    return true;
}

bool CurveLoop::isClosed() const {
    // A single line can't close on itself in a meaningful way
    if (lines_.size() < 2) {
        return false;
    }
    return lines_.back().end == lines_.front().start;
}

double CurveLoop::minLength() const {
    if (lines_.empty()) {
        return 0.0;
    }
    double shortest = lines_.front().length();
    for (const auto& line : lines_) {
        shortest = std::min(shortest, line.length());
    }
    return shortest;
}

// ============================================================================
// Document
// ============================================================================

Document::Document(std::string title)
    : title_(std::move(title)) {
}

bool Document::beginTransaction(const std::string& name) {
    if (transactionOpen_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Document: cannot start '%s', transaction '%s' is still open",
                     name.c_str(), transactionName_.c_str());
        return false;
    }
    transactionOpen_ = true;
    transactionName_ = name;
    transactionFirstId_ = nextElementId_;
    journal_.clear();
    return true;
}

bool Document::commitTransaction() {
    if (!transactionOpen_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: commit without an open transaction");
        return false;
    }

    for (auto element : journal_) {
        if (!registry_.valid(element)) {
            continue;
        }
        if (!referencesValid(element)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Document: commit of '%s' rejected, %s #%llu references a missing element",
                         transactionName_.c_str(),
                         elementCategoryName(registry_.get<ElementInfo>(element).category),
                         static_cast<unsigned long long>(elementId(element)));
            rollbackTransaction();
            return false;
        }
    }

    if (commitValidator_ && !commitValidator_(*this)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: commit of '%s' rejected by validator",
                     transactionName_.c_str());
        rollbackTransaction();
        return false;
    }

    SDL_Log("Document: committed '%s' (%zu new elements)", transactionName_.c_str(), journal_.size());
    transactionOpen_ = false;
    transactionName_.clear();
    journal_.clear();
    return true;
}

void Document::rollbackTransaction() {
    if (!transactionOpen_) {
        return;
    }

    for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
        if (registry_.valid(*it)) {
            registry_.destroy(*it);
        }
    }

    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Document: rolled back '%s' (%zu elements discarded)",
                transactionName_.c_str(), journal_.size());

    nextElementId_ = transactionFirstId_;
    transactionOpen_ = false;
    transactionName_.clear();
    journal_.clear();
}

bool Document::requireTransaction(const char* operation) const {
    if (!transactionOpen_) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: %s outside of a transaction", operation);
        return false;
    }
    return true;
}

template<typename Data>
entt::entity Document::emplaceElement(ElementCategory category, Data data) {
    auto entity = registry_.create();
    registry_.emplace<ElementInfo>(entity, ElementInfo{nextElementId_, category});
    registry_.emplace<Data>(entity, std::move(data));

    if (elementValidator_ && !elementValidator_(*this, category, entity)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: %s rejected by validator",
                     elementCategoryName(category));
        registry_.destroy(entity);
        return entt::null;
    }

    ++nextElementId_;
    journal_.push_back(entity);
    return entity;
}

entt::entity Document::createLevel(double elevation, const std::string& name) {
    if (!requireTransaction("createLevel")) {
        return entt::null;
    }
    if (name.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: level name must not be empty");
        return entt::null;
    }
    if (!std::isfinite(elevation)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: level '%s' has non-finite elevation",
                     name.c_str());
        return entt::null;
    }
    for (auto existing : levels()) {
        if (level(existing).name == name) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: level name '%s' is already in use",
                         name.c_str());
            return entt::null;
        }
    }
    return emplaceElement(ElementCategory::Level, LevelData{elevation, name});
}

entt::entity Document::createWallType(const std::string& name, WallKind kind) {
    if (!requireTransaction("createWallType")) {
        return entt::null;
    }
    return emplaceElement(ElementCategory::WallType, WallTypeData{name, kind});
}

entt::entity Document::createFloorType(const std::string& name) {
    if (!requireTransaction("createFloorType")) {
        return entt::null;
    }
    return emplaceElement(ElementCategory::FloorType, FloorTypeData{name});
}

entt::entity Document::createWall(const Line& location, entt::entity wallType, entt::entity level,
                                  double height, double baseOffset, bool flipped, bool structural) {
    if (!requireTransaction("createWall")) {
        return entt::null;
    }
    if (!isCategory(wallType, ElementCategory::WallType)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: wall type reference is not a wall type");
        return entt::null;
    }
    if (!isCategory(level, ElementCategory::Level)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: wall level reference is not a level");
        return entt::null;
    }
    if (!(height > 0.0) || !std::isfinite(height)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: wall height %.4f is not positive", height);
        return entt::null;
    }
    if (!(location.length() >= SHORT_CURVE_TOLERANCE)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: wall line is too short (%.6f ft)",
                     location.length());
        return entt::null;
    }

    WallData data;
    data.location = location;
    data.wallType = wallType;
    data.level = level;
    data.height = height;
    data.baseOffset = baseOffset;
    data.flipped = flipped;
    data.structural = structural;
    return emplaceElement(ElementCategory::Wall, std::move(data));
}

entt::entity Document::createFloor(const std::vector<CurveLoop>& boundary, entt::entity floorType,
                                   entt::entity level) {
    if (!requireTransaction("createFloor")) {
        return entt::null;
    }
    if (!isCategory(floorType, ElementCategory::FloorType)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: floor type reference is not a floor type");
        return entt::null;
    }
    if (!isCategory(level, ElementCategory::Level)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: floor level reference is not a level");
        return entt::null;
    }
    if (boundary.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: floor needs at least one boundary loop");
        return entt::null;
    }
    for (size_t i = 0; i < boundary.size(); ++i) {
        const CurveLoop& loop = boundary[i];
        if (loop.size() < 3 || !loop.isClosed()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: floor boundary loop %zu is not closed", i);
            return entt::null;
        }
        if (loop.minLength() < SHORT_CURVE_TOLERANCE) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Document: floor boundary loop %zu has a short edge", i);
            return entt::null;
        }
    }

    return emplaceElement(ElementCategory::Floor, FloorData{boundary, floorType, level});
}

std::vector<entt::entity> Document::elementsOf(ElementCategory category) const {
    std::vector<entt::entity> result;
    for (auto [entity, info] : registry_.view<ElementInfo>().each()) {
        if (info.category == category) {
            result.push_back(entity);
        }
    }
    std::sort(result.begin(), result.end(), [this](entt::entity a, entt::entity b) {
        return elementId(a) < elementId(b);
    });
    return result;
}

size_t Document::elementCount() const {
    return registry_.view<ElementInfo>().size();
}

bool Document::isCategory(entt::entity element, ElementCategory category) const {
    if (element == entt::null || !registry_.valid(element)) {
        return false;
    }
    const auto* info = registry_.try_get<ElementInfo>(element);
    return info != nullptr && info->category == category;
}

uint64_t Document::elementId(entt::entity element) const {
    if (element == entt::null || !registry_.valid(element)) {
        return 0;
    }
    const auto* info = registry_.try_get<ElementInfo>(element);
    return info ? info->id : 0;
}

bool Document::referencesValid(entt::entity element) const {
    if (const auto* wall = registry_.try_get<WallData>(element)) {
        return isCategory(wall->wallType, ElementCategory::WallType) &&
               isCategory(wall->level, ElementCategory::Level);
    }
    if (const auto* floor = registry_.try_get<FloorData>(element)) {
        return isCategory(floor->floorType, ElementCategory::FloorType) &&
               isCategory(floor->level, ElementCategory::Level);
    }
    return true;
}

} // namespace roommaker
