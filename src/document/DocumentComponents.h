#pragma once

#include <glm/glm.hpp>
#include <entt/entt.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace roommaker {

// Element categories stored in a Document
enum class ElementCategory : uint8_t {
    Level,
    WallType,
    FloorType,
    Wall,
    Floor
};

const char* elementCategoryName(ElementCategory category);

// Wall type families. Only Basic walls are usable for room boundaries.
enum class WallKind : uint8_t {
    Basic,
    Curtain,
    Stacked
};

const char* wallKindName(WallKind kind);

// Bounded straight line between two points (document units)
struct Line {
    glm::dvec3 start{0.0};
    glm::dvec3 end{0.0};

    double length() const { return glm::length(end - start); }
};

// Ordered, closed sequence of lines. end(i) == start(i + 1 mod n).
class CurveLoop {
public:
    // Appends a line. Rejected if the loop is already closed or the line does
    // not start where the previous one ended.
    bool append(const Line& line);

    bool isClosed() const;
    bool empty() const { return lines_.empty(); }
    size_t size() const { return lines_.size(); }

    const std::vector<Line>& lines() const { return lines_; }
    const Line& operator[](size_t index) const { return lines_[index]; }

    // Shortest line length in the loop (0 for an empty loop)
    double minLength() const;

private:
    std::vector<Line> lines_;
};

// Present on every element. id grows with creation order.
struct ElementInfo {
    uint64_t id = 0;
    ElementCategory category = ElementCategory::Level;
};

struct LevelData {
    double elevation = 0.0;
    std::string name;
};

struct WallTypeData {
    std::string name;
    WallKind kind = WallKind::Basic;
};

struct FloorTypeData {
    std::string name;
};

struct WallData {
    Line location;
    entt::entity wallType = entt::null;
    entt::entity level = entt::null;
    double height = 0.0;
    double baseOffset = 0.0;
    bool flipped = false;
    bool structural = false;
};

struct FloorData {
    std::vector<CurveLoop> boundary;
    entt::entity floorType = entt::null;
    entt::entity level = entt::null;
};

} // namespace roommaker
