#pragma once

#include "DocumentComponents.h"
#include <entt/entt.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace roommaker {

// Building-information document. Elements are entities in an EnTT registry,
// each carrying ElementInfo plus one data component for its category.
//
// All mutation happens inside a transaction. Elements created while a
// transaction is open are journaled; rollback destroys them again, so a
// rolled back transaction leaves the document exactly as it was.
class Document {
public:
    // Lines shorter than this are rejected as wall locations / floor edges (feet)
    static constexpr double SHORT_CURVE_TOLERANCE = 1.0 / 256.0;

    // Called for every newly created element before it is journaled.
    // Returning false rejects the creation.
    using ElementValidator = std::function<bool(const Document&, ElementCategory, entt::entity)>;

    // Called before a commit is accepted. Returning false rolls the transaction back.
    using CommitValidator = std::function<bool(const Document&)>;

    explicit Document(std::string title = "Untitled");
    ~Document() = default;

    // Non-copyable, movable
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;
    Document(Document&&) = default;
    Document& operator=(Document&&) = default;

    const std::string& title() const { return title_; }

    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

    // Transactions
    bool beginTransaction(const std::string& name);
    bool commitTransaction();
    void rollbackTransaction();
    bool hasOpenTransaction() const { return transactionOpen_; }
    const std::string& transactionName() const { return transactionName_; }

    // Element creation. Each returns entt::null if the document rejects the element.
    entt::entity createLevel(double elevation, const std::string& name);
    entt::entity createWallType(const std::string& name, WallKind kind);
    entt::entity createFloorType(const std::string& name);
    entt::entity createWall(const Line& location, entt::entity wallType, entt::entity level,
                            double height, double baseOffset, bool flipped, bool structural);
    entt::entity createFloor(const std::vector<CurveLoop>& boundary, entt::entity floorType,
                             entt::entity level);

    // Queries, in creation order
    std::vector<entt::entity> levels() const { return elementsOf(ElementCategory::Level); }
    std::vector<entt::entity> wallTypes() const { return elementsOf(ElementCategory::WallType); }
    std::vector<entt::entity> floorTypes() const { return elementsOf(ElementCategory::FloorType); }
    std::vector<entt::entity> walls() const { return elementsOf(ElementCategory::Wall); }
    std::vector<entt::entity> floors() const { return elementsOf(ElementCategory::Floor); }

    size_t elementCount() const;

    bool isCategory(entt::entity element, ElementCategory category) const;
    uint64_t elementId(entt::entity element) const;

    const LevelData& level(entt::entity e) const { return registry_.get<LevelData>(e); }
    const WallTypeData& wallType(entt::entity e) const { return registry_.get<WallTypeData>(e); }
    const FloorTypeData& floorType(entt::entity e) const { return registry_.get<FloorTypeData>(e); }
    const WallData& wall(entt::entity e) const { return registry_.get<WallData>(e); }
    const FloorData& floor(entt::entity e) const { return registry_.get<FloorData>(e); }

    void setElementValidator(ElementValidator validator) { elementValidator_ = std::move(validator); }
    void setCommitValidator(CommitValidator validator) { commitValidator_ = std::move(validator); }

private:
    std::vector<entt::entity> elementsOf(ElementCategory category) const;

    bool requireTransaction(const char* operation) const;

    // Creates the entity with ElementInfo, asks the element validator and
    // journals it. Returns entt::null (entity destroyed) on veto.
    template<typename Data>
    entt::entity emplaceElement(ElementCategory category, Data data);

    bool referencesValid(entt::entity element) const;

    std::string title_;
    entt::registry registry_;
    uint64_t nextElementId_ = 1;

    bool transactionOpen_ = false;
    std::string transactionName_;
    uint64_t transactionFirstId_ = 0;
    std::vector<entt::entity> journal_;

    ElementValidator elementValidator_;
    CommitValidator commitValidator_;
};

} // namespace roommaker
