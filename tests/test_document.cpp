// Tests for the document element store and its transactions

#include <doctest/doctest.h>
#include "document/Document.h"
#include "document/Transaction.h"
#include "DocumentFixtures.h"
#include <stdexcept>

using namespace roommaker;

namespace {

CurveLoop squareLoop(double size) {
    CurveLoop loop;
    glm::dvec3 p[] = {{0, 0, 0}, {size, 0, 0}, {size, size, 0}, {0, size, 0}};
    for (int i = 0; i < 4; ++i) {
        loop.append(Line{p[i], p[(i + 1) % 4]});
    }
    return loop;
}

} // anonymous namespace

TEST_SUITE("DocumentTransactions") {
    TEST_CASE("creation outside a transaction is rejected") {
        Document doc;
        CHECK(doc.createLevel(0.0, "Level 0") == entt::null);
        CHECK(doc.createWallType("Generic", WallKind::Basic) == entt::null);
        CHECK(doc.elementCount() == 0);
    }

    TEST_CASE("committed elements persist") {
        Document doc;
        REQUIRE(doc.beginTransaction("Create"));
        auto level = doc.createLevel(0.0, "Level 0");
        CHECK(level != entt::null);
        CHECK(doc.hasOpenTransaction());
        CHECK(doc.commitTransaction());
        CHECK_FALSE(doc.hasOpenTransaction());

        REQUIRE(doc.levels().size() == 1);
        CHECK(doc.level(level).name == "Level 0");
    }

    TEST_CASE("rollback discards everything created in the transaction") {
        Document doc;
        fixtures::addStandardTypes(doc);
        REQUIRE(doc.elementCount() == 2);

        REQUIRE(doc.beginTransaction("Discard"));
        auto level = doc.createLevel(0.0, "Level 0");
        auto wall = doc.createWall(Line{glm::dvec3(0.0), glm::dvec3(10.0, 0.0, 0.0)},
                                   doc.wallTypes().front(), level, 8.0, 0.0, false, false);
        CHECK(wall != entt::null);
        CHECK(doc.elementCount() == 4);
        doc.rollbackTransaction();

        CHECK(doc.elementCount() == 2);
        CHECK(doc.levels().empty());
        CHECK(doc.walls().empty());
        CHECK_FALSE(doc.registry().valid(level));
    }

    TEST_CASE("only one transaction may be open") {
        Document doc;
        REQUIRE(doc.beginTransaction("First"));
        CHECK_FALSE(doc.beginTransaction("Second"));
        CHECK(doc.transactionName() == "First");
        doc.rollbackTransaction();
        CHECK(doc.beginTransaction("Second"));
        doc.rollbackTransaction();
    }

    TEST_CASE("commit without a transaction fails") {
        Document doc;
        CHECK_FALSE(doc.commitTransaction());
    }

    TEST_CASE("element ids follow creation order and are reused after rollback") {
        Document doc;
        fixtures::addStandardTypes(doc);
        uint64_t floorTypeId = doc.elementId(doc.floorTypes().front());

        REQUIRE(doc.beginTransaction("Discard"));
        auto first = doc.createLevel(1.0, "A");
        CHECK(doc.elementId(first) == floorTypeId + 1);
        doc.rollbackTransaction();

        REQUIRE(doc.beginTransaction("Keep"));
        auto second = doc.createLevel(2.0, "B");
        CHECK(doc.elementId(second) == floorTypeId + 1);
        CHECK(doc.commitTransaction());
    }

    TEST_CASE("commit validator veto rolls back") {
        Document doc;
        doc.setCommitValidator([](const Document&) { return false; });

        REQUIRE(doc.beginTransaction("Vetoed"));
        doc.createLevel(0.0, "Level 0");
        CHECK_FALSE(doc.commitTransaction());
        CHECK_FALSE(doc.hasOpenTransaction());
        CHECK(doc.levels().empty());
    }

    TEST_CASE("commit rejects elements whose references were destroyed") {
        Document doc;
        fixtures::addStandardTypes(doc);
        fixtures::addLevel(doc, 0.0, "Level 0");
        auto level = doc.levels().front();

        REQUIRE(doc.beginTransaction("Dangling"));
        auto wall = doc.createWall(Line{glm::dvec3(0.0), glm::dvec3(10.0, 0.0, 0.0)},
                                   doc.wallTypes().front(), level, 8.0, 0.0, false, false);
        REQUIRE(wall != entt::null);
        doc.registry().destroy(level);
        CHECK_FALSE(doc.commitTransaction());
        CHECK(doc.walls().empty());
    }
}

TEST_SUITE("DocumentTransactionGuard") {
    TEST_CASE("guard rolls back when it goes out of scope") {
        Document doc;
        {
            Transaction tx(doc, "Scoped");
            REQUIRE(tx.start());
            CHECK(tx.isActive());
            doc.createLevel(0.0, "Level 0");
        }
        CHECK_FALSE(doc.hasOpenTransaction());
        CHECK(doc.levels().empty());
    }

    TEST_CASE("guard keeps committed changes") {
        Document doc;
        {
            Transaction tx(doc, "Scoped");
            REQUIRE(tx.start());
            doc.createLevel(0.0, "Level 0");
            CHECK(tx.commit());
            CHECK_FALSE(tx.isActive());
        }
        CHECK(doc.levels().size() == 1);
    }

    TEST_CASE("guard rolls back when an exception unwinds the scope") {
        Document doc;
        try {
            Transaction tx(doc, "Throwing");
            REQUIRE(tx.start());
            doc.createLevel(0.0, "Level 0");
            throw std::runtime_error("boom");
        } catch (const std::runtime_error&) {
        }
        CHECK_FALSE(doc.hasOpenTransaction());
        CHECK(doc.levels().empty());
    }

    TEST_CASE("guard cannot start over an open transaction") {
        Document doc;
        REQUIRE(doc.beginTransaction("Outer"));
        Transaction tx(doc, "Inner");
        CHECK_FALSE(tx.start());
        CHECK_FALSE(tx.commit());
        CHECK(doc.transactionName() == "Outer");
        doc.rollbackTransaction();
    }

    TEST_CASE("explicit rollback discards changes") {
        Document doc;
        Transaction tx(doc, "Discarded");
        CHECK(tx.name() == "Discarded");
        REQUIRE(tx.start());
        CHECK(doc.transactionName() == tx.name());
        doc.createLevel(0.0, "Level 0");

        tx.rollback();
        CHECK_FALSE(tx.isActive());
        CHECK_FALSE(doc.hasOpenTransaction());
        CHECK(doc.levels().empty());

        // Already finished
        CHECK_FALSE(tx.commit());
        tx.rollback();
        CHECK(doc.elementCount() == 0);
    }
}

TEST_SUITE("DocumentElements") {
    TEST_CASE("level names must be unique") {
        Document doc;
        fixtures::addLevel(doc, 10.0, "Level 0");

        REQUIRE(doc.beginTransaction("Duplicate"));
        CHECK(doc.createLevel(0.0, "Level 0") == entt::null);
        CHECK(doc.createLevel(0.0, "") == entt::null);
        doc.rollbackTransaction();
        CHECK(doc.levels().size() == 1);
    }

    TEST_CASE("wall validation") {
        Document doc;
        fixtures::addStandardTypes(doc);
        fixtures::addLevel(doc, 0.0, "Level 0");
        auto wallType = doc.wallTypes().front();
        auto floorType = doc.floorTypes().front();
        auto level = doc.levels().front();
        Line line{glm::dvec3(0.0), glm::dvec3(10.0, 0.0, 0.0)};

        REQUIRE(doc.beginTransaction("Walls"));
        CHECK(doc.createWall(line, floorType, level, 8.0, 0.0, false, false) == entt::null);
        CHECK(doc.createWall(line, wallType, wallType, 8.0, 0.0, false, false) == entt::null);
        CHECK(doc.createWall(line, wallType, level, 0.0, 0.0, false, false) == entt::null);
        CHECK(doc.createWall(Line{glm::dvec3(1.0), glm::dvec3(1.0)}, wallType, level, 8.0, 0.0, false, false)
              == entt::null);

        auto wall = doc.createWall(line, wallType, level, 8.0, 0.0, false, false);
        REQUIRE(wall != entt::null);
        CHECK(doc.wall(wall).height == 8.0);
        CHECK(doc.wall(wall).level == level);
        CHECK(doc.commitTransaction());
    }

    TEST_CASE("floor validation") {
        Document doc;
        fixtures::addStandardTypes(doc);
        fixtures::addLevel(doc, 0.0, "Level 0");
        auto wallType = doc.wallTypes().front();
        auto floorType = doc.floorTypes().front();
        auto level = doc.levels().front();

        CurveLoop open;
        open.append(Line{glm::dvec3(0.0), glm::dvec3(5.0, 0.0, 0.0)});
        open.append(Line{glm::dvec3(5.0, 0.0, 0.0), glm::dvec3(5.0, 5.0, 0.0)});

        REQUIRE(doc.beginTransaction("Floors"));
        CHECK(doc.createFloor({}, floorType, level) == entt::null);
        CHECK(doc.createFloor({open}, floorType, level) == entt::null);
        CHECK(doc.createFloor({squareLoop(5.0)}, wallType, level) == entt::null);
        CHECK(doc.createFloor({squareLoop(5.0)}, floorType, floorType) == entt::null);

        auto floor = doc.createFloor({squareLoop(5.0)}, floorType, level);
        REQUIRE(floor != entt::null);
        CHECK(doc.floor(floor).boundary.size() == 1);
        CHECK(doc.commitTransaction());
    }

    TEST_CASE("element validator can veto a category") {
        Document doc;
        doc.setElementValidator([](const Document&, ElementCategory category, entt::entity) {
            return category != ElementCategory::FloorType;
        });

        REQUIRE(doc.beginTransaction("Types"));
        CHECK(doc.createWallType("Generic", WallKind::Basic) != entt::null);
        CHECK(doc.createFloorType("Generic") == entt::null);
        CHECK(doc.commitTransaction());
        CHECK(doc.wallTypes().size() == 1);
        CHECK(doc.floorTypes().empty());
        CHECK(doc.elementCount() == 1);
    }

    TEST_CASE("queries return creation order") {
        Document doc;
        REQUIRE(doc.beginTransaction("Types"));
        doc.createWallType("A", WallKind::Curtain);
        doc.createWallType("B", WallKind::Basic);
        doc.createWallType("C", WallKind::Stacked);
        CHECK(doc.commitTransaction());

        auto types = doc.wallTypes();
        REQUIRE(types.size() == 3);
        CHECK(doc.wallType(types[0]).name == "A");
        CHECK(doc.wallType(types[1]).name == "B");
        CHECK(doc.wallType(types[2]).name == "C");
    }
}
