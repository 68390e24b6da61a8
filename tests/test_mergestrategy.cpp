#include "testhelpers.h"

#include "convert/mergestrategy.h"

#include <stdexcept>

TEST_CASE("MergeStrategy: selector follows size and time limits", "[merge][strategy]") {
    const StrategyLimits limits{2000, 20000, 2000};

    SECTION("Above the medium limit always explodes") {
        REQUIRE(selectStrategy(25000, 0, limits) == MergeStrategy::Explode);
        REQUIRE(selectStrategy(20001, 99999, limits) == MergeStrategy::Explode);
    }

    SECTION("Between the limits uses the graph merge") {
        REQUIRE(selectStrategy(2001, 0, limits) == MergeStrategy::Graph);
        REQUIRE(selectStrategy(20000, 0, limits) == MergeStrategy::Graph);
    }

    SECTION("Small inputs use the robust merge unless over budget") {
        REQUIRE(selectStrategy(0, 0, limits) == MergeStrategy::Robust);
        REQUIRE(selectStrategy(2000, 2000, limits) == MergeStrategy::Robust);
        REQUIRE(selectStrategy(10, 2001, limits) == MergeStrategy::Graph);
    }
}

TEST_CASE("MergeStrategy: chain only moves down from the start tier", "[merge][strategy]") {
    QVector<MergeStrategy> ran;
    MergeTierChain chain;
    chain.addTier(MergeStrategy::Robust, [&ran](MergeOutcome&) { ran.append(MergeStrategy::Robust); return false; });
    chain.addTier(MergeStrategy::Graph, [&ran](MergeOutcome&) { ran.append(MergeStrategy::Graph); return false; });
    chain.addTier(MergeStrategy::Explode, [&ran](MergeOutcome& out) {
        ran.append(MergeStrategy::Explode);
        Row row;
        row.type = GeometryType::Line;
        row.geometry = Geometry::lineString(VertexList{Vertex(0, 0), Vertex(1, 0)});
        out.rows.append(row);
        return true;
    });

    SECTION("Starting at robust tries every tier in order") {
        MergeOutcome outcome;
        QVector<MergeStrategy> attempted;
        REQUIRE(chain.run(MergeStrategy::Robust, outcome, &attempted));
        REQUIRE(attempted == QVector<MergeStrategy>{MergeStrategy::Robust, MergeStrategy::Graph, MergeStrategy::Explode});
        REQUIRE(outcome.strategy == MergeStrategy::Explode);
        REQUIRE(outcome.rows.size() == 1);
    }

    SECTION("Starting at graph never runs robust") {
        MergeOutcome outcome;
        REQUIRE(chain.run(MergeStrategy::Graph, outcome));
        REQUIRE(ran == QVector<MergeStrategy>{MergeStrategy::Graph, MergeStrategy::Explode});
    }
}

TEST_CASE("MergeStrategy: a throwing tier counts as a failure", "[merge][strategy]") {
    MergeTierChain chain;
    chain.addTier(MergeStrategy::Robust, [](MergeOutcome&) -> bool { throw std::runtime_error("boom"); });
    chain.addTier(MergeStrategy::Graph, [](MergeOutcome& out) {
        out.merged = Geometry::lineString(VertexList{Vertex(0, 0), Vertex(2, 0)});
        return true;
    });

    MergeOutcome outcome;
    REQUIRE(chain.run(MergeStrategy::Robust, outcome));
    REQUIRE(outcome.strategy == MergeStrategy::Graph);
    REQUIRE_FALSE(outcome.merged.isEmpty());
}

TEST_CASE("MergeStrategy: chain fails when every tier fails", "[merge][strategy]") {
    MergeTierChain chain;
    chain.addTier(MergeStrategy::Robust, [](MergeOutcome&) { return false; });
    chain.addTier(MergeStrategy::Graph, [](MergeOutcome&) { return false; });

    MergeOutcome outcome;
    REQUIRE_FALSE(chain.run(MergeStrategy::Robust, outcome));
}
