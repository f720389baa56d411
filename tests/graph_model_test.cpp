#include "gtest/gtest.h"
#include <chatviz/graph/graph_types.h>

#include <cmath>

using namespace chatviz::graph;

TEST(GraphModelTest, DropsAndRecordsDanglingEdges) {
    auto model = GraphModel::Build(ParseGraphPayload(R"({
        "nodes": [{"id": "a"}, {"id": "b"}],
        "edges": [{"source": "a", "target": "b"}, {"source": "a", "target": "ghost"}]
    })"));

    ASSERT_EQ(model->Edges().size(), 1u);
    EXPECT_EQ(model->Edges()[0].edge_id, 0u);
    ASSERT_EQ(model->DanglingEdges().size(), 1u);
    EXPECT_EQ(model->DanglingEdges()[0].edge_id, 1u);
    EXPECT_EQ(model->DanglingEdges()[0].target, "ghost");

    // Dangling edges do not count toward degree
    EXPECT_EQ(model->Degrees()[0], 1);
    EXPECT_EQ(model->Degrees()[1], 1);
    EXPECT_EQ(model->FindEdge(1), nullptr);
    EXPECT_NE(model->FindEdge(0), nullptr);
}

TEST(GraphModelTest, IndexesNodesById) {
    auto model = GraphModel::Build(ParseGraphPayload(R"({"nodes": [{"id": "x"}, {"id": "y"}]})"));
    EXPECT_EQ(model->NodeCount(), 2u);
    EXPECT_EQ(model->IndexOf("y"), std::optional<chatviz::NodeIndex>(1));
    EXPECT_FALSE(model->IndexOf("z").has_value());
}

TEST(GraphModelTest, NumericCoordinatesSeedPositions) {
    auto model = GraphModel::Build(ParseGraphPayload(R"({"nodes": [{"id": "a", "x": 10, "y": -5}, {"id": "b", "x": "10", "y": 3}]})"));
    ASSERT_TRUE(model->Nodes()[0].seed.has_value());
    EXPECT_FLOAT_EQ(model->Nodes()[0].seed->x, 10.0f);
    EXPECT_FLOAT_EQ(model->Nodes()[0].seed->y, -5.0f);
    EXPECT_FALSE(model->Nodes()[1].seed.has_value());
}

TEST(GraphModelTest, OutOfRangeCoordinatesAreNotSeeds) {
    auto model = GraphModel::Build(ParseGraphPayload(
        R"({"nodes": [{"id": "a", "x": 1e39, "y": 0}, {"id": "b", "x": 0, "y": -1e300}, {"id": "c", "x": 3.0e38, "y": 1}]})"));
    EXPECT_FALSE(model->Nodes()[0].seed.has_value());
    EXPECT_FALSE(model->Nodes()[1].seed.has_value());
    ASSERT_TRUE(model->Nodes()[2].seed.has_value());
    EXPECT_TRUE(std::isfinite(model->Nodes()[2].seed->x));
}
