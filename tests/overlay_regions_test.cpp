#include "gtest/gtest.h"
#include <chatviz/graph/render/frame_geometry.h>

#include <memory>

using namespace chatviz::graph;

TEST(OverlayRegionsTest, NodeRadiusIsFixedInScreenSpace) {
    auto model = GraphModel::Build(ParseGraphPayload(R"({"nodes": [{"id": "a"}]})"));
    LayoutSnapshot snapshot;
    snapshot.positions = {ImVec2(100.0f, 100.0f)};
    snapshot.pinned = {false};

    for (float scale : {0.5f, 1.0f, 3.0f}) {
        ViewportTransform transform;
        transform.scale = scale;
        FrameGeometry frame = BuildFrameGeometry(*model, snapshot, transform, 0);
        ImVec2 c = frame.node_screen[0];

        EXPECT_TRUE(frame.overlays.HitTest(ImVec2(c.x + 24.0f, c.y)).has_value()) << "scale " << scale;
        EXPECT_FALSE(frame.overlays.HitTest(ImVec2(c.x + 26.0f, c.y)).has_value()) << "scale " << scale;
    }
}

TEST(OverlayRegionsTest, EdgeHitsWithinThicknessAlongSegment) {
    OverlayLayer layer;
    layer.AddEdge(4, ImVec2(0.0f, 0.0f), ImVec2(200.0f, 0.0f));

    auto hit = layer.HitTest(ImVec2(100.0f, 9.0f));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->kind, OverlayKind::kEdge);
    EXPECT_EQ(hit->element, 4u);

    EXPECT_FALSE(layer.HitTest(ImVec2(100.0f, 11.0f)).has_value());
    EXPECT_FALSE(layer.HitTest(ImVec2(205.0f, 0.0f)).has_value());
    EXPECT_FALSE(layer.HitTest(ImVec2(-5.0f, 0.0f)).has_value());
}

TEST(OverlayRegionsTest, RotatedEdgeFollowsItsAngle) {
    OverlayLayer layer;
    layer.AddEdge(0, ImVec2(0.0f, 0.0f), ImVec2(100.0f, 100.0f));

    EXPECT_TRUE(layer.HitTest(ImVec2(50.0f, 50.0f)).has_value());
    EXPECT_TRUE(layer.HitTest(ImVec2(55.0f, 45.0f)).has_value());   // ~7 px off the line
    EXPECT_FALSE(layer.HitTest(ImVec2(60.0f, 40.0f)).has_value());  // ~14 px off the line
    EXPECT_FALSE(layer.HitTest(ImVec2(100.0f, 0.0f)).has_value());
}

TEST(OverlayRegionsTest, NodesWinOverEdgesAndLaterOverEarlier) {
    auto model = GraphModel::Build(ParseGraphPayload(R"({
        "nodes": [{"id": "a"}, {"id": "b"}],
        "edges": [{"source": "a", "target": "b"}]
    })"));
    LayoutSnapshot snapshot;
    snapshot.positions = {ImVec2(0.0f, 0.0f), ImVec2(30.0f, 0.0f)};
    snapshot.pinned = {false, false};
    FrameGeometry frame = BuildFrameGeometry(*model, snapshot, ViewportTransform(), 0);

    // Inside both node circles and the edge rectangle
    auto hit = frame.overlays.HitTest(ImVec2(15.0f, 0.0f));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->kind, OverlayKind::kNode);
    EXPECT_EQ(hit->element, 1u);
}

TEST(OverlayRegionsTest, FrameFollowsTransform) {
    auto model = GraphModel::Build(ParseGraphPayload(R"({
        "nodes": [{"id": "a"}, {"id": "b"}],
        "edges": [{"source": "a", "target": "b"}]
    })"));
    LayoutSnapshot snapshot;
    snapshot.version = 7;
    snapshot.positions = {ImVec2(10.0f, 10.0f), ImVec2(200.0f, 10.0f)};
    snapshot.pinned = {false, false};

    ViewportTransform transform;
    transform.scale = 2.0f;
    transform.translate_x = 5.0f;
    FrameGeometry frame = BuildFrameGeometry(*model, snapshot, transform, 3);

    EXPECT_TRUE(frame.Matches(7, 3));
    EXPECT_FALSE(frame.Matches(8, 3));
    EXPECT_FLOAT_EQ(frame.node_screen[1].x, 405.0f);
    ASSERT_EQ(frame.edges.size(), 1u);
    EXPECT_FLOAT_EQ(frame.edges[0].to.x, 405.0f);

    // A point between the nodes on screen lies on the edge, not a node
    auto hit = frame.overlays.HitTest(ImVec2(200.0f, 20.0f));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->kind, OverlayKind::kEdge);
}
