#include "gtest/gtest.h"
#include <chatviz/graph/render/viewport_transform.h>

using namespace chatviz::graph;

TEST(ViewportTransformTest, PanAndZoomInvariants) {
    ViewportTransform transform;
    ImVec2 world_point(100, 200);

    // Initial state
    ImVec2 screen_point = transform.WorldToScreen(world_point);
    ImVec2 world_point_rt = transform.ScreenToWorld(screen_point);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);

    // Zoom
    transform.scale = 2.0f;
    screen_point = transform.WorldToScreen(world_point);
    EXPECT_NEAR(screen_point.x, 200.0f, 1e-3);
    world_point_rt = transform.ScreenToWorld(screen_point);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);

    // Pan
    transform.translate_x = 30.0f;
    transform.translate_y = -40.0f;
    screen_point = transform.WorldToScreen(world_point);
    EXPECT_NEAR(screen_point.y, 360.0f, 1e-3);
    world_point_rt = transform.ScreenToWorld(screen_point);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);
}

TEST(ViewportControllerTest, ScaleIsClamped) {
    ViewportController viewport;
    viewport.SetScale(10.0f);
    EXPECT_FLOAT_EQ(viewport.Transform().scale, ViewportController::kMaxScale);
    viewport.SetScale(0.01f);
    EXPECT_FLOAT_EQ(viewport.Transform().scale, ViewportController::kMinScale);

    for (int i = 0; i < 100; ++i) viewport.ZoomAt(ImVec2(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(viewport.Transform().scale, 3.0f);
}

TEST(ViewportControllerTest, ZoomKeepsAnchorFixed) {
    ViewportController viewport;
    viewport.Pan(ImVec2(15.0f, -25.0f));
    ImVec2 anchor(320.0f, 240.0f);
    ImVec2 world_before = viewport.Transform().ScreenToWorld(anchor);

    viewport.ZoomAt(anchor, 3.0f);
    EXPECT_NEAR(viewport.Transform().scale, 1.3f, 1e-4);
    ImVec2 anchor_after = viewport.Transform().WorldToScreen(world_before);
    EXPECT_NEAR(anchor_after.x, anchor.x, 1e-3);
    EXPECT_NEAR(anchor_after.y, anchor.y, 1e-3);

    viewport.ZoomAt(anchor, -5.0f);
    anchor_after = viewport.Transform().WorldToScreen(world_before);
    EXPECT_NEAR(anchor_after.x, anchor.x, 1e-3);
    EXPECT_NEAR(anchor_after.y, anchor.y, 1e-3);
}

TEST(ViewportControllerTest, MutationsBumpRevision) {
    ViewportController viewport;
    std::uint64_t revision = viewport.Revision();

    viewport.Pan(ImVec2(0.0f, 0.0f));
    EXPECT_EQ(viewport.Revision(), revision);

    viewport.Pan(ImVec2(1.0f, 0.0f));
    EXPECT_GT(viewport.Revision(), revision);
    revision = viewport.Revision();

    viewport.SetScale(2.0f);
    EXPECT_GT(viewport.Revision(), revision);
}

TEST(ViewportControllerTest, ResetRestoresIdentity) {
    ViewportController viewport;
    viewport.SetScale(2.5f);
    viewport.SetTranslate(ImVec2(-100.0f, 40.0f));
    viewport.Reset();

    EXPECT_FLOAT_EQ(viewport.Transform().scale, 1.0f);
    EXPECT_FLOAT_EQ(viewport.Transform().translate_x, 0.0f);
    EXPECT_FLOAT_EQ(viewport.Transform().translate_y, 0.0f);
}
