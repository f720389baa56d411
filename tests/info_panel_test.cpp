#include "gtest/gtest.h"
#include <chatviz/graph/interaction/info_panel.h>

using namespace chatviz::graph;

class InfoPanelTest : public ::testing::Test {
protected:
    void SetUp() override {
        model = GraphModel::Build(ParseGraphPayload(R"({
            "nodes": [
                {"id": "a", "label": "Alpha", "x": 1, "y": 2, "vx": 0, "tags": ["t1", "t2"]},
                {"id": "b"}
            ],
            "edges": [{"source": "a", "target": "b", "weight": 2, "index": 0, "x": 5, "vx": 1}]
        })"));

        LayoutSnapshot snapshot;
        snapshot.positions = {ImVec2(10.0f, 50.0f), ImVec2(110.0f, 50.0f)};
        snapshot.pinned = {false, false};
        frame = BuildFrameGeometry(*model, snapshot, ViewportTransform(), 0);
    }

    std::shared_ptr<const GraphModel> model;
    FrameGeometry frame;
    SelectionState selection;
};

TEST_F(InfoPanelTest, HiddenWithoutSelectionOrHover) {
    InfoPanelModel panel = BuildInfoPanel(selection, *model);
    EXPECT_FALSE(panel.visible);
    EXPECT_TRUE(panel.sections.empty());
}

TEST_F(InfoPanelTest, SelectedNodeShowsPayloadAttributesOnly) {
    selection.SelectNode("a");
    InfoPanelModel panel = BuildInfoPanel(selection, *model);

    ASSERT_TRUE(panel.visible);
    ASSERT_EQ(panel.sections.size(), 1u);
    EXPECT_EQ(panel.sections[0].title, "Selected Node: a");

    const auto& rows = panel.sections[0].rows;
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].key, "label");
    EXPECT_EQ(rows[0].value, "\"Alpha\"");
    EXPECT_EQ(rows[1].key, "tags");
    EXPECT_EQ(rows[1].value, "[\"t1\",\"t2\"]");
}

TEST_F(InfoPanelTest, HoveredSelectedNodeIsNotRepeated) {
    selection.SelectNode("a");
    selection.HoverNode(std::string("a"));
    EXPECT_EQ(BuildInfoPanel(selection, *model).sections.size(), 1u);

    selection.HoverNode(std::string("b"));
    InfoPanelModel panel = BuildInfoPanel(selection, *model);
    ASSERT_EQ(panel.sections.size(), 2u);
    EXPECT_EQ(panel.sections[1].title, "Hovered Node: b");
    EXPECT_TRUE(panel.sections[1].rows.empty());
}

TEST_F(InfoPanelTest, EdgeTitleNamesEndpoints) {
    selection.SelectEdge(0);
    InfoPanelModel panel = BuildInfoPanel(selection, *model);

    ASSERT_EQ(panel.sections.size(), 1u);
    EXPECT_EQ(panel.sections[0].title, "Selected Edge: a → b");
    ASSERT_EQ(panel.sections[0].rows.size(), 1u);
    EXPECT_EQ(panel.sections[0].rows[0].key, "weight");
    EXPECT_EQ(panel.sections[0].rows[0].value, "2");
}

TEST_F(InfoPanelTest, LayoutKeysAreHiddenForBothKinds) {
    EXPECT_TRUE(IsLayoutAttribute("fx", OverlayKind::kNode));
    EXPECT_TRUE(IsLayoutAttribute("id", OverlayKind::kNode));
    EXPECT_TRUE(IsLayoutAttribute("source", OverlayKind::kEdge));
    EXPECT_TRUE(IsLayoutAttribute("x", OverlayKind::kEdge));
    EXPECT_TRUE(IsLayoutAttribute("vy", OverlayKind::kEdge));
    EXPECT_FALSE(IsLayoutAttribute("id", OverlayKind::kEdge));
    EXPECT_FALSE(IsLayoutAttribute("label", OverlayKind::kNode));
}

TEST_F(InfoPanelTest, HoverLabelSitsAboveNode) {
    selection.HoverNode(std::string("a"));
    auto label = BuildHoverLabel(selection, *model, frame);

    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->text, "a");
    EXPECT_FLOAT_EQ(label->anchor.x, 10.0f);
    EXPECT_FLOAT_EQ(label->anchor.y, 50.0f - kHoverLabelOffset);
}

TEST_F(InfoPanelTest, HoverLabelSitsAboveEdgeMidpoint) {
    selection.HoverEdge(0);
    auto label = BuildHoverLabel(selection, *model, frame);

    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->text, "a → b");
    EXPECT_FLOAT_EQ(label->anchor.x, 60.0f);
    EXPECT_FLOAT_EQ(label->anchor.y, 30.0f);
}

TEST_F(InfoPanelTest, NoHoverNoLabel) {
    selection.SelectNode("a");
    EXPECT_FALSE(BuildHoverLabel(selection, *model, frame).has_value());
}
