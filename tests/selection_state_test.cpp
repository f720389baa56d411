#include "gtest/gtest.h"
#include <chatviz/graph/interaction/selection_state.h>

using namespace chatviz::graph;

TEST(SelectionStateTest, SelectingNodeTogglesAndClearsEdge) {
    SelectionState selection;
    selection.SelectEdge(3);
    selection.SelectNode("a");
    EXPECT_EQ(selection.SelectedNode(), std::optional<std::string>("a"));
    EXPECT_FALSE(selection.SelectedEdge().has_value());

    selection.SelectNode("b");
    EXPECT_EQ(selection.SelectedNode(), std::optional<std::string>("b"));

    selection.SelectNode("b");
    EXPECT_FALSE(selection.SelectedNode().has_value());
}

TEST(SelectionStateTest, SelectingEdgeTogglesAndClearsNode) {
    SelectionState selection;
    selection.SelectNode("a");
    selection.SelectEdge(2);
    EXPECT_FALSE(selection.SelectedNode().has_value());
    EXPECT_EQ(selection.SelectedEdge(), std::optional<chatviz::EdgeId>(2));

    selection.SelectEdge(2);
    EXPECT_FALSE(selection.SelectedEdge().has_value());
}

TEST(SelectionStateTest, HoverIsIndependentOfSelection) {
    SelectionState selection;
    selection.SelectNode("a");
    selection.HoverNode(std::string("b"));
    selection.HoverEdge(1);

    EXPECT_EQ(selection.SelectedNode(), std::optional<std::string>("a"));
    EXPECT_EQ(selection.HoveredNode(), std::optional<std::string>("b"));
    EXPECT_EQ(selection.HoveredEdge(), std::optional<chatviz::EdgeId>(1));

    selection.ClearHover();
    EXPECT_FALSE(selection.HoveredNode().has_value());
    EXPECT_FALSE(selection.HoveredEdge().has_value());
    EXPECT_TRUE(selection.SelectedNode().has_value());
}

TEST(SelectionStateTest, SelectedWinsOverHovered) {
    SelectionState selection;
    selection.SelectNode("a");
    selection.HoverNode(std::string("a"));
    selection.HoverEdge(5);

    EXPECT_EQ(selection.NodeEmphasis("a"), Emphasis::kSelected);
    EXPECT_EQ(selection.NodeEmphasis("z"), Emphasis::kNone);
    EXPECT_EQ(selection.EdgeEmphasis(5), Emphasis::kHovered);
    EXPECT_EQ(selection.EdgeEmphasis(6), Emphasis::kNone);
}

TEST(SelectionStateTest, DismissClearsEverything) {
    SelectionState selection;
    EXPECT_FALSE(selection.HasAny());
    selection.SelectEdge(1);
    selection.HoverNode(std::string("a"));
    EXPECT_TRUE(selection.HasAny());

    selection.Dismiss();
    EXPECT_FALSE(selection.HasAny());
}
