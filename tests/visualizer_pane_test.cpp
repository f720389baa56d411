#include "gtest/gtest.h"
#include <chatviz/chat/visualizer_pane.h>

#include <memory>
#include <vector>

using namespace chatviz;
using namespace chatviz::chat;

namespace {

const char* kGraphJson = R"({"nodes": [{"id": "a"}, {"id": "b"}], "edges": [{"source": "a", "target": "b"}]})";

ChatMessage Message(const std::string& role, const std::string& timestamp, const std::string& content,
                    std::optional<std::string> view = std::nullopt) {
    ChatMessage message;
    message.role = role;
    message.timestamp = timestamp;
    message.content = content;
    message.view = std::move(view);
    return message;
}

ChatMessage Tool(const std::string& timestamp, const std::string& content, const std::string& view = "graph") {
    return Message("tool", timestamp, content, view);
}

} // anonymous namespace

class VisualizerPaneTest : public ::testing::Test {
protected:
    void SetUp() override {
        visualizer = std::make_unique<graph::GraphVisualizer>(scheduler);
        pane = std::make_unique<VisualizerPane>(*visualizer);
    }

    void TearDown() override {
        pane.reset();
        visualizer.reset();
    }

    core::FrameScheduler scheduler;
    std::unique_ptr<graph::GraphVisualizer> visualizer;
    std::unique_ptr<VisualizerPane> pane;
};

TEST_F(VisualizerPaneTest, AwaitsToolOutput) {
    pane->Update({Message("user", "t1", "show me a graph")});
    EXPECT_EQ(pane->State(), PaneState::kAwaitingToolOutput);
    EXPECT_EQ(pane->PlaceholderText(), "Awaiting tool output...");
    EXPECT_FALSE(visualizer->IsMounted());
}

TEST_F(VisualizerPaneTest, InvalidJsonShowsErrorWithoutMounting) {
    pane->Update({Tool("t1", "{nodes: oops")});
    EXPECT_EQ(pane->State(), PaneState::kInvalidData);
    EXPECT_EQ(pane->PlaceholderText(), "Invalid tool data: Tool output is not valid JSON");
    EXPECT_FALSE(visualizer->IsMounted());
    EXPECT_EQ(scheduler.LiveTaskCount(), 0u);
}

TEST_F(VisualizerPaneTest, MalformedGraphShowsPayloadError) {
    pane->Update({Tool("t1", R"({"edges": []})")});
    EXPECT_EQ(pane->State(), PaneState::kInvalidData);
    EXPECT_FALSE(pane->ErrorMessage().empty());
    EXPECT_FALSE(visualizer->IsMounted());
}

TEST_F(VisualizerPaneTest, ValidGraphMountsVisualizer) {
    std::vector<ChatMessage> messages = {Message("user", "t0", "hi"), Tool("t1", kGraphJson)};
    pane->Update(messages);

    EXPECT_EQ(pane->State(), PaneState::kGraph);
    EXPECT_EQ(pane->PlaceholderText(), "");
    ASSERT_TRUE(visualizer->IsMounted());
    EXPECT_EQ(visualizer->Model()->NodeCount(), 2u);
    EXPECT_EQ(visualizer->IdentityKey(), VisualizerPane::IdentityKey(messages[1]));
    EXPECT_EQ(scheduler.LiveTaskCount(), 1u);
}

TEST_F(VisualizerPaneTest, UnchangedToolMessageDoesNotRemount) {
    std::vector<ChatMessage> messages = {Tool("t1", kGraphJson)};
    pane->Update(messages);
    graph::ForceSimulation* simulation = visualizer->Simulation();

    messages.push_back(Message("assistant", "t2", "Here it is"));
    pane->Update(messages);
    pane->Update(messages);

    EXPECT_EQ(visualizer->Simulation(), simulation);
    EXPECT_EQ(scheduler.LiveTaskCount(), 1u);
}

TEST_F(VisualizerPaneTest, CorrectedOutputRecovers) {
    pane->Update({Tool("t1", "not json")});
    ASSERT_EQ(pane->State(), PaneState::kInvalidData);

    pane->Update({Tool("t1", "not json"), Tool("t2", kGraphJson)});
    EXPECT_EQ(pane->State(), PaneState::kGraph);
    EXPECT_TRUE(visualizer->IsMounted());
    EXPECT_TRUE(pane->ErrorMessage().empty());
}

TEST_F(VisualizerPaneTest, BrokenReplacementUnmountsGraph) {
    pane->Update({Tool("t1", kGraphJson)});
    ASSERT_TRUE(visualizer->IsMounted());

    pane->Update({Tool("t1", kGraphJson), Tool("t2", "[")});
    EXPECT_EQ(pane->State(), PaneState::kInvalidData);
    EXPECT_FALSE(visualizer->IsMounted());
    EXPECT_EQ(scheduler.LiveTaskCount(), 0u);
}

TEST_F(VisualizerPaneTest, UnknownViewShowsPlaceholder) {
    pane->Update({Tool("t1", "{\"rows\": []}", "table")});
    EXPECT_EQ(pane->State(), PaneState::kUnsupportedView);
    EXPECT_EQ(pane->ViewName(), "table");
    EXPECT_EQ(pane->PlaceholderText(), "No visualizer for view \"table\"");
    EXPECT_FALSE(visualizer->IsMounted());
}

TEST_F(VisualizerPaneTest, RemovingToolOutputUnmounts) {
    pane->Update({Tool("t1", kGraphJson)});
    pane->Update({Message("user", "t3", "start over")});
    EXPECT_EQ(pane->State(), PaneState::kAwaitingToolOutput);
    EXPECT_FALSE(visualizer->IsMounted());
}

TEST(VisualizerPaneKeyTest, IdentityKeyCombinesTimestampRoleViewAndLength) {
    ChatMessage message;
    message.role = "tool";
    message.timestamp = "t9";
    message.content = "12345";
    message.view = "graph";
    EXPECT_EQ(VisualizerPane::IdentityKey(message), "t9|tool|graph|5");
}
