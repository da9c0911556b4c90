#include "dsync/events/events.hpp"
#include "dsync/sync/run.hpp"

#include <gtest/gtest.h>

using dsync::events::EventBus;
using dsync::events::StateChangedEvent;
using dsync::sync::RunState;
using dsync::sync::SyncRun;

TEST(SyncRunTest, WalksTheFullPipeline) {
    EventBus bus;
    std::vector<RunState> seen;
    auto sub = bus.subscribe<StateChangedEvent>([&](const StateChangedEvent& e) { seen.push_back(e.to); });

    SyncRun run(bus);
    for (auto state : {RunState::Preflight, RunState::EnumerateSource, RunState::EnumerateDest, RunState::Diff,
                       RunState::CreateFolders, RunState::CopyFiles, RunState::Validate, RunState::Done}) {
        EXPECT_TRUE(run.transition_to(state).is_ok()) << dsync::sync::to_string(state);
    }

    EXPECT_TRUE(run.finished());
    EXPECT_EQ(seen.size(), 8u);
    EXPECT_EQ(run.history().front(), RunState::Init);
    EXPECT_EQ(run.history().back(), RunState::Done);
}

TEST(SyncRunTest, RejectsSkippingStates) {
    EventBus bus;
    SyncRun run(bus);

    EXPECT_TRUE(run.transition_to(RunState::EnumerateSource).is_error());
    ASSERT_TRUE(run.transition_to(RunState::Preflight).is_ok());
    EXPECT_TRUE(run.transition_to(RunState::CopyFiles).is_error());
    EXPECT_EQ(run.state(), RunState::Preflight);
}

TEST(SyncRunTest, DryRunEndsAfterDiff) {
    EventBus bus;
    SyncRun run(bus);
    for (auto state : {RunState::Preflight, RunState::EnumerateSource, RunState::EnumerateDest, RunState::Diff}) {
        ASSERT_TRUE(run.transition_to(state).is_ok());
    }
    EXPECT_TRUE(run.transition_to(RunState::Done).is_ok());
}

TEST(SyncRunTest, RepairPassLoopsBackFromValidate) {
    EventBus bus;
    SyncRun run(bus);
    for (auto state : {RunState::Preflight, RunState::EnumerateSource, RunState::EnumerateDest, RunState::Diff,
                       RunState::CreateFolders, RunState::CopyFiles, RunState::Validate,
                       RunState::CreateFolders, RunState::CopyFiles, RunState::Validate}) {
        ASSERT_TRUE(run.transition_to(state).is_ok()) << dsync::sync::to_string(state);
    }
    EXPECT_FALSE(run.finished());
}

TEST(SyncRunTest, FailureIsReachableAndTerminal) {
    EventBus bus;
    std::string reason;
    auto sub = bus.subscribe<StateChangedEvent>([&](const StateChangedEvent& e) {
        if (e.to == RunState::Failed) {
            reason = e.detail;
        }
    });

    SyncRun run(bus);
    ASSERT_TRUE(run.transition_to(RunState::Preflight).is_ok());
    ASSERT_TRUE(run.mark_failed("root not accessible").is_ok());

    EXPECT_EQ(run.state(), RunState::Failed);
    EXPECT_EQ(run.last_error(), "root not accessible");
    EXPECT_EQ(reason, "root not accessible");

    EXPECT_TRUE(run.transition_to(RunState::Failed).is_ok());
    EXPECT_TRUE(run.transition_to(RunState::EnumerateSource).is_error());
    EXPECT_TRUE(run.mark_failed("again").is_error());
}
