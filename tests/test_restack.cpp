#include <gtest/gtest.h>
#include "core/mutators.hpp"
#include "core/restack.hpp"
#include "test_helpers.hpp"

using namespace gitstack::core;
using namespace gitstack::test;

using Result = RestackOrchestrator::RestackResult;
using NodeState = RestackOrchestrator::NodeState;

class RestackTest : public StackTest {
protected:
    // main -> a -> b -> c with one commit per branch; c checked out
    void buildChain() {
        GraphMutators mutators(state, *store, vcs);
        for (const std::string name : {"a", "b", "c"}) {
            mutators.checkout(name);
            vcs.commit(name, name + "-work");
        }
    }

    RestackOrchestrator orchestrator() {
        return RestackOrchestrator(state, *store, vcs, config);
    }

    std::vector<std::string> rebasedBranches() const {
        std::vector<std::string> out;
        for (const auto& call : vcs.rebaseCalls) out.push_back(call.branch);
        return out;
    }

    bool stackedOn(const std::string& branch, const std::string& parent) {
        return vcs.isAncestor(parent, branch);
    }
};

// ─── Planning ─────────────────────────────────────────────────

TEST_F(RestackTest, PlanCoversDescendantsAndOptionallyAncestors) {
    buildChain();
    auto orch = orchestrator();
    EXPECT_EQ(orch.plan("b", false), (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(orch.plan("c", true), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(orch.plan("main", false), (std::vector<std::string>{"a", "b", "c"}));
}

// ─── Basic restacks ───────────────────────────────────────────

TEST_F(RestackTest, AnchorFollowsTrunkAfterRestack) {
    vcs.commits("main", "m", 4);                    // trunk@5
    const std::string trunkAt5 = *vcs.tip("main");

    GraphMutators mutators(state, *store, vcs);
    mutators.checkout("feat");
    vcs.commit("feat", "feat-work");
    EXPECT_EQ(*state.graph.node("feat").anchor, trunkAt5);

    vcs.commits("main", "late", 3);                 // trunk@8
    const std::string trunkAt8 = *vcs.tip("main");
    EXPECT_EQ(vcs.depth("main"), 8u);

    Result result = orchestrator().restack("feat", RestackOptions{});
    EXPECT_FALSE(result.paused());
    EXPECT_EQ(result.rebased, std::vector<std::string>{"feat"});
    ASSERT_EQ(vcs.rebaseCalls.size(), 1u);
    EXPECT_EQ(vcs.rebaseCalls[0].onto, trunkAt8);
    EXPECT_EQ(vcs.rebaseCalls[0].upstream, trunkAt5);

    EXPECT_EQ(*state.graph.node("feat").anchor, trunkAt8);
    EXPECT_EQ(*reload().graph.node("feat").anchor, trunkAt8);
    EXPECT_TRUE(stackedOn("feat", "main"));
    EXPECT_EQ(vcs.patchesSince("main", "feat"), std::vector<std::string>{"feat-work"});
}

TEST_F(RestackTest, SecondRestackPerformsNoRebases) {
    buildChain();
    vcs.commit("main", "m1");

    Result first = orchestrator().restack("a", RestackOptions{});
    EXPECT_EQ(first.rebased, (std::vector<std::string>{"a", "b", "c"}));
    const size_t callsAfterFirst = vcs.rebaseCalls.size();

    Result second = orchestrator().restack("a", RestackOptions{});
    EXPECT_TRUE(second.rebased.empty());
    EXPECT_EQ(second.skipped, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(vcs.rebaseCalls.size(), callsAfterFirst);
}

TEST_F(RestackTest, WholeChainEndsUpStacked) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.commit("main", "m2");

    Result result = orchestrator().restack("main", RestackOptions{});
    EXPECT_FALSE(result.paused());
    EXPECT_TRUE(stackedOn("a", "main"));
    EXPECT_TRUE(stackedOn("b", "a"));
    EXPECT_TRUE(stackedOn("c", "b"));
    EXPECT_EQ(vcs.patchesSince("b", "c"), std::vector<std::string>{"c-work"});
    for (const auto& name : {"a", "b", "c"}) {
        EXPECT_EQ(result.states.at(name), NodeState::Succeeded);
        EXPECT_EQ(*state.graph.node(name).anchor, *vcs.tip(state.graph.node(name).parent));
    }
}

TEST_F(RestackTest, RestoresStartingBranch) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.checkout("b");

    orchestrator().restack("a", RestackOptions{});
    EXPECT_EQ(vcs.currentBranch(), "b");
}

TEST_F(RestackTest, BranchWithoutOwnCommitsIsNotRebased) {
    GraphMutators mutators(state, *store, vcs);
    mutators.checkout("empty");
    vcs.commits("main", "m", 2);

    Result result = orchestrator().restack("empty", RestackOptions{});
    EXPECT_TRUE(vcs.rebaseCalls.empty());
    EXPECT_EQ(result.skipped, std::vector<std::string>{"empty"});
    EXPECT_EQ(*state.graph.node("empty").anchor, *vcs.tip("main"));
}

// ─── Preconditions ────────────────────────────────────────────

TEST_F(RestackTest, DirtyTreeIsRejectedBeforeAnyRebase) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.setDirty(true);

    auto orch = orchestrator();
    EXPECT_EQ(codeOf([&] { orch.restack("a", RestackOptions{}); }), ErrorCode::DirtyWorkingTree);
    EXPECT_TRUE(vcs.rebaseCalls.empty());
}

TEST_F(RestackTest, MissingBranchIsRejectedBeforeAnyRebase) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.checkout("a");
    vcs.deleteBranch("c");

    auto orch = orchestrator();
    EXPECT_EQ(codeOf([&] { orch.restack("a", RestackOptions{}); }), ErrorCode::NotFound);
    EXPECT_TRUE(vcs.rebaseCalls.empty());
}

TEST_F(RestackTest, ForeignRebaseInProgressIsRejected) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.scriptConflicts("a", 1);
    vcs.rebase("a", "main", std::nullopt);

    auto orch = orchestrator();
    EXPECT_EQ(codeOf([&] { orch.restack("a", RestackOptions{}); }), ErrorCode::VcsCommandFailed);
}

// ─── Conflicts and resume ─────────────────────────────────────

TEST_F(RestackTest, ConflictPausesAndPersistsMarker) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.scriptConflicts("b", 1);
    const std::string bBefore = *vcs.tip("b");

    Result result = orchestrator().restack("a", RestackOptions{});
    ASSERT_TRUE(result.paused());
    EXPECT_EQ(result.blockedBranch, "b");
    EXPECT_EQ(result.remaining, 1u);
    EXPECT_EQ(result.states.at("a"), NodeState::Succeeded);
    EXPECT_EQ(result.states.at("b"), NodeState::ConflictPaused);
    EXPECT_EQ(result.states.at("c"), NodeState::Pending);

    StackState persisted = reload();
    ASSERT_TRUE(persisted.pausedRestack.has_value());
    EXPECT_EQ(persisted.pausedRestack->branch, "b");
    EXPECT_EQ(persisted.pausedRestack->remaining, std::vector<std::string>{"c"});
    EXPECT_EQ(persisted.pausedRestack->returnTo, "c");
    EXPECT_EQ(persisted.pausedRestack->originalTip, bBefore);
}

TEST_F(RestackTest, ResumeContinuesWithRemainingNodesOnly) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.scriptConflicts("b", 1);

    orchestrator().restack("a", RestackOptions{});
    EXPECT_EQ(rebasedBranches(), (std::vector<std::string>{"a", "b"}));

    // User resolved the conflict; any restack invocation resumes.
    Result resumed = orchestrator().restack("main", RestackOptions{});
    EXPECT_TRUE(resumed.resumed);
    EXPECT_FALSE(resumed.paused());
    EXPECT_EQ(resumed.rebased, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(rebasedBranches(), (std::vector<std::string>{"a", "b", "c"}));

    EXPECT_FALSE(state.pausedRestack.has_value());
    EXPECT_FALSE(reload().pausedRestack.has_value());
    EXPECT_TRUE(stackedOn("c", "b"));
    EXPECT_TRUE(stackedOn("b", "a"));
    EXPECT_EQ(vcs.currentBranch(), "c");
}

TEST_F(RestackTest, RepeatedConflictStaysPaused) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.scriptConflicts("b", 2);

    orchestrator().restack("a", RestackOptions{});
    Result again = orchestrator().resume();
    EXPECT_TRUE(again.paused());
    EXPECT_EQ(again.blockedBranch, "b");
    EXPECT_EQ(state.pausedRestack->remaining, std::vector<std::string>{"c"});

    Result done = orchestrator().resume();
    EXPECT_FALSE(done.paused());
    EXPECT_TRUE(stackedOn("c", "b"));
}

TEST_F(RestackTest, ResumeAfterAbortRestartsBlockedNode) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.scriptConflicts("b", 1);

    orchestrator().restack("a", RestackOptions{});
    vcs.abortRebase();

    Result resumed = orchestrator().resume();
    EXPECT_FALSE(resumed.paused());
    EXPECT_EQ(rebasedBranches(), (std::vector<std::string>{"a", "b", "b", "c"}));
    EXPECT_TRUE(stackedOn("c", "b"));
}

TEST_F(RestackTest, ResumeAfterManualContinueKeepsChildAnchors) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.scriptConflicts("b", 1);

    orchestrator().restack("a", RestackOptions{});
    // The user resolves and runs `git rebase --continue` themselves.
    ASSERT_EQ(vcs.continueRebase(), gitstack::vcs::RebaseOutcome::Success);
    const std::string resolved = *vcs.tip("b");

    Result resumed = orchestrator().restack("a", RestackOptions{});
    EXPECT_FALSE(resumed.paused());
    EXPECT_TRUE(resumed.warnings.empty());
    EXPECT_EQ(resumed.rebased, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(*vcs.tip("b"), resolved);
    EXPECT_EQ(*state.graph.node("b").anchor, *vcs.tip("a"));

    EXPECT_EQ(rebasedBranches(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(vcs.rebaseCalls.back().upstream.has_value());
    EXPECT_EQ(vcs.patchesSince("b", "c"), std::vector<std::string>{"c-work"});
}

TEST_F(RestackTest, ResumeRefusesRebaseOfAnotherBranch) {
    buildChain();
    vcs.commit("main", "m1");
    vcs.scriptConflicts("b", 1);
    const auto bAnchor = state.graph.node("b").anchor;

    orchestrator().restack("a", RestackOptions{});
    vcs.abortRebase();

    // An unrelated rebase stops on a conflict of its own.
    vcs.branchAt("x", "main");
    vcs.commit("x", "x-work");
    vcs.scriptConflicts("x", 1);
    ASSERT_EQ(vcs.rebase("x", "a", std::nullopt), gitstack::vcs::RebaseOutcome::Conflict);
    const size_t calls = vcs.rebaseCalls.size();

    EXPECT_EQ(codeOf([&] { orchestrator().restack("a", RestackOptions{}); }),
              ErrorCode::VcsCommandFailed);
    EXPECT_EQ(vcs.rebaseCalls.size(), calls);
    EXPECT_EQ(vcs.rebaseInProgress(), std::optional<std::string>("x"));
    EXPECT_EQ(state.graph.node("b").anchor, bAnchor);
    ASSERT_TRUE(reload().pausedRestack.has_value());
    EXPECT_EQ(reload().pausedRestack->branch, "b");
}

// ─── Anchors ──────────────────────────────────────────────────

TEST_F(RestackTest, RewrittenParentTriggersFullRebaseWithWarning) {
    buildChain();
    // Rewrite a's history outside of git-stack so b's anchor is no longer in it.
    vcs.branchAt("a", "main");
    vcs.commit("a", "a-work-v2");

    Result result = orchestrator().restack("b", RestackOptions{});
    ASSERT_EQ(vcs.rebaseCalls.size(), 2u);
    EXPECT_EQ(vcs.rebaseCalls[0].branch, "b");
    EXPECT_FALSE(vcs.rebaseCalls[0].upstream.has_value());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("rewritten"), std::string::npos);
    EXPECT_TRUE(stackedOn("b", "a"));

    // c follows b, which this run rebased itself: minimal rebase from c's anchor.
    EXPECT_EQ(vcs.rebaseCalls[1].branch, "c");
    EXPECT_TRUE(vcs.rebaseCalls[1].upstream.has_value());
    EXPECT_EQ(vcs.patchesSince("b", "c"), std::vector<std::string>{"c-work"});
}

TEST_F(RestackTest, ChildrenOfRebasedParentsUseTheirAnchors) {
    buildChain();
    vcs.commit("main", "m1");

    Result result = orchestrator().restack("a", RestackOptions{});
    EXPECT_TRUE(result.warnings.empty());
    ASSERT_EQ(vcs.rebaseCalls.size(), 3u);
    for (const auto& call : vcs.rebaseCalls) {
        EXPECT_TRUE(call.upstream.has_value()) << call.branch;
    }
}

TEST_F(RestackTest, ResumedRunRemembersRewrittenParents) {
    // main -> a -> {b, d}; b conflicts, d comes after it
    GraphMutators mutators(state, *store, vcs);
    mutators.checkout("a");
    vcs.commit("a", "a-work");
    mutators.checkout("b");
    vcs.commit("b", "b-work");
    vcs.checkout("a");
    mutators.checkout("d");
    vcs.commit("d", "d-work");
    vcs.commit("main", "m1");
    vcs.scriptConflicts("b", 1);

    Result paused = orchestrator().restack("a", RestackOptions{});
    ASSERT_TRUE(paused.paused());
    EXPECT_EQ(reload().pausedRestack->rewritten, std::vector<std::string>{"a"});

    Result resumed = orchestrator().restack("a", RestackOptions{});
    EXPECT_TRUE(resumed.warnings.empty());
    EXPECT_EQ(vcs.rebaseCalls.back().branch, "d");
    EXPECT_TRUE(vcs.rebaseCalls.back().upstream.has_value());
    EXPECT_EQ(vcs.patchesSince("a", "d"), std::vector<std::string>{"d-work"});
}

TEST_F(RestackTest, MissingAnchorFallsBackToFullRebase) {
    buildChain();
    vcs.commit("main", "m1");
    state.graph.setAnchor("a", std::nullopt);

    orchestrator().restack("a", RestackOptions{});
    EXPECT_FALSE(vcs.rebaseCalls[0].upstream.has_value());
    EXPECT_TRUE(vcs.rebaseCalls[1].upstream.has_value());
}

// ─── Push, fetch, backups ─────────────────────────────────────

TEST_F(RestackTest, PushesOnlyBranchesThatChanged) {
    buildChain();
    for (const auto& name : {"a", "b", "c"}) vcs.publish(name);
    vcs.commit("main", "m1");

    RestackOptions options;
    options.push = true;
    Result first = orchestrator().restack("a", options);
    EXPECT_EQ(first.pushed, (std::vector<std::string>{"a", "b", "c"}));

    Result second = orchestrator().restack("a", options);
    EXPECT_TRUE(second.pushed.empty());
    EXPECT_EQ(vcs.pushes.size(), 3u);
}

TEST_F(RestackTest, FetchFastForwardsTrunkFirst) {
    buildChain();
    vcs.branchAt("upstream", "main");
    vcs.commit("upstream", "remote-1");
    vcs.pendingRemoteUpdates["origin/main"] = "upstream";

    RestackOptions options;
    options.fetch = true;
    Result result = orchestrator().restack("a", options);

    EXPECT_EQ(vcs.fetchCount, 1);
    EXPECT_EQ(*vcs.tip("main"), *vcs.tip("upstream"));
    EXPECT_EQ(result.rebased, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(stackedOn("a", "upstream"));
}

TEST_F(RestackTest, DivergedTrunkIsNotFastForwarded) {
    buildChain();
    vcs.branchAt("upstream", "main");
    vcs.commit("upstream", "remote-1");
    vcs.commit("main", "local-1");
    const std::string localTip = *vcs.tip("main");
    vcs.pendingRemoteUpdates["origin/main"] = "upstream";

    RestackOptions options;
    options.fetch = true;
    Result result = orchestrator().restack("a", options);

    EXPECT_EQ(*vcs.tip("main"), localTip);
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_NE(result.warnings[0].find("diverged"), std::string::npos);
}

TEST_F(RestackTest, BackupBranchesAreCreatedWhenConfigured) {
    buildChain();
    vcs.commit("main", "m1");
    const std::string before = *vcs.tip("a");
    config.createBackups = true;

    const std::int64_t started = currentTimestamp();
    orchestrator().restack("a", RestackOptions{});
    const std::int64_t finished = currentTimestamp();

    std::optional<std::string> backup;
    for (auto stamp = started; stamp <= finished && !backup; ++stamp) {
        backup = vcs.tip("a-at-" + std::to_string(stamp));
    }
    ASSERT_TRUE(backup.has_value());
    EXPECT_EQ(*backup, before);
    EXPECT_NE(*vcs.tip("a"), before);
}
