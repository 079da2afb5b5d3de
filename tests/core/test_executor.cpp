#include "core/executor.hpp"

#include <gtest/gtest.h>

#include <fstream>

#include "core/inventory.hpp"
#include "core/planner.hpp"
#include "test_helpers.hpp"

namespace protonlink::test {

class ReconcilerTest : public ScratchDirTest {
protected:
    ReconcileResult run(ReleaseFamily family = ReleaseFamily::GEProton) {
        auto plan = generate_plan(scan_candidates(fsys, root, family));
        return reconcile(fsys, root, family, plan);
    }

    void makeThree() {
        makeRelease("GE-Proton9-5");
        makeRelease("GE-Proton10-20");
        makeRelease("GE-Proton10-1");
    }
};

TEST_F(ReconcilerTest, BindsSlotsByRank) {
    makeThree();
    makeRelease("GE-Proton8-30");

    auto result = run();

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(resolved("GE-Proton"), root / "GE-Proton10-20");
    EXPECT_EQ(resolved("GE-Proton-Fallback"), root / "GE-Proton10-1");
    EXPECT_EQ(resolved("GE-Proton-Fallback2"), root / "GE-Proton9-5");
    EXPECT_EQ(result.outcome(LinkSlot::Primary).status, SlotStatus::Ok);
    EXPECT_TRUE(fs::exists(root / "GE-Proton8-30"));
}

TEST_F(ReconcilerTest, LinksAreRelativeToRoot) {
    makeThree();

    run();

    EXPECT_EQ(fs::read_symlink(root / "GE-Proton"), fs::path("GE-Proton10-20"));
}

TEST_F(ReconcilerTest, SecondRunMakesNoChanges) {
    makeThree();

    auto first = run();
    EXPECT_EQ(first.change_count(), 3u);

    int before = fsys.mutations;
    auto second = run();

    EXPECT_EQ(fsys.mutations, before);
    EXPECT_EQ(second.change_count(), 0u);
    EXPECT_TRUE(second.ok());
    EXPECT_EQ(resolved("GE-Proton"), root / "GE-Proton10-20");
    EXPECT_EQ(resolved("GE-Proton-Fallback2"), root / "GE-Proton9-5");
}

TEST_F(ReconcilerTest, AbsoluteLinkToCorrectTargetIsKept) {
    makeThree();
    makeLink("GE-Proton", root / "GE-Proton10-20");

    auto result = run();

    EXPECT_FALSE(result.outcome(LinkSlot::Primary).changed);
    EXPECT_EQ(fs::read_symlink(root / "GE-Proton"), root / "GE-Proton10-20");
}

TEST_F(ReconcilerTest, NewerReleaseShiftsSlots) {
    makeThree();
    run();

    makeRelease("GE-Proton10-25");
    auto result = run();

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(resolved("GE-Proton"), root / "GE-Proton10-25");
    EXPECT_EQ(resolved("GE-Proton-Fallback"), root / "GE-Proton10-20");
    EXPECT_EQ(resolved("GE-Proton-Fallback2"), root / "GE-Proton10-1");
    EXPECT_TRUE(fs::exists(root / "GE-Proton9-5"));
}

TEST_F(ReconcilerTest, BrokenLinkIsReplaced) {
    makeThree();
    makeLink("GE-Proton", root / "GE-Proton7-1");

    auto binding = read_binding(fsys, root / "GE-Proton");
    EXPECT_EQ(binding.kind, BindingKind::Broken);

    auto result = run();

    EXPECT_TRUE(result.outcome(LinkSlot::Primary).changed);
    EXPECT_EQ(resolved("GE-Proton"), root / "GE-Proton10-20");
}

TEST_F(ReconcilerTest, DirectoryCollisionIsReplaced) {
    makeThree();
    fs::create_directories(root / "GE-Proton" / "leftover");

    auto result = run();

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(isLink("GE-Proton"));
    EXPECT_EQ(resolved("GE-Proton"), root / "GE-Proton10-20");
    EXPECT_TRUE(fs::exists(root / "GE-Proton10-20" / "version"));
}

TEST_F(ReconcilerTest, StrayFileAtLinkNameIsReplaced) {
    makeThree();
    std::ofstream(root / "GE-Proton-Fallback") << "junk\n";

    auto result = run();

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(resolved("GE-Proton-Fallback"), root / "GE-Proton10-1");
}

TEST_F(ReconcilerTest, UnassignedSlotsAreEmptied) {
    auto newest = makeRelease("GE-Proton10-20");
    makeLink("GE-Proton-Fallback", newest);
    makeLink("GE-Proton-Fallback2", root / "GE-Proton7-1");

    auto result = run();

    EXPECT_EQ(resolved("GE-Proton"), newest);
    EXPECT_FALSE(fs::exists(fs::symlink_status(root / "GE-Proton-Fallback")));
    EXPECT_FALSE(fs::exists(fs::symlink_status(root / "GE-Proton-Fallback2")));
    EXPECT_EQ(result.outcome(LinkSlot::Fallback).status, SlotStatus::Removed);
    EXPECT_TRUE(result.outcome(LinkSlot::Fallback).changed);
    EXPECT_EQ(result.outcome(LinkSlot::Fallback2).status, SlotStatus::Removed);
    EXPECT_TRUE(fs::exists(newest / "version"));
}

TEST_F(ReconcilerTest, EmptyPlanClearsSlots) {
    auto elsewhere = root / "elsewhere";
    fs::create_directories(elsewhere);
    makeLink("GE-Proton", root / "GE-Proton9-1");

    auto result = reconcile(fsys, root, ReleaseFamily::GEProton, LinkPlan{});

    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(fs::exists(fs::symlink_status(root / "GE-Proton")));
    for (const auto& out : result.outcomes) {
        EXPECT_EQ(out.status, SlotStatus::Removed);
    }
}

TEST_F(ReconcilerTest, RankedDirectoryAtSlotNameIsNeverDeleted) {
    // "GE-Proton-Fallback2" sorts above every well-formed GE-Proton key
    makeRelease("GE-Proton10-20");
    auto squatter = makeRelease("GE-Proton-Fallback2");

    auto result = run();

    EXPECT_TRUE(fs::exists(squatter / "version"));
    EXPECT_EQ(resolved("GE-Proton"), squatter);
    EXPECT_EQ(resolved("GE-Proton-Fallback"), root / "GE-Proton10-20");
    EXPECT_EQ(result.outcome(LinkSlot::Fallback2).status, SlotStatus::Failed);
    EXPECT_FALSE(result.outcome(LinkSlot::Fallback2).reason.empty());
}

TEST_F(ReconcilerTest, SlotThatIsItsOwnTargetIsLeftAlone) {
    // "Proton-EM" sorts above "EM" keys, so it ranks first and binds to itself
    makeRelease("EM-10.0-30");
    auto squatter = makeRelease("Proton-EM");

    auto result = run(ReleaseFamily::ProtonEM);

    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.outcome(LinkSlot::Primary).changed);
    EXPECT_TRUE(fs::exists(squatter / "version"));
    EXPECT_EQ(resolved("Proton-EM-Fallback"), root / "EM-10.0-30");
}

TEST_F(ReconcilerTest, FailedSlotDoesNotStopOthers) {
    makeThree();
    fsys.denied.insert("GE-Proton-Fallback");

    ReconcileResult result;
    EXPECT_NO_THROW(result = run());

    EXPECT_EQ(result.failure_count(), 1u);
    const auto& failed = result.outcome(LinkSlot::Fallback);
    EXPECT_EQ(failed.status, SlotStatus::Failed);
    EXPECT_FALSE(failed.reason.empty());
    EXPECT_FALSE(fs::exists(fs::symlink_status(root / "GE-Proton-Fallback")));

    EXPECT_EQ(resolved("GE-Proton"), root / "GE-Proton10-20");
    EXPECT_EQ(resolved("GE-Proton-Fallback2"), root / "GE-Proton9-5");
}

TEST_F(ReconcilerTest, TargetEqualToRootIsRefused) {
    auto release = makeRelease("GE-Proton10-20");
    LinkPlan plan;
    plan.targets[LinkSlot::Primary] = root;
    plan.targets[LinkSlot::Fallback] = release;

    auto result = reconcile(fsys, root, ReleaseFamily::GEProton, plan);

    EXPECT_EQ(result.outcome(LinkSlot::Primary).status, SlotStatus::Failed);
    EXPECT_FALSE(result.outcome(LinkSlot::Primary).changed);
    EXPECT_FALSE(fs::exists(fs::symlink_status(root / "GE-Proton")));
    EXPECT_EQ(resolved("GE-Proton-Fallback"), release);
}

TEST_F(ReconcilerTest, LinkTextFallsBackToAbsolutePath) {
    EXPECT_EQ(link_text(root / "GE-Proton", root / "GE-Proton10-20"),
              fs::path("GE-Proton10-20"));
    EXPECT_EQ(link_text(root / "GE-Proton", root / "sub" / "GE-Proton10-20"),
              fs::path("sub/GE-Proton10-20"));
    EXPECT_EQ(link_text(root / "links" / "GE-Proton", root / "GE-Proton10-20"),
              root / "GE-Proton10-20");
}

TEST_F(ReconcilerTest, BindingStrings) {
    EXPECT_EQ(binding_to_string({BindingKind::Absent, {}}), "absent");
    EXPECT_EQ(binding_to_string({BindingKind::Bound, fs::path("/x")}), "-> /x");
    EXPECT_EQ(status_to_string(SlotStatus::Failed), "failed");
}

}  // namespace protonlink::test
