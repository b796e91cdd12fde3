/**
 * @file test_ivcu.cpp
 * @brief IVCU lifecycle, verification outcome and lineage tests
 */

#include "axiom/ivcu.hpp"

#include <vector>

#include <gtest/gtest.h>

using namespace axiom::ivcu;

namespace {

IvcuRecord make_verifying(IvcuRegistry& registry)
{
    auto draft = registry.create("project-1");
    EXPECT_TRUE(draft);
    EXPECT_TRUE(registry.transition(draft->id, Status::kGenerating));
    auto verifying = registry.transition(draft->id, Status::kVerifying);
    EXPECT_TRUE(verifying);
    return *verifying;
}

std::vector<VerifierResult> passing(double confidence)
{
    return {VerifierResult{.name = "mypy", .tier = 1, .passed = true, .confidence = confidence},
            VerifierResult{.name = "z3", .tier = 2, .passed = true, .confidence = confidence}};
}

}  // namespace

TEST(IvcuLifecycle, TransitionGraph)
{
    EXPECT_TRUE(can_transition(Status::kDraft, Status::kGenerating));
    EXPECT_TRUE(can_transition(Status::kGenerating, Status::kVerifying));
    EXPECT_TRUE(can_transition(Status::kVerifying, Status::kVerified));
    EXPECT_TRUE(can_transition(Status::kVerifying, Status::kFailed));
    EXPECT_TRUE(can_transition(Status::kVerified, Status::kDeployed));
    EXPECT_TRUE(can_transition(Status::kVerified, Status::kDeprecated));
    EXPECT_TRUE(can_transition(Status::kDraft, Status::kDeprecated));

    EXPECT_FALSE(can_transition(Status::kDraft, Status::kVerifying));
    EXPECT_FALSE(can_transition(Status::kFailed, Status::kVerifying));
    EXPECT_FALSE(can_transition(Status::kFailed, Status::kDeprecated));
    EXPECT_FALSE(can_transition(Status::kDeployed, Status::kDeprecated));
    EXPECT_FALSE(can_transition(Status::kDeprecated, Status::kDraft));
}

TEST(IvcuLifecycle, TerminalStates)
{
    EXPECT_TRUE(is_terminal(Status::kDeployed));
    EXPECT_TRUE(is_terminal(Status::kFailed));
    EXPECT_TRUE(is_terminal(Status::kDeprecated));
    EXPECT_FALSE(is_terminal(Status::kVerified));
}

TEST(IvcuLifecycle, RejectedTransitionLeavesRecord)
{
    IvcuRecord record{.id = "u1", .project_id = "p1"};
    auto result = transition(record, Status::kVerifying);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, axiom::errc::kValidation);
    EXPECT_EQ(record.status, Status::kDraft);
}

TEST(IvcuLifecycle, VerifiedOnlyThroughCompletion)
{
    IvcuRecord record{.id = "u1", .project_id = "p1", .status = Status::kVerifying};
    EXPECT_FALSE(transition(record, Status::kVerified));
    EXPECT_EQ(record.status, Status::kVerifying);
}

TEST(IvcuLifecycle, StatusNamesRoundTrip)
{
    for (Status s : {Status::kDraft, Status::kGenerating, Status::kVerifying, Status::kVerified,
                     Status::kFailed, Status::kDeployed, Status::kDeprecated}) {
        EXPECT_EQ(status_from_string(status_name(s)), s);
    }
    EXPECT_FALSE(status_from_string("archived"));
}

TEST(IvcuVerification, AllPassAboveThresholdIsVerified)
{
    IvcuRegistry registry;
    auto unit = make_verifying(registry);
    auto settled = registry.complete_verification(unit.id, passing(0.9), VerificationPolicy{});
    ASSERT_TRUE(settled) << settled.error().message;
    EXPECT_EQ(settled->status, Status::kVerified);
    EXPECT_DOUBLE_EQ(settled->confidence_score, 0.9);
}

TEST(IvcuVerification, ThresholdIsInclusive)
{
    IvcuRegistry registry;
    auto unit = make_verifying(registry);
    auto settled = registry.complete_verification(unit.id, passing(0.8), VerificationPolicy{});
    ASSERT_TRUE(settled);
    EXPECT_EQ(settled->status, Status::kVerified);
}

TEST(IvcuVerification, AnyFailureFails)
{
    IvcuRegistry registry;
    auto unit = make_verifying(registry);
    auto results = passing(1.0);
    results[1].passed = false;
    auto settled = registry.complete_verification(unit.id, results, VerificationPolicy{});
    ASSERT_TRUE(settled);
    EXPECT_EQ(settled->status, Status::kFailed);
}

TEST(IvcuVerification, LowConfidenceFails)
{
    IvcuRegistry registry;
    auto unit = make_verifying(registry);
    auto settled = registry.complete_verification(unit.id, passing(0.5), VerificationPolicy{});
    ASSERT_TRUE(settled);
    EXPECT_EQ(settled->status, Status::kFailed);
    EXPECT_DOUBLE_EQ(settled->confidence_score, 0.5);
}

TEST(IvcuVerification, NoVerifiersFails)
{
    IvcuRegistry registry;
    auto unit = make_verifying(registry);
    auto settled = registry.complete_verification(unit.id, {}, VerificationPolicy{.confidence_threshold = 0.0});
    ASSERT_TRUE(settled);
    EXPECT_EQ(settled->status, Status::kFailed);
    EXPECT_DOUBLE_EQ(settled->confidence_score, 0.0);
}

TEST(IvcuVerification, OutOfRangeConfidenceRejected)
{
    IvcuRegistry registry;
    auto unit = make_verifying(registry);
    auto settled = registry.complete_verification(unit.id, passing(1.5), VerificationPolicy{});
    ASSERT_FALSE(settled);
    EXPECT_EQ(settled.error().code, axiom::errc::kValidation);
    EXPECT_EQ(registry.get(unit.id)->status, Status::kVerifying);
}

TEST(IvcuVerification, OnlyFromVerifying)
{
    IvcuRegistry registry;
    auto draft = registry.create("project-1");
    ASSERT_TRUE(draft);
    EXPECT_FALSE(registry.complete_verification(draft->id, passing(1.0), VerificationPolicy{}));
}

TEST(IvcuRegistry, CreateRequiresProject)
{
    IvcuRegistry registry;
    EXPECT_FALSE(registry.create(""));
    auto draft = registry.create("project-1");
    ASSERT_TRUE(draft);
    EXPECT_EQ(draft->version, 1);
    EXPECT_EQ(draft->status, Status::kDraft);
    EXPECT_TRUE(draft->parent_ids.empty());
}

TEST(IvcuRegistry, UnknownIdIsNotFound)
{
    IvcuRegistry registry;
    auto missing = registry.get("nope");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, axiom::errc::kNotFound);
}

TEST(IvcuRegistry, RetryCreatesSuccessorOnce)
{
    IvcuRegistry registry;
    auto unit = make_verifying(registry);
    ASSERT_TRUE(registry.complete_verification(unit.id, passing(0.1), VerificationPolicy{}));

    auto retried = registry.retry(unit.id);
    ASSERT_TRUE(retried) << retried.error().message;
    EXPECT_EQ(retried->version, 2);
    EXPECT_EQ(retried->status, Status::kDraft);
    EXPECT_EQ(retried->project_id, "project-1");
    ASSERT_EQ(retried->parent_ids.size(), 1u);
    EXPECT_EQ(retried->parent_ids[0], unit.id);

    EXPECT_EQ(registry.get(unit.id)->status, Status::kFailed);

    auto again = registry.retry(unit.id);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, axiom::errc::kConflict);
}

TEST(IvcuRegistry, RetryRequiresFailed)
{
    IvcuRegistry registry;
    auto unit = make_verifying(registry);
    EXPECT_FALSE(registry.retry(unit.id));
}

TEST(IvcuRegistry, SupersedeDeprecatesAndLinks)
{
    IvcuRegistry registry;
    auto v1 = registry.create("project-1");
    ASSERT_TRUE(v1);

    auto v2 = registry.supersede(v1->id);
    ASSERT_TRUE(v2);
    EXPECT_EQ(registry.get(v1->id)->status, Status::kDeprecated);
    EXPECT_EQ(v2->version, 2);

    EXPECT_FALSE(registry.supersede(v1->id));
}

TEST(IvcuRegistry, LineageNearestFirst)
{
    IvcuRegistry registry;
    auto v1 = registry.create("project-1");
    ASSERT_TRUE(v1);
    auto v2 = registry.supersede(v1->id);
    ASSERT_TRUE(v2);
    auto v3 = registry.supersede(v2->id);
    ASSERT_TRUE(v3);

    auto lineage = registry.lineage(v3->id);
    ASSERT_TRUE(lineage);
    EXPECT_EQ(*lineage, (std::vector<std::string>{v2->id, v1->id}));

    auto root = registry.lineage(v1->id);
    ASSERT_TRUE(root);
    EXPECT_TRUE(root->empty());
    EXPECT_EQ(registry.size(), 3u);
}

TEST(IvcuRegistry, AdoptRejectsDuplicates)
{
    IvcuRegistry registry;
    IvcuRecord stored{.id = "u-stored", .project_id = "p1", .version = 3, .status = Status::kVerifying};
    ASSERT_TRUE(registry.adopt(stored));
    auto again = registry.adopt(stored);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, axiom::errc::kConflict);
    EXPECT_EQ(registry.get("u-stored")->version, 3);
}

TEST(IvcuConfidence, MeanOfVerifiers)
{
    std::vector<VerifierResult> results{
        VerifierResult{.name = "a", .passed = true, .confidence = 0.6},
        VerifierResult{.name = "b", .passed = true, .confidence = 1.0},
    };
    auto mean = aggregate_confidence(results);
    ASSERT_TRUE(mean);
    EXPECT_DOUBLE_EQ(*mean, 0.8);
}

TEST(IvcuRegistry, RejectedAdoptLeavesSuccessorIndexAlone)
{
    IvcuRegistry registry;
    IvcuRecord parent{.id = "u-parent", .project_id = "p1", .status = Status::kVerifying};
    IvcuRecord existing{.id = "u-child", .project_id = "p1", .version = 2};
    ASSERT_TRUE(registry.adopt(parent));
    ASSERT_TRUE(registry.adopt(existing));

    IvcuRecord clash{.id = "u-child", .project_id = "p1", .version = 2, .parent_ids = {"u-parent"}};
    auto again = registry.adopt(clash);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, axiom::errc::kConflict);

    ASSERT_TRUE(registry.complete_verification("u-parent", passing(0.1), VerificationPolicy{}));
    auto successor = registry.retry("u-parent");
    ASSERT_TRUE(successor);
    EXPECT_EQ(successor->parent_ids, (std::vector<std::string>{"u-parent"}));
}

TEST(IvcuRegistry, ReplaceComparesStatus)
{
    IvcuRegistry registry;
    auto unit = make_verifying(registry);

    IvcuRecord next = unit;
    ASSERT_TRUE(complete_verification(next, passing(0.9), VerificationPolicy{}));
    EXPECT_EQ(registry.get(unit.id)->status, Status::kVerifying);

    ASSERT_TRUE(registry.replace(next, Status::kVerifying));
    EXPECT_EQ(registry.get(unit.id)->status, Status::kVerified);

    auto stale = registry.replace(unit, Status::kVerifying);
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error().code, axiom::errc::kConflict);

    ASSERT_TRUE(registry.replace(unit, Status::kVerified));
    EXPECT_EQ(registry.get(unit.id)->status, Status::kVerifying);

    IvcuRecord ghost{.id = "ghost", .project_id = "p1"};
    auto missing = registry.replace(ghost, Status::kDraft);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, axiom::errc::kNotFound);
}
