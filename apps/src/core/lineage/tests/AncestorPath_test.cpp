#include "core/lineage/AncestorPath.h"

#include <gtest/gtest.h>

using namespace EvoScope;

namespace {

MutationRecord makeRecord(const std::string& id, int generation, std::optional<std::string> parent)
{
    return MutationRecord{ .id = id, .generationIndex = generation, .parentId = std::move(parent) };
}

} // namespace

class AncestorPathTest : public ::testing::Test {
protected:
    std::vector<MutationRecord> records = {
        makeRecord("a", 0, std::nullopt),
        makeRecord("b", 1, "a"),
        makeRecord("c", 1, "a"),
        makeRecord("d", 2, "c"),
        makeRecord("e", 3, "d"),
    };
};

TEST_F(AncestorPathTest, ChildOfRootResolvesToTwoIds)
{
    const auto result = resolveAncestorPath(records, "c");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), (AncestorPath{ "c", "a" }));
}

TEST_F(AncestorPathTest, PathRunsFromTargetToRoot)
{
    const auto result = resolveAncestorPath(records, "e");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), (AncestorPath{ "e", "d", "c", "a" }));
}

TEST_F(AncestorPathTest, RootPathIsJustTheRoot)
{
    const auto result = resolveAncestorPath(records, "a");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), AncestorPath{ "a" });
}

TEST_F(AncestorPathTest, UnknownTargetIsAnError)
{
    const auto result = resolveAncestorPath(records, "zzz");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, LineageErrorKind::UnknownRecord);
    EXPECT_EQ(result.errorValue().recordId, "zzz");
}

TEST_F(AncestorPathTest, EmptyRecordsReportUnknownTarget)
{
    const auto result = resolveAncestorPath(std::vector<MutationRecord>{}, "a");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, LineageErrorKind::UnknownRecord);
}

TEST_F(AncestorPathTest, MissingParentEndsPathEarly)
{
    records.push_back(makeRecord("stray", 4, "gone"));
    records.push_back(makeRecord("leaf", 5, "stray"));

    const auto result = resolveAncestorPath(records, "leaf");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), (AncestorPath{ "leaf", "stray" }));
}

TEST_F(AncestorPathTest, TwoNodeCycleTerminatesWithMalformedLineage)
{
    const std::vector<MutationRecord> cyclic = {
        makeRecord("x", 1, "y"),
        makeRecord("y", 1, "x"),
    };

    const auto result = resolveAncestorPath(cyclic, "x");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, LineageErrorKind::MalformedLineage);
    EXPECT_EQ(result.errorValue().recordId, "x");
}

TEST_F(AncestorPathTest, CycleAboveTargetIsDetected)
{
    const std::vector<MutationRecord> cyclic = {
        makeRecord("leaf", 5, "x"),
        makeRecord("x", 2, "y"),
        makeRecord("y", 1, "z"),
        makeRecord("z", 0, "x"),
    };

    const auto result = resolveAncestorPath(cyclic, "leaf");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, LineageErrorKind::MalformedLineage);
}

TEST_F(AncestorPathTest, SelfParentTerminates)
{
    const std::vector<MutationRecord> cyclic = { makeRecord("self", 0, "self") };

    const auto result = resolveAncestorPath(cyclic, "self");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, LineageErrorKind::MalformedLineage);
}

TEST_F(AncestorPathTest, IndexOverloadMatchesRecordOverload)
{
    const LineageIndex index(records);

    const auto fromIndex = resolveAncestorPath(index, "d");
    const auto fromRecords = resolveAncestorPath(records, "d");

    ASSERT_TRUE(fromIndex.isValue());
    ASSERT_TRUE(fromRecords.isValue());
    EXPECT_EQ(fromIndex.value(), fromRecords.value());
}
