#include "core/lineage/LineageError.h"
#include "core/lineage/MutationRecord.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace EvoScope;

TEST(MutationRecordTest, OriginKindUsesLowerCaseNames)
{
    EXPECT_EQ(toString(OriginKind::Crossover), "crossover");
    EXPECT_EQ(originKindFromString("selection"), OriginKind::Selection);
    EXPECT_FALSE(originKindFromString("Selection").has_value());
}

TEST(MutationRecordTest, RootOmitsParentIdInJson)
{
    const MutationRecord root{ .id = "seed", .generationIndex = 0, .fitnessValue = 0.25 };

    const nlohmann::json j = root;

    EXPECT_EQ(j["id"], "seed");
    EXPECT_EQ(j["originKind"], "initial");
    EXPECT_FALSE(j.contains("parentId"));
}

TEST(MutationRecordTest, ParsesRecordWithParent)
{
    const auto j = nlohmann::json::parse(R"({
        "id": "m7",
        "generationIndex": 3,
        "parentId": "m2",
        "originKind": "mutation",
        "fitnessValue": 0.82,
        "fitnessDelta": -0.04
    })");

    const auto record = j.get<MutationRecord>();

    EXPECT_EQ(record.id, "m7");
    EXPECT_EQ(record.generationIndex, 3);
    ASSERT_TRUE(record.parentId.has_value());
    EXPECT_EQ(record.parentId.value(), "m2");
    EXPECT_EQ(record.originKind, OriginKind::Mutation);
    EXPECT_DOUBLE_EQ(record.fitnessValue, 0.82);
    EXPECT_DOUBLE_EQ(record.fitnessDelta, -0.04);
}

TEST(MutationRecordTest, NullParentIdReadsAsRoot)
{
    const auto j = nlohmann::json::parse(R"({"id": "r", "parentId": null})");

    const auto record = j.get<MutationRecord>();

    EXPECT_FALSE(record.parentId.has_value());
    EXPECT_EQ(record.generationIndex, 0);
}

TEST(MutationRecordTest, UnknownOriginKindThrows)
{
    const auto j = nlohmann::json::parse(R"({"id": "r", "originKind": "cloning"})");

    EXPECT_THROW(j.get<MutationRecord>(), std::runtime_error);
}

TEST(MutationRecordTest, LineageErrorKindSerializesByName)
{
    const LineageError error{
        .kind = LineageErrorKind::DanglingParent,
        .recordId = "b",
        .message = "parent 'x' not found",
    };

    const nlohmann::json j = error;

    EXPECT_EQ(j["kind"], "DanglingParent");
    EXPECT_EQ(j["recordId"], "b");
    EXPECT_EQ(j.get<LineageError>().kind, LineageErrorKind::DanglingParent);
}
