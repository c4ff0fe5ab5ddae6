#include "core/lineage/LineageValidator.h"

#include <gtest/gtest.h>

using namespace EvoScope;

namespace {

MutationRecord makeRecord(const std::string& id, int generation, std::optional<std::string> parent)
{
    return MutationRecord{ .id = id, .generationIndex = generation, .parentId = std::move(parent) };
}

size_t countKind(const LineageValidation& validation, LineageErrorKind kind)
{
    size_t count = 0;
    for (const LineageError& error : validation.errors) {
        if (error.kind == kind) {
            count++;
        }
    }
    return count;
}

} // namespace

TEST(LineageValidatorTest, ValidForestHasNoErrors)
{
    const std::vector<MutationRecord> records = {
        makeRecord("a", 0, std::nullopt),
        makeRecord("b", 1, "a"),
        makeRecord("c", 3, "b"),
        makeRecord("d", 0, std::nullopt),
        makeRecord("e", 1, "d"),
    };

    const LineageValidation validation = validateLineage(records);

    EXPECT_TRUE(validation.isValid());
    ASSERT_EQ(validation.malformed.size(), records.size());
    for (const bool malformed : validation.malformed) {
        EXPECT_FALSE(malformed);
    }
}

TEST(LineageValidatorTest, EmptyInputIsValid)
{
    const LineageValidation validation = validateLineage(std::vector<MutationRecord>{});

    EXPECT_TRUE(validation.isValid());
    EXPECT_TRUE(validation.malformed.empty());
}

TEST(LineageValidatorTest, ReportsDanglingParent)
{
    const std::vector<MutationRecord> records = {
        makeRecord("a", 0, std::nullopt),
        makeRecord("b", 1, "ghost"),
    };

    const LineageValidation validation = validateLineage(records);

    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_EQ(validation.errors[0].kind, LineageErrorKind::DanglingParent);
    EXPECT_EQ(validation.errors[0].recordId, "b");
    EXPECT_NE(validation.errors[0].message.find("ghost"), std::string::npos);
    EXPECT_FALSE(validation.malformed[1]);
}

TEST(LineageValidatorTest, ReportsDuplicateIds)
{
    const std::vector<MutationRecord> records = {
        makeRecord("a", 0, std::nullopt),
        makeRecord("a", 1, std::nullopt),
    };

    const LineageValidation validation = validateLineage(records);

    EXPECT_EQ(countKind(validation, LineageErrorKind::DuplicateId), 1u);
}

TEST(LineageValidatorTest, SelfParentIsACycle)
{
    const std::vector<MutationRecord> records = { makeRecord("loop", 1, "loop") };

    const LineageValidation validation = validateLineage(records);

    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_EQ(validation.errors[0].kind, LineageErrorKind::MalformedLineage);
    EXPECT_TRUE(validation.malformed[0]);
}

TEST(LineageValidatorTest, CycleMarksMembersAndDescendantsMalformed)
{
    const std::vector<MutationRecord> records = {
        makeRecord("r", 0, std::nullopt),
        makeRecord("x", 2, "y"),
        makeRecord("y", 1, "x"),
        makeRecord("z", 3, "x"),
    };

    const LineageValidation validation = validateLineage(records);

    // One report for the cycle itself, not one per member.
    EXPECT_EQ(countKind(validation, LineageErrorKind::MalformedLineage), 1u);
    EXPECT_FALSE(validation.malformed[0]);
    EXPECT_TRUE(validation.malformed[1]);
    EXPECT_TRUE(validation.malformed[2]);
    EXPECT_TRUE(validation.malformed[3]);
}

TEST(LineageValidatorTest, GenerationOrderViolationPropagatesToDescendants)
{
    const std::vector<MutationRecord> records = {
        makeRecord("a", 0, std::nullopt),
        makeRecord("b", 1, "a"),
        makeRecord("c", 1, "b"),
        makeRecord("d", 2, "c"),
    };

    const LineageValidation validation = validateLineage(records);

    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_EQ(validation.errors[0].kind, LineageErrorKind::MalformedLineage);
    EXPECT_EQ(validation.errors[0].recordId, "c");
    EXPECT_FALSE(validation.malformed[0]);
    EXPECT_FALSE(validation.malformed[1]);
    EXPECT_TRUE(validation.malformed[2]);
    EXPECT_TRUE(validation.malformed[3]);
}

TEST(LineageValidatorTest, DescendantListedBeforeAncestorIsResolved)
{
    // Input order is not generation order.
    const std::vector<MutationRecord> records = {
        makeRecord("d", 3, "c"),
        makeRecord("c", 2, "b"),
        makeRecord("b", 2, "a"),
        makeRecord("a", 0, std::nullopt),
    };

    const LineageValidation validation = validateLineage(records);

    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_EQ(validation.errors[0].recordId, "c");
    EXPECT_TRUE(validation.malformed[0]);
    EXPECT_TRUE(validation.malformed[1]);
    EXPECT_FALSE(validation.malformed[2]);
    EXPECT_FALSE(validation.malformed[3]);
}

TEST(LineageValidatorTest, NegativeGenerationIsMalformed)
{
    const std::vector<MutationRecord> records = { makeRecord("a", -1, std::nullopt) };

    const LineageValidation validation = validateLineage(records);

    EXPECT_EQ(countKind(validation, LineageErrorKind::MalformedLineage), 1u);
}

TEST(LineageValidatorTest, LongChainDoesNotRecurse)
{
    std::vector<MutationRecord> records;
    records.push_back(makeRecord("n0", 0, std::nullopt));
    for (int i = 1; i < 100000; i++) {
        records.push_back(makeRecord("n" + std::to_string(i), i, "n" + std::to_string(i - 1)));
    }

    const LineageValidation validation = validateLineage(records);

    EXPECT_TRUE(validation.isValid());
}
