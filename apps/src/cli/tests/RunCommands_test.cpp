#include "cli/RunCommands.h"

#include <gtest/gtest.h>

using namespace EvoScope;
using namespace EvoScope::Client;

class RunCommandsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        run.mutationHistory = {
            MutationRecord{ .id = "a", .generationIndex = 0, .fitnessValue = 0.5 },
            MutationRecord{
                .id = "b",
                .generationIndex = 1,
                .parentId = "a",
                .originKind = OriginKind::Mutation,
                .fitnessValue = 0.7,
            },
            MutationRecord{
                .id = "c",
                .generationIndex = 1,
                .parentId = "a",
                .originKind = OriginKind::Crossover,
                .fitnessValue = 0.6,
            },
        };
        run.paretoPoints = {
            ScoredPoint{ .id = "p1", .quality = 0.9, .speed = 0.9, .complexity = 0.1 },
            ScoredPoint{
                .id = "p2", .quality = 0.5, .speed = 0.5, .complexity = 0.5, .isOptimal = true },
        };
    }

    RunData run;
    CommandOptions options;
};

TEST_F(RunCommandsTest, LayoutCommandEmitsNodesEdgesAndSvgPaths)
{
    auto result = runCommand("layout", run, options);
    ASSERT_TRUE(result.isValue()) << result.errorValue();

    const nlohmann::json& output = result.value();
    EXPECT_EQ(output["nodes"].size(), 3u);
    EXPECT_EQ(output["edges"].size(), 2u);
    EXPECT_EQ(output["svgPaths"].size(), 2u);
    EXPECT_EQ(output["bands"].size(), 2u);
}

TEST_F(RunCommandsTest, LayoutCommandHighlightsTargetPath)
{
    options.target = "c";

    auto result = runCommand("layout", run, options);
    ASSERT_TRUE(result.isValue());

    for (const auto& edge : result.value()["edges"]) {
        EXPECT_EQ(edge["highlighted"].get<bool>(), edge["targetId"] == "c");
    }
}

TEST_F(RunCommandsTest, LayoutCommandHonoursMaxDepth)
{
    options.maxDepth = 0;

    auto result = runCommand("layout", run, options);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value()["nodes"].size(), 1u);
    EXPECT_TRUE(result.value()["edges"].empty());
}

TEST_F(RunCommandsTest, ParetoCommandRecomputesOptimality)
{
    auto result = runCommand("pareto", run, options);
    ASSERT_TRUE(result.isValue());

    const nlohmann::json& output = result.value();
    EXPECT_EQ(output["optimal"], nlohmann::json::array({ "p1" }));
    EXPECT_EQ(output["frontier"], nlohmann::json::array({ "p1" }));
    EXPECT_EQ(output["ranks"], nlohmann::json::array({ 0, 1 }));
    EXPECT_TRUE(output["points"][0]["isOptimal"].get<bool>());
    EXPECT_FALSE(output["points"][1]["isOptimal"].get<bool>());
}

TEST_F(RunCommandsTest, SurfaceCommandUsesRequestedResolution)
{
    options.gridResolution = 3;

    auto result = runCommand("surface", run, options);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value()["resolution"], 3);
    EXPECT_EQ(result.value()["samples"].size(), 9u);
}

TEST_F(RunCommandsTest, SurfaceCommandFallsBackToConfiguredResolution)
{
    options.surface.gridResolution = 5;

    auto result = runCommand("surface", run, options);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value()["samples"].size(), 25u);
}

TEST_F(RunCommandsTest, PathCommandResolvesTarget)
{
    options.target = "c";

    auto result = runCommand("path", run, options);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value()["path"], nlohmann::json::array({ "c", "a" }));
}

TEST_F(RunCommandsTest, PathCommandRequiresTarget)
{
    auto result = runCommand("path", run, options);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("--target"), std::string::npos);
}

TEST_F(RunCommandsTest, PathCommandReportsUnknownTarget)
{
    options.target = "nobody";

    auto result = runCommand("path", run, options);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("UnknownRecord"), std::string::npos);
}

TEST_F(RunCommandsTest, UnknownCommandIsAnError)
{
    auto result = runCommand("render", run, options);
    EXPECT_TRUE(result.isError());
}

TEST_F(RunCommandsTest, EveryListedCommandIsDispatched)
{
    options.target = "a";
    for (const auto& command : getCliCommands()) {
        EXPECT_TRUE(runCommand(command.name, run, options).isValue()) << command.name;
    }
}
