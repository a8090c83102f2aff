/**
 * @file sway_locate_tests.cpp
 * @brief End-to-end tests for the locate driver.
 */
#include "SwayLocate/SwayLocate.hpp"
#include "helpers/TestHelpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

namespace
{

std::vector<std::string> SplitLines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line))
    {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

class SwayLocateTest : public ScratchTreeTest
{
};

TEST(LocateCommandTests, ToStringAndBack)
{
    // Arrange
    const std::vector<LocateCommand> allCommands = {LocateCommand::Files, LocateCommand::ParentManifest, LocateCommand::NestedManifest,
                                                    LocateCommand::ParentFile, LocateCommand::NestedFile};

    for (const auto& command : allCommands)
    {
        // Act
        const std::optional<LocateCommand> convertedCommand = StringToLocateCommand(LocateCommandToString(command));

        // Assert
        ASSERT_TRUE(convertedCommand.has_value());
        ASSERT_EQ(command, convertedCommand.value());
    }
}

TEST(LocateCommandTests, UnknownName_IsRejected)
{
    EXPECT_FALSE(StringToLocateCommand("upward").has_value());
    EXPECT_FALSE(StringToLocateCommand("").has_value());
}

TEST_F(SwayLocateTest, RunLocate_Files_PrintsSortedSources)
{
    // Arrange
    CreateFile(root / "src" / "main.sw");
    CreateFile(root / "src" / "lib" / "a.sw");
    CreateFile(root / "Forc.toml");

    LocateConfig config;
    config.command = LocateCommand::Files;
    config.startPath = root;
    std::ostringstream output;

    // Act
    const bool found = RunLocate(config, output);

    // Assert
    EXPECT_TRUE(found);
    EXPECT_THAT(SplitLines(output.str()),
                testing::ElementsAre((root / "src" / "lib" / "a.sw").string(), (root / "src" / "main.sw").string()));
}

TEST_F(SwayLocateTest, RunLocate_FilesWithoutSources_ReturnsFalse)
{
    // Arrange
    CreateFile(root / "README.md");

    LocateConfig config;
    config.command = LocateCommand::Files;
    config.startPath = root;
    std::ostringstream output;

    // Act & Assert
    EXPECT_FALSE(RunLocate(config, output));
    EXPECT_TRUE(output.str().empty());
}

TEST_F(SwayLocateTest, RunLocate_ParentManifest_PrintsDirectory)
{
    // Arrange
    CreateFile(root / "Forc.toml");
    CreateFile(root / "src" / "main.sw");

    LocateConfig config;
    config.command = LocateCommand::ParentManifest;
    config.startPath = root / "src" / "main.sw";
    std::ostringstream output;

    // Act
    const bool found = RunLocate(config, output);

    // Assert
    EXPECT_TRUE(found);
    EXPECT_EQ(root.string() + "\n", output.str());
}

TEST_F(SwayLocateTest, RunLocate_ParentManifestRequiringSources_SkipsWorkspaceWithoutSources)
{
    // Arrange
    CreateFile(root / "Forc.toml");
    CreateFile(root / "src" / "main.sw");
    CreateFile(root / "src" / "generated" / "Forc.toml");

    LocateConfig config;
    config.command = LocateCommand::ParentManifest;
    config.startPath = root / "src" / "generated";
    config.requireSources = true;

    std::vector<std::string> stages;
    config.onProgress = [&](const LocateProgress& progress) { stages.push_back(progress.stage); };
    std::ostringstream output;

    // Act
    const bool found = RunLocate(config, output);

    // Assert
    EXPECT_TRUE(found);
    EXPECT_EQ(root.string() + "\n", output.str());
    EXPECT_THAT(stages, testing::ElementsAre("parent-manifest", "skipped", "found"));
}

TEST_F(SwayLocateTest, RunLocate_NestedManifest_PrintsDirectory)
{
    // Arrange
    CreateFile(root / "Forc.toml");
    CreateFile(root / "examples" / "counter" / "Forc.toml");

    LocateConfig config;
    config.command = LocateCommand::NestedManifest;
    config.startPath = root;
    std::ostringstream output;

    // Act
    const bool found = RunLocate(config, output);

    // Assert
    EXPECT_TRUE(found);
    EXPECT_EQ((root / "examples" / "counter").string() + "\n", output.str());
}

TEST_F(SwayLocateTest, RunLocate_ParentFile_UsesConfiguredName)
{
    // Arrange
    CreateFile(root / "Cargo.toml");
    CreateDirectory(root / "tests");

    LocateConfig config;
    config.command = LocateCommand::ParentFile;
    config.startPath = root / "tests";
    config.fileName = "Cargo.toml";
    std::ostringstream output;

    // Act & Assert
    EXPECT_TRUE(RunLocate(config, output));
    EXPECT_EQ(root.string() + "\n", output.str());
}

TEST_F(SwayLocateTest, RunLocate_NestedFileWithoutName_ReturnsFalse)
{
    // Arrange
    CreateFile(root / "sub" / "Forc.toml");

    LocateConfig config;
    config.command = LocateCommand::NestedFile;
    config.startPath = root;
    std::ostringstream output;

    // Act & Assert
    EXPECT_FALSE(RunLocate(config, output));
    EXPECT_TRUE(output.str().empty());
}

TEST_F(SwayLocateTest, RunLocate_NotFound_ReportsProgress)
{
    // Arrange
    CreateDirectory(root / "empty");

    LocateConfig config;
    config.command = LocateCommand::NestedManifest;
    config.startPath = root / "empty";

    std::vector<std::string> stages;
    config.onProgress = [&](const LocateProgress& progress) { stages.push_back(progress.stage); };
    std::ostringstream output;

    // Act
    const bool found = RunLocate(config, output);

    // Assert
    EXPECT_FALSE(found);
    EXPECT_THAT(stages, testing::ElementsAre("nested-manifest", "not-found"));
}
