#include "ConfigParser.hpp"
#include "TestFiles.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

namespace fs = std::filesystem;

TEST(ConfigParserTest, LoadsEveryOption) {
    TempDir dir;
    const auto config = writeFile(dir.path() / "aniorg.json", R"({
        "source": "/srv/media/downloads",
        "target": "/srv/media/anime",
        "mode": "COPY",
        "fallback_on_link_failure": "move",
        "include_ext": ["mp4", ".MKV"],
        "dry_run": true,
        "verbose": true
    })");

    ConfigParser parser;
    ASSERT_TRUE(parser.load(config));

    const OrganizerOptions& options = parser.getOptions();
    EXPECT_EQ(options.source, fs::path("/srv/media/downloads"));
    EXPECT_EQ(options.target, fs::path("/srv/media/anime"));
    EXPECT_EQ(options.mode, OperationMode::Copy);
    ASSERT_TRUE(options.fallbackMode.has_value());
    EXPECT_EQ(*options.fallbackMode, OperationMode::Move);
    EXPECT_EQ(options.extensions, (std::vector<std::string>{"mp4", ".MKV"}));
    EXPECT_TRUE(options.dryRun);
    EXPECT_TRUE(options.verbose);
}

TEST(ConfigParserTest, MissingKeysKeepDefaults) {
    TempDir dir;
    const auto config = writeFile(dir.path() / "aniorg.json", R"({ "source": "/downloads" })");

    ConfigParser parser;
    ASSERT_TRUE(parser.load(config));

    const OrganizerOptions& options = parser.getOptions();
    EXPECT_EQ(options.source, fs::path("/downloads"));
    EXPECT_TRUE(options.target.empty());
    EXPECT_EQ(options.resolvedTarget(), fs::path("/downloads"));
    EXPECT_EQ(options.mode, OperationMode::Link);
    EXPECT_FALSE(options.fallbackMode.has_value());
    EXPECT_FALSE(options.dryRun);
    EXPECT_TRUE(options.extensions.empty());
}

TEST(ConfigParserTest, RelativePathsResolveAgainstTheOptionsFile) {
    TempDir dir;
    const auto config = writeFile(dir.path() / "settings" / "aniorg.json", R"({
        "source": "../downloads",
        "target": "library/./anime"
    })");

    ConfigParser parser;
    ASSERT_TRUE(parser.load(config));
    EXPECT_EQ(parser.getOptions().source, (dir.path() / "downloads").lexically_normal());
    EXPECT_EQ(parser.getOptions().target, (dir.path() / "settings" / "library" / "anime").lexically_normal());
}

TEST(ConfigParserTest, TemplateTokensAreNotSubstituted) {
    TempDir dir;
    const auto config = writeFile(dir.path() / "aniorg.json", R"({
        "user": "mika",
        "source": "/home/{{user}}/Downloads"
    })");

    ConfigParser parser;
    ASSERT_TRUE(parser.load(config));
    EXPECT_EQ(parser.getOptions().source, fs::path("/home/{{user}}/Downloads"));
}

#ifndef _WIN32
TEST(ConfigParserTest, LeadingTildeExpandsFromHome) {
    TempDir dir;
    const char* previous = std::getenv("HOME");
    const std::string savedHome = previous != nullptr ? previous : "";
    ::setenv("HOME", dir.path().c_str(), 1);

    const auto config = writeFile(dir.path() / "cfg" / "aniorg.json", R"({
        "source": "~/Downloads",
        "target": "~anime"
    })");
    ConfigParser parser;
    const bool loaded = parser.load(config);

    if (previous != nullptr) {
        ::setenv("HOME", savedHome.c_str(), 1);
    } else {
        ::unsetenv("HOME");
    }

    ASSERT_TRUE(loaded);
    EXPECT_EQ(parser.getOptions().source, (dir.path() / "Downloads").lexically_normal());
    EXPECT_EQ(parser.getOptions().target, (dir.path() / "cfg" / "~anime").lexically_normal());
}
#endif

TEST(ConfigParserTest, RejectsInvalidDocuments) {
    TempDir dir;
    const std::vector<std::string> invalid = {
        R"({ "mode": "symlink" })",
        R"({ "mode": 3 })",
        R"({ "fallback_on_link_failure": "link" })",
        R"({ "dry_run": "yes" })",
        R"({ "include_ext": "mp4" })",
        R"({ "include_ext": [4] })",
        R"({ "source": "" })",
        R"({ "target": ["a"] })",
        R"(["not", "an", "object"])",
        R"({ "source": )",
    };

    for (const auto& document : invalid) {
        const auto config = writeFile(dir.path() / "aniorg.json", document);
        ConfigParser parser;
        EXPECT_FALSE(parser.load(config)) << document;
    }
}

TEST(ConfigParserTest, MissingFileFailsToLoad) {
    TempDir dir;
    ConfigParser parser;
    EXPECT_FALSE(parser.load(dir.path() / "absent.json"));
}

TEST(ConfigParserTest, DefaultExtensionsCoverCommonVideoContainers) {
    const auto defaults = ConfigParser::builtInDefaultExtensions();
    EXPECT_EQ(defaults, (std::vector<std::string>{".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".rmvb"}));
}
