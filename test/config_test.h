#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "codec_config.h"
#include "test_const.h"

namespace XodrCodecTest
{
    using namespace XodrCodec;

    TEST(CodecConfig, MissingFileGivesDefaults)
    {
        auto config = LoadCodecConfig("/nonexistent/dir/xodrcodec.json");
        EXPECT_TRUE(config.workarounds.empty());
        EXPECT_FALSE(config.verifyContinuity);
        EXPECT_EQ(config.continuityTolerance, ContinuityTolerance);
        EXPECT_EQ(MakeWorkarounds(config), Workarounds::Strict());
    }

    TEST(CodecConfig, SaveThenLoad)
    {
        auto dir = std::filesystem::temp_directory_path() / "xodrcodec_config_test";
        std::filesystem::create_directories(dir);
        const auto path = (dir / "codec.json").string();

        CodecConfig config;
        config.workarounds = { "workaround-sumo-issue-10301" };
        config.verifyContinuity = true;
        config.continuityTolerance = 0.01;
        SaveCodecConfig(config, path);

        auto loaded = LoadCodecConfig(path);
        EXPECT_EQ(loaded.workarounds, config.workarounds);
        EXPECT_TRUE(loaded.verifyContinuity);
        EXPECT_EQ(loaded.continuityTolerance, 0.01);

        auto options = MakeReadOptions(loaded);
        EXPECT_TRUE(options.workarounds.IsEnabled(Workaround::SumoIssue10301));
        EXPECT_FALSE(options.workarounds.IsEnabled(Workaround::SumoRoadMarkMissingColor));
        EXPECT_TRUE(options.verifyContinuity);
        EXPECT_EQ(options.continuityTolerance, 0.01);
        EXPECT_EQ(options.diagnostics, nullptr);

        std::filesystem::remove_all(dir);
    }

    TEST(CodecConfig, UnknownWorkaroundName)
    {
        CodecConfig config;
        config.workarounds = { "workaround-sumo", "workaround-typo" };
        EXPECT_THROW(MakeWorkarounds(config), std::invalid_argument);
        config.workarounds.pop_back();
        EXPECT_EQ(MakeWorkarounds(config), Workarounds::Sumo());
    }

    TEST(CodecConfig, SavedFileUsesFieldNames)
    {
        auto dir = std::filesystem::temp_directory_path() / "xodrcodec_config_names";
        std::filesystem::create_directories(dir);
        const auto path = (dir / "codec.json").string();

        CodecConfig config;
        config.workarounds = { "workaround-sumo" };
        SaveCodecConfig(config, path);

        std::ifstream inFile(path);
        const std::string text((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
        EXPECT_NE(text.find("\"workarounds\""), std::string::npos);
        EXPECT_NE(text.find("\"verifyContinuity\""), std::string::npos);
        EXPECT_NE(text.find("\"continuityTolerance\""), std::string::npos);
        EXPECT_EQ(text.find("\"value1\""), std::string::npos);

        std::filesystem::remove_all(dir);
    }
}
