#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "clip_unify/encoder_profile.hpp"

using namespace clip_unify;

namespace {

bool has_pair(const std::vector<std::string> &args, const std::string &flag,
              const std::string &value)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag && args[i + 1] == value)
            return true;
    }
    return false;
}

} // namespace

TEST(EncoderProfileTest, ParseModeRecognizesHardwareSpellings)
{
    for (const char *choice : {"2", " 2 ", "hardware", "GPU", "nvenc", "H264_NVENC"})
        EXPECT_EQ(parse_mode(choice), EncodeMode::Hardware) << choice;
}

TEST(EncoderProfileTest, ParseModeFailsOpenToSoftware)
{
    for (const char *choice : {"", "1", "9", "cpu", "software", "garbage", "22"})
        EXPECT_EQ(parse_mode(choice), EncodeMode::Software) << choice;
}

TEST(EncoderProfileTest, SoftwareProfileArguments)
{
    auto args = select_profile(EncodeMode::Software).to_args();
    const std::vector<std::string> expected = {
        "-c:v", "libx264", "-preset", "fast", "-crf", "23",
        "-r", "30", "-video_track_timescale", "15360",
        "-c:a", "aac", "-ar", "44100", "-ac", "2", "-b:a", "192k"};
    EXPECT_EQ(args, expected);
}

TEST(EncoderProfileTest, HardwareProfileUsesNvencAndVbr)
{
    EncodingProfile hw = select_profile("2");
    EXPECT_EQ(hw.mode, EncodeMode::Hardware);
    EXPECT_EQ(hw.video_codec, "h264_nvenc");

    auto args = hw.to_args();
    EXPECT_TRUE(has_pair(args, "-c:v", "h264_nvenc"));
    EXPECT_TRUE(has_pair(args, "-preset", "p4"));
    EXPECT_TRUE(has_pair(args, "-cq", "26"));
    EXPECT_TRUE(has_pair(args, "-rc", "vbr"));
    EXPECT_EQ(std::find(args.begin(), args.end(), "-crf"), args.end());
}

TEST(EncoderProfileTest, SharedParametersMatchAcrossModes)
{
    auto sw = select_profile(EncodeMode::Software).to_args();
    auto hw = select_profile(EncodeMode::Hardware).to_args();

    for (const auto &pair : std::vector<std::pair<std::string, std::string>>{
             {"-r", "30"},
             {"-video_track_timescale", "15360"},
             {"-c:a", "aac"},
             {"-ar", "44100"},
             {"-ac", "2"},
             {"-b:a", "192k"}})
    {
        EXPECT_TRUE(has_pair(sw, pair.first, pair.second)) << pair.first;
        EXPECT_TRUE(has_pair(hw, pair.first, pair.second)) << pair.first;
    }
}

TEST(EncoderProfileTest, SelectionIsPureAndIdempotent)
{
    EXPECT_EQ(select_profile("2"), select_profile("2"));
    EXPECT_EQ(select_profile("1").to_args(), select_profile("1").to_args());
    EXPECT_EQ(select_profile(""), select_profile("software"));
    EXPECT_EQ(select_profile("9"), select_profile("software"));
    EXPECT_NE(select_profile("2"), select_profile("1"));
}
