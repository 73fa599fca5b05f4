#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "clip_unify/config.hpp"

using namespace clip_unify;

namespace {

const char *const kVars[] = {"INPUT_DIR",    "SCRATCH_DIR",   "OUTPUT_FILE",
                             "VIDEO_EXTS",   "TARGET_WIDTH",  "TARGET_HEIGHT",
                             "FFMPEG_BIN",   "FFPROBE_BIN",   "PROBE_BACKEND",
                             "ENCODE_MODE",  "PARALLEL_JOBS", "HW_MAX_SESSIONS"};

} // namespace

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        for (const char *name : kVars)
            unsetenv(name);
    }

    void TearDown() override
    {
        for (const char *name : kVars)
            unsetenv(name);
    }
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment)
{
    RunConfig cfg = load_config();
    EXPECT_EQ(cfg.input_dir, ".");
    EXPECT_EQ(cfg.scratch_dir, "processed_temp");
    EXPECT_EQ(cfg.output_file, "final_merged_video.mp4");
    EXPECT_EQ(cfg.extensions,
              (std::vector<std::string>{"mp4", "mov", "avi", "mkv", "flv", "ts"}));
    EXPECT_EQ(cfg.canvas.width, 1920);
    EXPECT_EQ(cfg.canvas.height, 1080);
    EXPECT_EQ(cfg.probe_backend, ProbeBackend::Ffprobe);
    EXPECT_TRUE(cfg.mode.empty());
    EXPECT_EQ(cfg.parallel_jobs, 1);
    EXPECT_EQ(cfg.hw_max_sessions, 3);
    EXPECT_EQ(cfg.list_path(), "processed_temp/file_list.txt");
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults)
{
    setenv("SCRATCH_DIR", "/tmp/scratch", 1);
    setenv("VIDEO_EXTS", "MKV, .mp4", 1);
    setenv("TARGET_WIDTH", "1280", 1);
    setenv("TARGET_HEIGHT", "720", 1);
    setenv("PROBE_BACKEND", "LibAV", 1);
    setenv("ENCODE_MODE", "2", 1);
    setenv("PARALLEL_JOBS", "4", 1);

    RunConfig cfg = load_config();
    EXPECT_EQ(cfg.scratch_dir, "/tmp/scratch");
    EXPECT_EQ(cfg.extensions, (std::vector<std::string>{"mkv", "mp4"}));
    EXPECT_EQ(cfg.canvas.width, 1280);
    EXPECT_EQ(cfg.canvas.height, 720);
    EXPECT_EQ(cfg.probe_backend, ProbeBackend::Libav);
    EXPECT_EQ(cfg.mode, "2");
    EXPECT_EQ(cfg.parallel_jobs, 4);
}

TEST_F(ConfigTest, InvalidNumbersFallBack)
{
    setenv("TARGET_WIDTH", "-5", 1);
    setenv("TARGET_HEIGHT", "wide", 1);
    setenv("PARALLEL_JOBS", "-2", 1);
    setenv("HW_MAX_SESSIONS", "0", 1);

    RunConfig cfg = load_config();
    EXPECT_EQ(cfg.canvas.width, 1920);
    EXPECT_EQ(cfg.canvas.height, 1080);
    EXPECT_EQ(cfg.parallel_jobs, 0);
    EXPECT_EQ(cfg.hw_max_sessions, 1);
}

TEST(ConfigParseTest, ExtensionListIsNormalized)
{
    EXPECT_EQ(Config::parse_extension_list(" .MP4, mov,,MP4 , Ts"),
              (std::vector<std::string>{"mp4", "mov", "ts"}));
    EXPECT_TRUE(Config::parse_extension_list("").empty());
    EXPECT_TRUE(Config::parse_extension_list(" , ,").empty());
}

TEST(ConfigParseTest, ProbeBackendNames)
{
    EXPECT_EQ(Config::parse_probe_backend("libav"), ProbeBackend::Libav);
    EXPECT_EQ(Config::parse_probe_backend(" LIBAV "), ProbeBackend::Libav);
    EXPECT_EQ(Config::parse_probe_backend("ffprobe"), ProbeBackend::Ffprobe);
    EXPECT_EQ(Config::parse_probe_backend("other"), ProbeBackend::Ffprobe);
}
