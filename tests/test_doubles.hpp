#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

#include "clip_unify/process.hpp"
#include "clip_unify/prober.hpp"

namespace clip_unify
{
namespace testing_support
{

/**
 * @brief CommandRunner that records argv and answers from a handler.
 * @note Default handler succeeds and, for ffmpeg-style commands, creates the
 *       output file (the last argument) like the real engine would.
 */
class ScriptedRunner : public CommandRunner
{
public:
    using Handler = std::function<ProcessOutcome(const std::vector<std::string> &)>;

    ScriptedRunner() : handler_(&ScriptedRunner::touch_output) {}

    void set_handler(Handler handler) { handler_ = std::move(handler); }

    ProcessOutcome run(const std::vector<std::string> &argv) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(argv);
        }
        return handler_(argv);
    }

    std::vector<std::vector<std::string>> calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t concat_calls() const
    {
        auto all = calls();
        return static_cast<size_t>(
            std::count_if(all.begin(), all.end(), &ScriptedRunner::is_concat));
    }

    static bool is_concat(const std::vector<std::string> &argv)
    {
        return std::find(argv.begin(), argv.end(), "concat") != argv.end();
    }

    static ProcessOutcome ok(std::string output = {})
    {
        ProcessOutcome o;
        o.spawned = true;
        o.exit_code = 0;
        o.output = std::move(output);
        return o;
    }

    static ProcessOutcome fail(int code, std::string diagnostics = {})
    {
        ProcessOutcome o;
        o.spawned = true;
        o.exit_code = code;
        o.diagnostics = std::move(diagnostics);
        return o;
    }

    static ProcessOutcome touch_output(const std::vector<std::string> &argv)
    {
        if (!argv.empty())
        {
            std::ofstream(argv.back()) << "data";
        }
        return ok();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> calls_;
    Handler handler_;
};

/**
 * @brief DimensionProber answering from a table keyed by file name.
 * @note Unknown files fail like a corrupt clip would.
 */
class ScriptedProber : public DimensionProber
{
public:
    void set(const std::string &filename, int width, int height)
    {
        table_[filename] = Dimensions{width, height};
    }

    void set_failed(const std::string &filename)
    {
        table_[filename] = ProbeFailed{"invalid data"};
    }

    ProbeResult probe(const std::string &path) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++probes_;
        auto it = table_.find(std::filesystem::path(path).filename().string());
        if (it == table_.end())
            return ProbeFailed{"not scripted"};
        return it->second;
    }

    int probes() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return probes_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ProbeResult> table_;
    int probes_ = 0;
};

/**
 * @brief Fixture owning a fresh temporary directory per test.
 */
class TempDirTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path() /
                (std::string("clip_unify_") + info->test_suite_name() + "_" +
                 info->name() + "_" + std::to_string(getpid()));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path touch(const std::filesystem::path &relative)
    {
        auto p = root_ / relative;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p) << "x";
        return p;
    }

    static std::string read_file(const std::filesystem::path &p)
    {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }

    std::filesystem::path root_;
};

} // namespace testing_support
} // namespace clip_unify
