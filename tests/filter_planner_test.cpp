#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "clip_unify/filter_planner.hpp"

using namespace clip_unify;

namespace {

const std::vector<Dimensions> kSamples = {
    {1280, 720}, {1920, 1080}, {1080, 1920}, {720, 1280}, {640, 480},
    {480, 640},  {1000, 1000}, {3840, 2160}, {1, 2},      {2, 1}};

} // namespace

TEST(FilterPlannerTest, PortraitStartsWithRotation)
{
    for (const auto &dims : kSamples)
    {
        if (!dims.is_portrait())
            continue;
        FilterChain chain = plan_filters(dims, TargetCanvas{});
        ASSERT_EQ(chain.size(), 2u) << dims.width << "x" << dims.height;
        EXPECT_EQ(chain.front(), "transpose=2");
    }
}

TEST(FilterPlannerTest, LandscapeAndSquareNeverRotate)
{
    for (const auto &dims : kSamples)
    {
        if (dims.is_portrait())
            continue;
        FilterChain chain = plan_filters(dims, TargetCanvas{});
        ASSERT_EQ(chain.size(), 1u) << dims.width << "x" << dims.height;
        for (const auto &f : chain)
            EXPECT_EQ(f.find("transpose"), std::string::npos);
    }
}

TEST(FilterPlannerTest, EndsWithSingleScalePadForCanvas)
{
    TargetCanvas canvas{1280, 720};
    for (const auto &dims : kSamples)
    {
        FilterChain chain = plan_filters(dims, canvas);
        EXPECT_EQ(chain.back(),
                  "scale=1280:720:force_original_aspect_ratio=decrease,"
                  "pad=1280:720:(ow-iw)/2:(oh-ih)/2,setsar=1");

        int scale_entries = 0;
        for (const auto &f : chain)
        {
            if (f.rfind("scale=", 0) == 0)
                ++scale_entries;
        }
        EXPECT_EQ(scale_entries, 1);
    }
}

TEST(FilterPlannerTest, CanvasSizedInputStillPadded)
{
    TargetCanvas canvas{1920, 1080};
    FilterChain chain = plan_filters({1920, 1080}, canvas);
    ASSERT_EQ(chain.size(), 1u);
    EXPECT_EQ(chain[0], scale_pad_filter(canvas));
}

TEST(FilterPlannerTest, JoinProducesSingleExpression)
{
    FilterChain chain = plan_filters({1080, 1920}, TargetCanvas{});
    EXPECT_EQ(join_filters(chain),
              "transpose=2,scale=1920:1080:force_original_aspect_ratio=decrease,"
              "pad=1920:1080:(ow-iw)/2:(oh-ih)/2,setsar=1");
    EXPECT_EQ(join_filters({}), "");
}
