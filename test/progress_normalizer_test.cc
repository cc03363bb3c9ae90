#include <core/upload/progress_normalizer.h>
#include <gtest/gtest.h>
#include <limits>
#include <nlohmann/json.hpp>

using nlohmann::json;
using pipecdn::core::ProgressEvent;
using pipecdn::core::ProgressNormalizer;

TEST(ProgressNormalizerTest, BareFractionIsScaled) {
    auto event = ProgressNormalizer::Parse(json(0.5));
    ASSERT_TRUE(event);
    ASSERT_TRUE(event->percent);
    EXPECT_DOUBLE_EQ(*event->percent, 0.5);
    EXPECT_FALSE(event->id);

    auto normalized = ProgressNormalizer::Normalize(*event, std::nullopt, 0);
    ASSERT_TRUE(normalized.percent);
    EXPECT_DOUBLE_EQ(*normalized.percent, 50.0);
}

TEST(ProgressNormalizerTest, BarePercentIsKept) {
    auto event = ProgressNormalizer::Parse(json(42));
    ASSERT_TRUE(event);
    auto normalized = ProgressNormalizer::Normalize(*event, std::nullopt, 0);
    ASSERT_TRUE(normalized.percent);
    EXPECT_DOUBLE_EQ(*normalized.percent, 42.0);
}

TEST(ProgressNormalizerTest, ParsesEveryObjectField) {
    auto event = ProgressNormalizer::Parse(json{
        {"id", "task-1"},
        {"percent", 12.5},
        {"uploaded", 100},
        {"total", 800},
        {"completed", false},
        {"status", "uploading"},
        {"message", "part 1 of 4"},
    });
    ASSERT_TRUE(event);
    EXPECT_EQ(event->id, "task-1");
    EXPECT_EQ(event->percent, 12.5);
    EXPECT_EQ(event->uploaded, 100u);
    EXPECT_EQ(event->total, 800u);
    EXPECT_EQ(event->completed, false);
    EXPECT_EQ(event->status, "uploading");
    EXPECT_EQ(event->message, "part 1 of 4");
    EXPECT_FALSE(event->error);
}

TEST(ProgressNormalizerTest, ToleratesBadFieldTypes) {
    auto event = ProgressNormalizer::Parse(json{
        {"uploaded", -5},
        {"total", "lots"},
        {"completed", "yes"},
        {"error", nullptr},
    });
    ASSERT_TRUE(event);
    EXPECT_FALSE(event->uploaded);
    EXPECT_FALSE(event->total);
    EXPECT_FALSE(event->completed);
    EXPECT_FALSE(event->error);
}

TEST(ProgressNormalizerTest, NumericIdIsKeptAsText) {
    auto event = ProgressNormalizer::Parse(json{{"id", 7}});
    ASSERT_TRUE(event);
    EXPECT_EQ(event->id, "7");
}

TEST(ProgressNormalizerTest, NonTextValuesAreAbsent) {
    auto event = ProgressNormalizer::Parse(json{
        {"error", false},
        {"status", json::object()},
        {"message", json::array({"a"})},
        {"uploaded", 10},
    });
    ASSERT_TRUE(event);
    EXPECT_FALSE(event->error);
    EXPECT_FALSE(event->status);
    EXPECT_FALSE(event->message);
    EXPECT_EQ(event->uploaded, 10u);
}

TEST(ProgressNormalizerTest, RejectsOtherShapes) {
    EXPECT_FALSE(ProgressNormalizer::Parse(json("50%")));
    EXPECT_FALSE(ProgressNormalizer::Parse(json::array({1, 2})));
    EXPECT_FALSE(ProgressNormalizer::Parse(json(nullptr)));
    EXPECT_FALSE(ProgressNormalizer::Parse(json(true)));
}

TEST(ProgressNormalizerTest, BytesWinOverReportedPercent) {
    ProgressEvent event;
    event.percent = 90;
    event.uploaded = 250;
    event.total = 1000;
    auto normalized = ProgressNormalizer::Normalize(event, std::nullopt, 0);
    ASSERT_TRUE(normalized.percent);
    EXPECT_DOUBLE_EQ(*normalized.percent, 25.0);
    EXPECT_EQ(normalized.total, 1000u);
}

TEST(ProgressNormalizerTest, CumulativeBytesReplaceRawBytes) {
    ProgressEvent event;
    event.uploaded = 100;
    event.total = 1000;
    auto normalized = ProgressNormalizer::Normalize(event, 600, 0);
    ASSERT_TRUE(normalized.percent);
    EXPECT_DOUBLE_EQ(*normalized.percent, 60.0);
    EXPECT_EQ(normalized.uploaded, 600u);
}

TEST(ProgressNormalizerTest, KnownTotalNeverShrinks) {
    ProgressEvent event;
    event.uploaded = 250;
    event.total = 500;
    auto normalized = ProgressNormalizer::Normalize(event, std::nullopt, 1000);
    EXPECT_EQ(normalized.total, 1000u);
    ASSERT_TRUE(normalized.percent);
    EXPECT_DOUBLE_EQ(*normalized.percent, 25.0);
}

TEST(ProgressNormalizerTest, BytesWithoutTotalFallBackToPercent) {
    ProgressEvent event;
    event.uploaded = 250;
    event.percent = 40;
    auto normalized = ProgressNormalizer::Normalize(event, std::nullopt, 0);
    ASSERT_TRUE(normalized.percent);
    EXPECT_DOUBLE_EQ(*normalized.percent, 40.0);
}

TEST(ProgressNormalizerTest, NoProgressInformationLeavesPercentUnset) {
    ProgressEvent event;
    event.message = "still working";
    auto normalized = ProgressNormalizer::Normalize(event, std::nullopt, 0);
    EXPECT_FALSE(normalized.percent);
    EXPECT_FALSE(normalized.uploaded);
}

TEST(ProgressNormalizerTest, ScaleReportedPercent) {
    EXPECT_EQ(ProgressNormalizer::ScaleReportedPercent(0.0), 0.0);
    EXPECT_EQ(ProgressNormalizer::ScaleReportedPercent(1.0), 100.0);
    EXPECT_EQ(ProgressNormalizer::ScaleReportedPercent(0.25), 25.0);
    EXPECT_EQ(ProgressNormalizer::ScaleReportedPercent(75.0), 75.0);
    EXPECT_EQ(ProgressNormalizer::ScaleReportedPercent(250.0), 100.0);
    EXPECT_FALSE(ProgressNormalizer::ScaleReportedPercent(-1.0));
    EXPECT_FALSE(
        ProgressNormalizer::ScaleReportedPercent(std::numeric_limits<double>::quiet_NaN()));
}
