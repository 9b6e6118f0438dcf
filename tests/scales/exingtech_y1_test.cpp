#include <gtest/gtest.h>

#include "scales/scale_adapters.h"
#include "test_helpers.h"

namespace {

Frame analysis_frame() {
    Frame f(15);
    f.u16_be(4, 800).u16_be(6, 225).u16_be(8, 550).u16_be(10, 35).u16_be(12, 400).u8(14, 8);
    return f;
}

}  // namespace

TEST(ExingtechY1Adapter, MatchesNameOrService) {
    ExingtechY1Adapter adapter;
    EXPECT_TRUE(adapter.matches(mock_device("vscale")));
    EXPECT_TRUE(adapter.matches(mock_device("VScale")));
    EXPECT_TRUE(adapter.matches(mock_device("", {"F433BD80-75B8-11E2-97D9-0002A5D5C51B"})));
    EXPECT_FALSE(adapter.matches(mock_device("vscale2")));
}

TEST(ExingtechY1Adapter, WeightOnlyFrameIsNotComplete) {
    ExingtechY1Adapter adapter;
    auto r = adapter.parse_notification(Frame(15).u16_be(4, 800).u8(6, 0xFF).bytes);
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r->weight, 80.0);
    EXPECT_FALSE(adapter.is_complete(*r));
}

TEST(ExingtechY1Adapter, AnalysisFrameCompletes) {
    ExingtechY1Adapter adapter;
    auto r = adapter.parse_notification(analysis_frame().bytes);
    ASSERT_TRUE(r);
    EXPECT_TRUE(adapter.is_complete(*r));
    EXPECT_FALSE(adapter.is_complete({0.0, 0}));

    const BodyComposition bc = adapter.compute_metrics(*r, default_profile());
    EXPECT_DOUBLE_EQ(bc.body_fat_percent, 22.5);
    EXPECT_DOUBLE_EQ(bc.water_percent, 55.0);
    EXPECT_DOUBLE_EQ(bc.bone_mass, 3.5);
    EXPECT_EQ(bc.visceral_fat, 8);
    expect_payload_ranges(bc);
}

TEST(ExingtechY1Adapter, RejectsShortAndZeroFrames) {
    ExingtechY1Adapter adapter;
    EXPECT_FALSE(adapter.parse_notification(ByteArray(14, 0)));
    EXPECT_FALSE(adapter.parse_notification(Frame(15).u8(6, 0xFF).bytes));
}
