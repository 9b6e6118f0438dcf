#include <gtest/gtest.h>

#include "scales/scale_adapters.h"
#include "test_helpers.h"

TEST(StandardWeightScaleAdapter, MatchesSigServices) {
    StandardWeightScaleAdapter adapter;
    EXPECT_TRUE(adapter.matches(mock_device("", {"181d"})));
    EXPECT_TRUE(adapter.matches(mock_device("Anything", {"0000181B-0000-1000-8000-00805F9B34FB"})));
    EXPECT_FALSE(adapter.matches(mock_device("Anything", {"180f"})));
    EXPECT_EQ(adapter.notify_char_uuid(), normalize_uuid("2a9d"));
}

TEST(StandardWeightScaleAdapter, ParsesSiAndImperial) {
    StandardWeightScaleAdapter adapter;
    auto si = adapter.parse_notification(Frame(3).u8(0, 0x00).u16_le(1, 16000).bytes);
    ASSERT_TRUE(si);
    EXPECT_DOUBLE_EQ(si->weight, 80.0);

    auto lb = adapter.parse_notification(Frame(3).u8(0, 0x01).u16_le(1, 17637).bytes);
    ASSERT_TRUE(lb);
    EXPECT_NEAR(lb->weight, 80.0, 0.01);
}

TEST(StandardWeightScaleAdapter, RejectsShortAndZero) {
    StandardWeightScaleAdapter adapter;
    EXPECT_FALSE(adapter.parse_notification(ByteArray{0x00, 0x10}));
    EXPECT_FALSE(adapter.parse_notification(ByteArray{0x00, 0x00, 0x00}));
}

TEST(StandardWeightScaleAdapter, RejectsReservedFlagBits) {
    StandardWeightScaleAdapter adapter;
    EXPECT_FALSE(adapter.parse_notification(Frame(3).u8(0, 0x10).u16_le(1, 16000).bytes));
    EXPECT_FALSE(adapter.parse_notification(Frame(3).u8(0, 0xFA).u16_le(1, 16000).bytes));
}

TEST(StandardWeightScaleAdapter, FallbackMetricsInRange) {
    StandardWeightScaleAdapter adapter;
    expect_payload_ranges(adapter.compute_metrics({80.0, 0}, default_profile()));
}
