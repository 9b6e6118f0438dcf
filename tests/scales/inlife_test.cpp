#include <limits>

#include <gtest/gtest.h>

#include "scales/scale_adapters.h"
#include "test_helpers.h"

TEST(InlifeAdapter, MatchesNamesAndService) {
    InlifeAdapter adapter;
    EXPECT_TRUE(adapter.matches(mock_device("000FatScale01")));
    EXPECT_TRUE(adapter.matches(mock_device("000fatscale02")));
    EXPECT_TRUE(adapter.matches(mock_device("042FatScale01")));
    EXPECT_TRUE(adapter.matches(mock_device("Unknown", {"fff0"})));
    EXPECT_FALSE(adapter.matches(mock_device("fatscale")));
}

TEST(InlifeAdapter, ImpedanceModes) {
    for (uint8_t mode : {0x80, 0x81}) {
        InlifeAdapter adapter;
        auto r = adapter.parse_notification(Frame(14).u8(0, 0x02).u16_be(2, 800).u32_be(4, 500).u8(11, mode).bytes);
        ASSERT_TRUE(r);
        EXPECT_DOUBLE_EQ(r->weight, 80.0);
        EXPECT_EQ(r->impedance, 500);
    }
}

TEST(InlifeAdapter, OutOfRangeImpedanceStaysPositive) {
    InlifeAdapter adapter;
    auto r = adapter.parse_notification(
        Frame(14).u8(0, 0x02).u16_be(2, 800).u32_be(4, 0xFFFFFFFF).u8(11, 0x80).bytes);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->impedance, std::numeric_limits<int>::max());
    expect_payload_ranges(adapter.compute_metrics(*r, default_profile()));
}

TEST(InlifeAdapter, LegacyModeReportsVisceralFat) {
    InlifeAdapter adapter;
    auto r = adapter.parse_notification(Frame(14).u8(0, 0x02).u16_be(2, 800).u16_be(7, 80).u8(11, 0x00).bytes);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->impedance, 0);
    EXPECT_EQ(adapter.compute_metrics(*r, default_profile()).visceral_fat, 8);
}

TEST(InlifeAdapter, RejectsForeignMarkerShortAndZeroFrames) {
    InlifeAdapter adapter;
    EXPECT_FALSE(adapter.parse_notification(Frame(14).u8(0, 0x03).u16_be(2, 800).bytes));
    EXPECT_FALSE(adapter.parse_notification(Frame(13).u8(0, 0x02).u16_be(2, 800).bytes));
    EXPECT_FALSE(adapter.parse_notification(Frame(14).u8(0, 0x02).bytes));
}

TEST(InlifeAdapter, ComputeMetricsInRange) {
    InlifeAdapter adapter;
    auto r = adapter.parse_notification(Frame(14).u8(0, 0x02).u16_be(2, 800).u32_be(4, 500).u8(11, 0x80).bytes);
    ASSERT_TRUE(r);
    expect_payload_ranges(adapter.compute_metrics(*r, default_profile()));
}
