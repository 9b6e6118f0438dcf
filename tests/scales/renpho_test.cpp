#include <gtest/gtest.h>

#include "scales/scale_adapters.h"
#include "test_helpers.h"

namespace {

ByteArray weight_frame(uint16_t weight_x100, uint16_t impedance) {
    return Frame(10).u8(0, 0x10).u16_be(3, weight_x100).u16_be(8, impedance).bytes;
}

}  // namespace

TEST(RenphoAdapter, MatchesQnAndRenphoPrefixes) {
    RenphoAdapter adapter;
    EXPECT_TRUE(adapter.matches(mock_device("QN-Scale")));
    EXPECT_TRUE(adapter.matches(mock_device("qn-scale1")));
    EXPECT_TRUE(adapter.matches(mock_device("Renpho ES-CS20M")));
    EXPECT_FALSE(adapter.matches(mock_device("my renpho")));
    EXPECT_FALSE(adapter.matches(mock_device("")));
}

TEST(RenphoAdapter, ParsesWeightAndImpedance) {
    RenphoAdapter adapter;
    auto r = adapter.parse_notification(weight_frame(7550, 500));
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r->weight, 75.5);
    EXPECT_EQ(r->impedance, 500);
}

TEST(RenphoAdapter, RejectsForeignFrames) {
    RenphoAdapter adapter;
    EXPECT_FALSE(adapter.parse_notification(Frame(10).u8(0, 0x12).u16_be(3, 7550).bytes));
    EXPECT_FALSE(adapter.parse_notification(ByteArray{0x10, 0x00, 0x00}));
    EXPECT_FALSE(adapter.parse_notification(weight_frame(0, 500)));
}

TEST(RenphoAdapter, CompleteNeedsImpedanceSweep) {
    RenphoAdapter adapter;
    EXPECT_FALSE(adapter.is_complete({75.5, 0}));
    EXPECT_FALSE(adapter.is_complete({75.5, 150}));
    EXPECT_FALSE(adapter.is_complete({8.0, 500}));
    EXPECT_TRUE(adapter.is_complete({75.5, 500}));
}

TEST(RenphoAdapter, UnlockDefaultsAndOverrides) {
    RenphoAdapter adapter;
    EXPECT_EQ(adapter.notify_char_uuid(), normalize_uuid("ffe1"));
    EXPECT_EQ(adapter.write_char_uuid(), normalize_uuid("ffe3"));
    EXPECT_EQ(adapter.unlock_command(), (ByteArray{0x13, 0x09, 0x15, 0x01, 0x10, 0x00, 0x00, 0x00, 0x42}));
    EXPECT_EQ(adapter.unlock_interval(), std::chrono::milliseconds(2000));

    RenphoOptions opts;
    opts.notify_char = "fff1";
    opts.write_char = "fff2";
    opts.unlock_command = {0x01, 0x02};
    RenphoAdapter custom(opts);
    EXPECT_EQ(custom.notify_char_uuid(), normalize_uuid("fff1"));
    EXPECT_EQ(custom.write_char_uuid(), normalize_uuid("fff2"));
    EXPECT_EQ(custom.unlock_command(), (ByteArray{0x01, 0x02}));
}

TEST(RenphoAdapter, ComputeMetricsUsesImpedanceModel) {
    RenphoAdapter adapter;
    const BodyComposition bc = adapter.compute_metrics({75.5, 500}, default_profile());
    auto direct = calculate_body_composition(75.5, 500, default_profile());
    ASSERT_TRUE(direct);
    EXPECT_DOUBLE_EQ(bc.body_fat_percent, direct->body_fat_percent);
    EXPECT_EQ(bc.bmr, direct->bmr);
    expect_payload_ranges(bc);
}
