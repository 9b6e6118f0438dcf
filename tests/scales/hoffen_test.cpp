#include <gtest/gtest.h>

#include "scales/scale_adapters.h"
#include "test_helpers.h"

namespace {

Frame bia_frame() {
    Frame f(19);
    f.u8(0, 0xFA).u16_le(3, 800).u8(5, 0x00);
    f.u16_le(6, 225).u16_le(8, 550).u16_le(10, 400).u8(14, 35).u16_le(17, 80);
    return f;
}

}  // namespace

TEST(HoffenAdapter, MatchesExactModelName) {
    HoffenAdapter adapter;
    EXPECT_TRUE(adapter.matches(mock_device("hoffen bs-8107")));
    EXPECT_TRUE(adapter.matches(mock_device("Hoffen BS-8107")));
    EXPECT_TRUE(adapter.matches(mock_device("HOFFEN BS-8107")));
    EXPECT_FALSE(adapter.matches(mock_device("hoffen")));
    EXPECT_FALSE(adapter.matches(mock_device("Random Scale")));
}

TEST(HoffenAdapter, ParsesWeightWithoutContact) {
    HoffenAdapter adapter;
    auto r = adapter.parse_notification(Frame(8).u8(0, 0xFA).u16_le(3, 800).u8(5, 0x01).bytes);
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r->weight, 80.0);
    EXPECT_EQ(r->impedance, 0);
}

TEST(HoffenAdapter, RejectsWrongMagicAndShortFrames) {
    HoffenAdapter adapter;
    EXPECT_FALSE(adapter.parse_notification(Frame(8).u8(0, 0xFB).u16_le(3, 800).bytes));
    EXPECT_FALSE(adapter.parse_notification(ByteArray(4, 0xFA)));
    EXPECT_FALSE(adapter.parse_notification(Frame(8).u8(0, 0xFA).bytes));
}

TEST(HoffenAdapter, CompleteOnWeight) {
    HoffenAdapter adapter;
    EXPECT_TRUE(adapter.is_complete({80.0, 0}));
    EXPECT_FALSE(adapter.is_complete({0.0, 0}));
}

TEST(HoffenAdapter, BiaFrameFeedsComposition) {
    HoffenAdapter adapter;
    auto r = adapter.parse_notification(bia_frame().bytes);
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(r->weight, 80.0);

    const BodyComposition bc = adapter.compute_metrics(*r, default_profile());
    EXPECT_DOUBLE_EQ(bc.body_fat_percent, 22.5);
    EXPECT_DOUBLE_EQ(bc.water_percent, 55.0);
    EXPECT_DOUBLE_EQ(bc.bone_mass, 3.5);
    EXPECT_EQ(bc.visceral_fat, 8);
    expect_payload_ranges(bc);

    EXPECT_DOUBLE_EQ(adapter.compute_metrics({0.0, 0}, default_profile()).weight, 0.0);
}
