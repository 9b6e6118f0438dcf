#include <map>

#include <gtest/gtest.h>

#include "scales/scale_adapters.h"
#include "test_helpers.h"

TEST(DefaultAdapterOrder, ListsVendorsBeforeCatchAll) {
    const AdapterList adapters = default_adapter_order();
    ASSERT_EQ(adapters.size(), 9u);
    EXPECT_EQ(adapters.front()->name(), "Renpho");
    EXPECT_EQ(adapters.back()->name(), "Standard Weight Scale");
    EXPECT_EQ(adapter_names(adapters),
              "Renpho, Digoo, Hoffen, Beurer/Sanitas, Exingtech Y1, Chipsea Broadcast, MGB, Inlife, "
              "Standard Weight Scale");
}

TEST(DefaultAdapterOrder, SpecificVendorWinsOverSharedService) {
    const AdapterList adapters = default_adapter_order();

    ScaleAdapter* hoffen = find_adapter(adapters, mock_device("Hoffen BS-8107", {"ffb0"}));
    ASSERT_NE(hoffen, nullptr);
    EXPECT_EQ(hoffen->name(), "Hoffen");

    ScaleAdapter* digoo = find_adapter(adapters, mock_device("Mengii", {"fff0"}));
    ASSERT_NE(digoo, nullptr);
    EXPECT_EQ(digoo->name(), "Digoo");

    ScaleAdapter* mgb = find_adapter(adapters, mock_device("Swan-01", {"181d"}));
    ASSERT_NE(mgb, nullptr);
    EXPECT_EQ(mgb->name(), "MGB");

    ScaleAdapter* generic = find_adapter(adapters, mock_device("Kitchen", {"181d"}));
    ASSERT_NE(generic, nullptr);
    EXPECT_EQ(generic->name(), "Standard Weight Scale");
}

TEST(DefaultAdapterOrder, MatchingIsOrderIndependentAndCaseInsensitive) {
    const AdapterList adapters = default_adapter_order();
    ScaleAdapter* a = find_adapter(adapters, mock_device("x", {"180f", "FFB0"}));
    ScaleAdapter* b = find_adapter(adapters, mock_device("x", {"ffb0", "180F"}));
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
}

TEST(DefaultAdapterOrder, UnknownDeviceMatchesNothing) {
    const AdapterList adapters = default_adapter_order();
    EXPECT_EQ(find_adapter(adapters, mock_device("Toothbrush", {"180f"})), nullptr);
    EXPECT_EQ(find_adapter(adapters, BleDeviceInfo{}), nullptr);
}

TEST(DefaultAdapterOrder, DecodersIgnoreOtherVendorsFrames) {
    const std::map<std::string, uint8_t> own_marker{
        {"Renpho", 0x10}, {"Hoffen", 0xFA}, {"Inlife", 0x02}, {"MGB", 0xAC}};

    const AdapterList adapters = default_adapter_order();
    for (uint8_t marker : {0x10, 0xFA, 0x02, 0xAC}) {
        Frame f(19);
        f.u8(0, marker).u8(3, 0x20).u8(4, 0x03).u8(5, 0x01);
        for (size_t i = 6; i < f.bytes.size(); ++i) f.u8(i, 0x32);

        for (const auto& a : adapters) {
            const auto own = own_marker.find(a->name());
            if (own != own_marker.end() && own->second == marker) continue;
            a->reset();
            EXPECT_FALSE(a->parse_notification(f.bytes)) << a->name() << " decoded a frame starting with 0x"
                                                         << std::hex << int(marker);
        }
    }
}
