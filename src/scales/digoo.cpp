#include "scale_adapters.h"

namespace {

constexpr size_t FRAME_LEN = 19;
constexpr uint8_t CTRL_STABLE = 0x01;
constexpr uint8_t CTRL_ALL_VALUES = 0x02;

}  // namespace

DigooAdapter::DigooAdapter()
    : ScaleAdapter(AdapterProfile{
          "Digoo",
          {{NameMatch::Exact, "mengii"}},
          {},
          "fff1",
          "fff2",
          {},
          std::chrono::milliseconds(0),
      }) {}

std::optional<ScaleReading> DigooAdapter::parse_notification(const ByteArray& data) {
    if (data.size() < FRAME_LEN || has_vendor_marker(data)) return std::nullopt;

    const double weight = read_u16_be(data, 3) / 100.0;
    if (weight <= 0.0) return std::nullopt;

    const uint8_t control = data[5];
    stable_ = (control & CTRL_STABLE) != 0;
    all_values_ = (control & CTRL_ALL_VALUES) != 0;

    if (all_values_) {
        vendor_.fat_percent = read_u16_be(data, 6) / 10.0;
        vendor_.visceral_fat = data[10] / 10.0;
        vendor_.water_percent = read_u16_be(data, 11) / 10.0;
        vendor_.muscle_percent = read_u16_be(data, 16) / 10.0;
        vendor_.bone_mass = data[18] / 10.0;
    }

    return ScaleReading{weight, 0};
}

bool DigooAdapter::is_complete(const ScaleReading& reading) const {
    return reading.weight > 0.0 && stable_ && all_values_;
}

void DigooAdapter::reset() {
    ScaleAdapter::reset();
    stable_ = false;
    all_values_ = false;
}
