#include "scale_adapters.h"

namespace {

constexpr size_t FRAME_LEN = 15;
constexpr uint8_t NO_ANALYSIS = 0xFF;

}  // namespace

ExingtechY1Adapter::ExingtechY1Adapter()
    : ScaleAdapter(AdapterProfile{
          "Exingtech Y1",
          {{NameMatch::Exact, "vscale"}},
          {"f433bd80-75b8-11e2-97d9-0002a5d5c51b"},
          "1a2ea400-75b9-11e2-be05-0002a5d5c51b",
          "29f11080-75b9-11e2-8bf6-0002a5d5c51b",
          {},
          std::chrono::milliseconds(0),
      }) {}

std::optional<ScaleReading> ExingtechY1Adapter::parse_notification(const ByteArray& data) {
    if (data.size() < FRAME_LEN || has_vendor_marker(data)) return std::nullopt;

    const double weight = read_u16_be(data, 4) / 10.0;
    if (weight <= 0.0) return std::nullopt;

    if (data[6] != NO_ANALYSIS) {
        vendor_.fat_percent = read_u16_be(data, 6) / 10.0;
        vendor_.water_percent = read_u16_be(data, 8) / 10.0;
        vendor_.bone_mass = read_u16_be(data, 10) / 10.0;
        vendor_.muscle_percent = read_u16_be(data, 12) / 10.0;
        vendor_.visceral_fat = data[14];
    }
    return ScaleReading{weight, 0};
}

bool ExingtechY1Adapter::is_complete(const ScaleReading& reading) const {
    return reading.weight > 0.0 && vendor_.fat_percent.value_or(0.0) > 0.0;
}
