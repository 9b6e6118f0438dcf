#include "scale_adapters.h"

namespace {

constexpr uint8_t MAGIC = 0xFA;
constexpr size_t MIN_LEN = 8;
constexpr size_t BODY_COMP_LEN = 19;

}  // namespace

HoffenAdapter::HoffenAdapter()
    : ScaleAdapter(AdapterProfile{
          "Hoffen",
          {{NameMatch::Exact, "hoffen bs-8107"}},
          {},
          "ffb2",
          "ffb1",
          {},
          std::chrono::milliseconds(0),
      }) {}

std::optional<ScaleReading> HoffenAdapter::parse_notification(const ByteArray& data) {
    if (data.size() < MIN_LEN || data[0] != MAGIC) return std::nullopt;

    const double weight = read_u16_le(data, 3) / 10.0;
    if (weight <= 0.0) return std::nullopt;

    // [5] == 0 means the feet touched the BIA electrodes
    if (data[5] == 0x00 && data.size() >= BODY_COMP_LEN) {
        vendor_.fat_percent = read_u16_le(data, 6) / 10.0;
        vendor_.water_percent = read_u16_le(data, 8) / 10.0;
        vendor_.muscle_percent = read_u16_le(data, 10) / 10.0;
        vendor_.bone_mass = data[14] / 10.0;
        vendor_.visceral_fat = read_u16_le(data, 17) / 10.0;
    }

    return ScaleReading{weight, 0};
}
