#include "scale_adapters.h"

namespace {

constexpr uint8_t FLAG_IMPERIAL = 0x01;
constexpr uint8_t FLAGS_RESERVED = 0xF0;
constexpr double KG_PER_LB = 0.45359237;

}  // namespace

StandardWeightScaleAdapter::StandardWeightScaleAdapter()
    : ScaleAdapter(AdapterProfile{
          "Standard Weight Scale",
          {},
          {"181d", "181b"},
          "2a9d",
          "",
          {},
          std::chrono::milliseconds(0),
      }) {}

// Weight Measurement (0x2A9D): flags, uint16 weight, optional fields follow.
std::optional<ScaleReading> StandardWeightScaleAdapter::parse_notification(const ByteArray& data) {
    if (data.size() < 3 || (data[0] & FLAGS_RESERVED)) return std::nullopt;

    const uint16_t raw = read_u16_le(data, 1);
    const double weight = (data[0] & FLAG_IMPERIAL) ? raw * 0.01 * KG_PER_LB : raw * 0.005;
    if (weight <= 0.0) return std::nullopt;
    return ScaleReading{weight, 0};
}
