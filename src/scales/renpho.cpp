#include "scale_adapters.h"

namespace {

constexpr uint8_t WEIGHT_FRAME = 0x10;
constexpr size_t WEIGHT_FRAME_LEN = 10;

}  // namespace

RenphoAdapter::RenphoAdapter(const RenphoOptions& opts)
    : ScaleAdapter(AdapterProfile{
          "Renpho",
          {{NameMatch::Prefix, "qn-scale"}, {NameMatch::Prefix, "renpho"}},
          {},
          opts.notify_char,
          opts.write_char,
          opts.unlock_command,
          std::chrono::milliseconds(2000),
      }) {}

std::optional<ScaleReading> RenphoAdapter::parse_notification(const ByteArray& data) {
    if (data.size() < WEIGHT_FRAME_LEN || data[0] != WEIGHT_FRAME) return std::nullopt;

    ScaleReading r;
    r.weight = read_u16_be(data, 3) / 100.0;
    r.impedance = read_u16_be(data, 8);
    if (r.weight <= 0.0) return std::nullopt;
    return r;
}

// The weight settles before the impedance sweep finishes; wait for both.
bool RenphoAdapter::is_complete(const ScaleReading& reading) const {
    return reading.weight > 10.0 && reading.impedance > 200;
}
