#include "scale_adapters.h"

namespace {

constexpr size_t PAYLOAD_LEN = 19;
constexpr size_t WEIGHT_OFFSET = 17;

}  // namespace

ChipseaBroadcastAdapter::ChipseaBroadcastAdapter()
    : ScaleAdapter(AdapterProfile{
          "Chipsea Broadcast",
          {},
          {},
          "",
          "",
          {},
          std::chrono::milliseconds(0),
      }) {}

bool ChipseaBroadcastAdapter::matches(const BleDeviceInfo& info) const {
    return info.manufacturer_data && info.manufacturer_data->id == MANUFACTURER_ID &&
           info.manufacturer_data->data.size() >= PAYLOAD_LEN;
}

std::optional<ScaleReading> ChipseaBroadcastAdapter::parse_notification(const ByteArray& data) {
    (void)data;
    return std::nullopt;
}

std::optional<ScaleReading> ChipseaBroadcastAdapter::parse_broadcast(const ByteArray& manufacturer_data) const {
    if (manufacturer_data.size() < PAYLOAD_LEN) return std::nullopt;
    const double weight = read_u16_le(manufacturer_data, WEIGHT_OFFSET) / 100.0;
    if (weight <= 0.0) return std::nullopt;
    return ScaleReading{weight, 0};
}
