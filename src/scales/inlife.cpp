#include <algorithm>
#include <limits>

#include "scale_adapters.h"

namespace {

constexpr uint8_t MARKER = 0x02;
constexpr size_t FRAME_LEN = 14;

}  // namespace

InlifeAdapter::InlifeAdapter()
    : ScaleAdapter(AdapterProfile{
          "Inlife",
          {
              {NameMatch::Exact, "000fatscale01"},
              {NameMatch::Exact, "000fatscale02"},
              {NameMatch::Exact, "042fatscale01"},
          },
          {"fff0"},
          "fff1",
          "fff2",
          {},
          std::chrono::milliseconds(0),
      }) {}

std::optional<ScaleReading> InlifeAdapter::parse_notification(const ByteArray& data) {
    if (data.size() < FRAME_LEN || data[0] != MARKER) return std::nullopt;

    ScaleReading r;
    r.weight = read_u16_be(data, 2) / 10.0;
    if (r.weight <= 0.0) return std::nullopt;

    const uint8_t mode = data[11];
    if (mode == 0x80 || mode == 0x81) {
        const uint32_t raw = read_u32_be(data, 4);
        r.impedance = static_cast<int>(std::min<uint32_t>(raw, std::numeric_limits<int>::max()));
    } else {
        // Legacy firmware computes visceral fat on the scale
        vendor_.visceral_fat = read_u16_be(data, 7) / 10.0;
    }
    return r;
}
