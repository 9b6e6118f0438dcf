#include "scale_adapters.h"

namespace {

constexpr size_t FRAME1_LEN = 15;
constexpr size_t FRAME2_LEN = 10;

bool is_frame1(const ByteArray& d) {
    return d.size() >= FRAME1_LEN && d[0] == 0xAC && (d[1] == 0x02 || d[1] == 0x03) && d[2] == 0xFF;
}

bool is_frame2(const ByteArray& d) {
    return d.size() >= FRAME2_LEN && d[0] == 0x01 && d[1] == 0x00;
}

}  // namespace

MgbAdapter::MgbAdapter()
    : ScaleAdapter(AdapterProfile{
          "MGB",
          {{NameMatch::Prefix, "swan"}, {NameMatch::Exact, "icomon"}, {NameMatch::Exact, "yg"}},
          {"ffb0"},
          "ffb2",
          "ffb1",
          {},
          std::chrono::milliseconds(0),
      }) {}

std::optional<ScaleReading> MgbAdapter::parse_notification(const ByteArray& data) {
    if (is_frame1(data)) {
        const double weight = read_u16_be(data, 9) / 10.0;
        if (weight <= 0.0) return std::nullopt;
        cached_weight_ = weight;
        vendor_.fat_percent = read_u16_be(data, 13) / 10.0;
        return ScaleReading{weight, 0};
    }

    if (is_frame2(data)) {
        vendor_.muscle_percent = read_u16_le(data, 2) / 10.0;
        vendor_.bone_mass = read_u16_le(data, 6) / 10.0;
        vendor_.water_percent = read_u16_le(data, 8) / 10.0;
        // Frame 2 carries no weight of its own
        if (cached_weight_ <= 0.0) return std::nullopt;
        return ScaleReading{cached_weight_, 0};
    }

    return std::nullopt;
}

bool MgbAdapter::is_complete(const ScaleReading& reading) const {
    return reading.weight > 0.0 && vendor_.fat_percent.value_or(0.0) > 0.0;
}

void MgbAdapter::reset() {
    ScaleAdapter::reset();
    cached_weight_ = 0.0;
}
