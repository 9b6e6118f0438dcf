#include "scale_adapters.h"

namespace {

constexpr size_t WEIGHT_LEN = 6;
constexpr size_t COMPOSITION_LEN = 16;

// Weight and bone mass are sent in 50 g steps.
double grams50_to_kg(uint16_t raw) {
    return raw * 50.0 / 1000.0;
}

}  // namespace

BeurerSanitasAdapter::BeurerSanitasAdapter()
    : ScaleAdapter(AdapterProfile{
          "Beurer/Sanitas",
          {
              {NameMatch::Exact, "bf-700"},
              {NameMatch::Exact, "beurer bf700"},
              {NameMatch::Exact, "bf-800"},
              {NameMatch::Exact, "beurer bf800"},
              {NameMatch::Exact, "rt-libra-b"},
              {NameMatch::Exact, "rt-libra-w"},
              {NameMatch::Exact, "libra-b"},
              {NameMatch::Exact, "libra-w"},
              {NameMatch::Exact, "bf700"},
              {NameMatch::Exact, "beurer bf710"},
              {NameMatch::Exact, "sanitas sbf70"},
              {NameMatch::Exact, "sbf75"},
              {NameMatch::Exact, "aicdscale1"},
          },
          {},
          "ffe1",
          "ffe1",
          {},
          std::chrono::milliseconds(0),
      }) {}

// [0-3] timestamp, [4-5] weight; the long frame appends the analysis.
std::optional<ScaleReading> BeurerSanitasAdapter::parse_notification(const ByteArray& data) {
    if (data.size() < WEIGHT_LEN || has_vendor_marker(data)) return std::nullopt;

    ScaleReading r;
    r.weight = grams50_to_kg(read_u16_be(data, 4));
    if (r.weight <= 0.0) return std::nullopt;

    if (data.size() >= COMPOSITION_LEN) {
        r.impedance = read_u16_be(data, 6);
        vendor_.fat_percent = read_u16_be(data, 8) / 10.0;
        vendor_.water_percent = read_u16_be(data, 10) / 10.0;
        vendor_.muscle_percent = read_u16_be(data, 12) / 10.0;
        vendor_.bone_mass = grams50_to_kg(read_u16_be(data, 14));
    }
    return r;
}
