#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Raw frame bytes as delivered by a transport (notification, read response,
// manufacturer data).
using ByteArray = std::vector<uint8_t>;

struct ManufacturerData {
    uint16_t id = 0;
    ByteArray data;
};

// Advertised identity used for adapter matching.
struct BleDeviceInfo {
    std::string local_name;
    std::vector<std::string> service_uuids;  // normalized
    std::optional<ManufacturerData> manufacturer_data;
};

// One device as reported by a scan (local or proxied).
struct ScanEntry {
    std::string address;
    std::string name;
    int rssi = 0;
    std::vector<std::string> services;
    std::optional<int> addr_type;
    std::optional<ManufacturerData> manufacturer;

    BleDeviceInfo device_info() const;
};

struct CharacteristicInfo {
    std::string uuid;  // normalized
    std::vector<std::string> properties;
};

struct ScaleReading {
    double weight = 0.0;  // kg
    int impedance = 0;    // ohm, 0 = not measured
};

enum class Gender { Male, Female };

struct UserProfile {
    double height = 0.0;  // cm
    int age = 0;
    Gender gender = Gender::Male;
    bool is_athlete = false;
};

// String helpers shared by the transports, adapters and settings parser.
std::string to_lower(std::string v);
std::string to_upper(std::string v);
std::string trim(std::string s);
bool iequals_ascii(const std::string& a, const char* b);

// Convert input to canonical MAC "aa:bb:cc:dd:ee:ff" (lowercase).
// Accepts formats like "AA:BB:CC:DD:EE:FF", "aa-bb-cc-dd-ee-ff", or "AABBCCDDEEFF".
bool canonicalize_mac(const std::string& in, std::string& out);
bool same_address(const std::string& a, const std::string& b);

// 32 lowercase hex digits, no dashes. Short 16/32-bit forms are expanded over
// the Bluetooth base UUID.
std::string normalize_uuid(const std::string& uuid);

std::optional<ByteArray> hex_to_bytes(const std::string& hex);
void print_hex_bytes(const ByteArray& data, const std::string& devTag);

inline uint16_t read_u16_be(const ByteArray& b, size_t off) {
    return static_cast<uint16_t>((b[off] << 8) | b[off + 1]);
}

inline uint16_t read_u16_le(const ByteArray& b, size_t off) {
    return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

inline uint32_t read_u32_be(const ByteArray& b, size_t off) {
    return (static_cast<uint32_t>(b[off]) << 24) | (static_cast<uint32_t>(b[off + 1]) << 16) |
           (static_cast<uint32_t>(b[off + 2]) << 8) | static_cast<uint32_t>(b[off + 3]);
}
