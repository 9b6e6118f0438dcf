#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <iostream>

#include "ble_types.h"

namespace {

constexpr const char* BT_BASE_UUID_SUFFIX = "00001000800000805f9b34fb";

bool is_hex_char(unsigned char c) {
    return std::isxdigit(c) != 0;
}

int hex_value(unsigned char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<unsigned char>(std::tolower(c));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}  // namespace

BleDeviceInfo ScanEntry::device_info() const {
    BleDeviceInfo info;
    info.local_name = name;
    info.service_uuids.reserve(services.size());
    for (const auto& s : services) info.service_uuids.push_back(normalize_uuid(s));
    if (manufacturer && !manufacturer->data.empty()) info.manufacturer_data = manufacturer;
    return info;
}

std::string to_lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

std::string to_upper(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return v;
}

std::string trim(std::string s) {
    auto isspace2 = [](unsigned char ch){ return std::isspace(ch) != 0; };
    size_t start = 0;
    while (start < s.size() && isspace2(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && isspace2(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool iequals_ascii(const std::string& a, const char* b) {
    size_t n = a.size();
    size_t m = std::strlen(b);
    if (n != m) return false;
    for (size_t i = 0; i < n; ++i) {
        unsigned char ca = static_cast<unsigned char>(a[i]);
        unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) return false;
    }
    return true;
}

bool canonicalize_mac(const std::string& in, std::string& out) {
    // Strip non-hex chars
    std::string hex;
    hex.reserve(12);
    for (unsigned char c : in) {
        if (is_hex_char(c)) hex.push_back(static_cast<char>(std::tolower(c)));
    }
    if (hex.size() != 12) return false;
    // Insert colons
    out.clear();
    out.reserve(17);
    for (size_t i = 0; i < 12; ++i) {
        out.push_back(hex[i]);
        if (i % 2 == 1 && i != 11) out.push_back(':');
    }
    return true;
}

bool same_address(const std::string& a, const std::string& b) {
    std::string ca, cb;
    if (canonicalize_mac(a, ca) && canonicalize_mac(b, cb)) return ca == cb;
    // Platform identifiers (e.g. CoreBluetooth UUIDs) are not MACs
    return to_lower(a) == to_lower(b);
}

std::string normalize_uuid(const std::string& uuid) {
    std::string s = to_lower(trim(uuid));
    if (s.rfind("0x", 0) == 0) s = s.substr(2);
    s.erase(std::remove(s.begin(), s.end(), '-'), s.end());
    if (s.size() == 4) return "0000" + s + BT_BASE_UUID_SUFFIX;
    if (s.size() == 8) return s + BT_BASE_UUID_SUFFIX;
    return s;
}

std::optional<ByteArray> hex_to_bytes(const std::string& hex) {
    if (hex.size() % 2 != 0) return std::nullopt;
    ByteArray out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(static_cast<unsigned char>(hex[i]));
        int lo = hex_value(static_cast<unsigned char>(hex[i + 1]));
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

void print_hex_bytes(const ByteArray& data, const std::string& devTag) {
    std::cout << "[" << devTag << "] (" << data.size() << " bytes): ";
    for (unsigned char c : data) {
        std::cout << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
                  << static_cast<int>(c) << " ";
    }
    std::cout << std::dec << std::nouppercase << std::setfill(' ') << std::endl;
}
