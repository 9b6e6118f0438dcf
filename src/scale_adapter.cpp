#include <algorithm>
#include <iterator>

#include "scale_adapter.h"

ScaleAdapter::ScaleAdapter(AdapterProfile profile) : profile_(std::move(profile)) {
    for (auto& n : profile_.names) n.text = to_lower(n.text);
    for (auto& s : profile_.services) s = normalize_uuid(s);
    if (!profile_.notify_char.empty()) profile_.notify_char = normalize_uuid(profile_.notify_char);
    if (!profile_.write_char.empty()) profile_.write_char = normalize_uuid(profile_.write_char);
}

bool ScaleAdapter::matches(const BleDeviceInfo& info) const {
    return name_matches(info.local_name) || service_matches(info.service_uuids);
}

bool ScaleAdapter::name_matches(const std::string& local_name) const {
    if (local_name.empty()) return false;
    const std::string name = to_lower(local_name);
    for (const auto& p : profile_.names) {
        switch (p.kind) {
            case NameMatch::Exact:
                if (name == p.text) return true;
                break;
            case NameMatch::Prefix:
                if (name.rfind(p.text, 0) == 0) return true;
                break;
            case NameMatch::Contains:
                if (name.find(p.text) != std::string::npos) return true;
                break;
        }
    }
    return false;
}

bool ScaleAdapter::service_matches(const std::vector<std::string>& advertised) const {
    for (const auto& uuid : advertised) {
        const std::string norm = normalize_uuid(uuid);
        if (std::find(profile_.services.begin(), profile_.services.end(), norm) != profile_.services.end()) {
            return true;
        }
    }
    return false;
}

BodyComposition ScaleAdapter::compute_metrics(const ScaleReading& reading, const UserProfile& profile) const {
    return build_body_composition(reading, profile, vendor_);
}

std::optional<ScaleReading> ScaleAdapter::parse_broadcast(const ByteArray& manufacturer_data) const {
    (void)manufacturer_data;
    return std::nullopt;
}

std::string adapter_names(const AdapterList& adapters) {
    std::string out;
    for (const auto& a : adapters) {
        if (!out.empty()) out += ", ";
        out += a->name();
    }
    return out;
}

ScaleAdapter* find_adapter(const AdapterList& adapters, const BleDeviceInfo& info) {
    for (const auto& a : adapters) {
        if (a->matches(info)) return a.get();
    }
    return nullptr;
}

ScaleAdapter* find_adapter_for_target(const AdapterList& adapters, const BleDeviceInfo& info) {
    if (ScaleAdapter* a = find_adapter(adapters, info)) return a;
    for (const auto& a : adapters) {
        if (a->matches_by_address()) return a.get();
    }
    return nullptr;
}

bool has_vendor_marker(const ByteArray& data) {
    static constexpr uint8_t MARKERS[] = {0x10, 0xFA, 0x02, 0xAC};
    if (data.empty()) return false;
    return std::find(std::begin(MARKERS), std::end(MARKERS), data[0]) != std::end(MARKERS);
}
