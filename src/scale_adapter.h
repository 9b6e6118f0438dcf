#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ble_types.h"
#include "body_composition.h"

enum class NameMatch { Exact, Prefix, Contains };

struct NamePattern {
    NameMatch kind;
    std::string text;  // lowercase
};

// Characteristic access an adapter may use once connected.
class GattChannel {
public:
    virtual ~GattChannel() = default;
    virtual void write(const std::string& char_uuid, const ByteArray& data, bool with_response) = 0;
    virtual ByteArray read(const std::string& char_uuid) = 0;
};

// Static description of a vendor: how it advertises and which
// characteristics carry its protocol.
struct AdapterProfile {
    std::string name;
    std::vector<NamePattern> names;
    std::vector<std::string> services;
    std::string notify_char;
    std::string write_char;
    ByteArray unlock_command;
    std::chrono::milliseconds unlock_interval{0};
};

class ScaleAdapter {
public:
    explicit ScaleAdapter(AdapterProfile profile);
    virtual ~ScaleAdapter() = default;

    ScaleAdapter(const ScaleAdapter&) = delete;
    ScaleAdapter& operator=(const ScaleAdapter&) = delete;

    const std::string& name() const { return profile_.name; }
    const std::string& notify_char_uuid() const { return profile_.notify_char; }
    const std::string& write_char_uuid() const { return profile_.write_char; }
    const ByteArray& unlock_command() const { return profile_.unlock_command; }
    std::chrono::milliseconds unlock_interval() const { return profile_.unlock_interval; }

    // Name patterns (case-insensitive) or advertised service membership.
    virtual bool matches(const BleDeviceInfo& info) const;

    // Claims a device the caller picked by address when no name or service
    // matched.
    virtual bool matches_by_address() const { return false; }

    // Decode one notification. std::nullopt means "not a weight frame".
    virtual std::optional<ScaleReading> parse_notification(const ByteArray& data) = 0;

    virtual bool is_complete(const ScaleReading& reading) const { return reading.weight > 0.0; }

    virtual BodyComposition compute_metrics(const ScaleReading& reading, const UserProfile& profile) const;

    virtual bool supports_broadcast() const { return false; }
    virtual std::optional<ScaleReading> parse_broadcast(const ByteArray& manufacturer_data) const;

    // Runs after the notify subscription is active.
    virtual void on_connected(GattChannel& gatt) { (void)gatt; }

    // Drops every value cached from earlier frames.
    virtual void reset() { vendor_.clear(); }

protected:
    bool name_matches(const std::string& local_name) const;
    bool service_matches(const std::vector<std::string>& advertised) const;

    AdapterProfile profile_;
    VendorComposition vendor_;
};

using AdapterList = std::vector<std::unique_ptr<ScaleAdapter>>;

std::string adapter_names(const AdapterList& adapters);

// First adapter (in list order) that matches, or nullptr.
ScaleAdapter* find_adapter(const AdapterList& adapters, const BleDeviceInfo& info);

// Like find_adapter, for a device whose address the caller asked for: falls
// back to the first adapter that accepts a bare address.
ScaleAdapter* find_adapter_for_target(const AdapterList& adapters, const BleDeviceInfo& info);

// Byte 0 is the marker of a vendor that tags its frames (Renpho, Hoffen,
// Inlife, MGB). Decoders without a marker skip such frames.
bool has_vendor_marker(const ByteArray& data);
