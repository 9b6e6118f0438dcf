#pragma once

#include "../scale_adapter.h"

// Renpho / QN family. Weight and impedance arrive in the same 0x10 frame, the
// scale only streams after a periodic unlock write.
struct RenphoOptions {
    std::string notify_char = "ffe1";
    std::string write_char = "ffe3";
    ByteArray unlock_command{0x13, 0x09, 0x15, 0x01, 0x10, 0x00, 0x00, 0x00, 0x42};
};

class RenphoAdapter : public ScaleAdapter {
public:
    explicit RenphoAdapter(const RenphoOptions& opts = {});
    bool matches_by_address() const override { return true; }
    std::optional<ScaleReading> parse_notification(const ByteArray& data) override;
    bool is_complete(const ScaleReading& reading) const override;
};

class DigooAdapter : public ScaleAdapter {
public:
    DigooAdapter();
    std::optional<ScaleReading> parse_notification(const ByteArray& data) override;
    bool is_complete(const ScaleReading& reading) const override;
    void reset() override;

private:
    bool stable_ = false;
    bool all_values_ = false;
};

class HoffenAdapter : public ScaleAdapter {
public:
    HoffenAdapter();
    std::optional<ScaleReading> parse_notification(const ByteArray& data) override;
};

class BeurerSanitasAdapter : public ScaleAdapter {
public:
    BeurerSanitasAdapter();
    std::optional<ScaleReading> parse_notification(const ByteArray& data) override;
};

class ExingtechY1Adapter : public ScaleAdapter {
public:
    ExingtechY1Adapter();
    std::optional<ScaleReading> parse_notification(const ByteArray& data) override;
    bool is_complete(const ScaleReading& reading) const override;
};

// Advertises the weight in manufacturer data; never needs a connection.
class ChipseaBroadcastAdapter : public ScaleAdapter {
public:
    static constexpr uint16_t MANUFACTURER_ID = 0xFFFF;

    ChipseaBroadcastAdapter();
    bool matches(const BleDeviceInfo& info) const override;
    std::optional<ScaleReading> parse_notification(const ByteArray& data) override;
    bool supports_broadcast() const override { return true; }
    std::optional<ScaleReading> parse_broadcast(const ByteArray& manufacturer_data) const override;
};

// Two frame shapes: AC 02|03 FF (weight, fat) then 01 00 (muscle, bone, water).
class MgbAdapter : public ScaleAdapter {
public:
    MgbAdapter();
    std::optional<ScaleReading> parse_notification(const ByteArray& data) override;
    bool is_complete(const ScaleReading& reading) const override;
    void reset() override;

private:
    double cached_weight_ = 0.0;
};

class InlifeAdapter : public ScaleAdapter {
public:
    InlifeAdapter();
    std::optional<ScaleReading> parse_notification(const ByteArray& data) override;
};

// Bluetooth SIG Weight Scale / Body Composition services. Catch-all, must
// stay last in the priority order.
class StandardWeightScaleAdapter : public ScaleAdapter {
public:
    StandardWeightScaleAdapter();
    std::optional<ScaleReading> parse_notification(const ByteArray& data) override;
};

// Priority order used for matching: vendor-specific adapters first, the
// generic catch-all last.
AdapterList default_adapter_order(const RenphoOptions& renpho = {});
