#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ble_transport.h"
#include "body_composition.h"
#include "scale_adapter.h"

enum class AcquisitionState {
    Idle,
    AwaitingLiveness,
    Scanning,
    Matched,
    Connecting,
    Subscribing,
    Accumulating,
    Complete,
    Disconnecting,
    Done,
    Error,
};

const char* state_name(AcquisitionState state);

struct AcquisitionOptions {
    std::optional<std::string> target_address;
    std::chrono::milliseconds scan_budget{15000};
    std::chrono::milliseconds read_budget{60000};

    // Every parsed reading, complete or not.
    std::function<void(const ScaleReading&)> on_live_data;
    // Every raw notification frame, before parsing.
    std::function<void(const ByteArray&, const std::string& address)> on_frame;
    std::function<void(AcquisitionState)> on_state;
};

struct AcquisitionResult {
    ScaleReading reading;
    ScaleAdapter* adapter = nullptr;  // owned by the adapter list
    std::string address;
};

// One scan -> match -> read -> disconnect cycle. Throws AcquisitionError.
AcquisitionResult acquire_reading(BleTransport& transport, const AdapterList& adapters,
                                  const AcquisitionOptions& options = {});

BodyComposition acquire_and_compute(BleTransport& transport, const AdapterList& adapters,
                                    const UserProfile& profile, const AcquisitionOptions& options = {});

struct DeviceListing {
    ScanEntry entry;
    std::string adapter;  // empty when nothing matched
};

// Liveness check, then one scan; each device is paired with its matching adapter.
std::vector<DeviceListing> scan_devices(BleTransport& transport, const AdapterList& adapters,
                                        std::chrono::milliseconds budget);
