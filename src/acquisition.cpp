#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>

#include "acquisition.h"
#include "acquisition_error.h"
#include "periodic_writer.h"
#include "wait_utils.h"

const char* state_name(AcquisitionState state) {
    switch (state) {
        case AcquisitionState::Idle:             return "idle";
        case AcquisitionState::AwaitingLiveness: return "awaiting-liveness";
        case AcquisitionState::Scanning:         return "scanning";
        case AcquisitionState::Matched:          return "matched";
        case AcquisitionState::Connecting:       return "connecting";
        case AcquisitionState::Subscribing:      return "subscribing";
        case AcquisitionState::Accumulating:     return "accumulating";
        case AcquisitionState::Complete:         return "complete";
        case AcquisitionState::Disconnecting:    return "disconnecting";
        case AcquisitionState::Done:             return "done";
        case AcquisitionState::Error:            return "error";
    }
    return "unknown";
}

namespace {

std::string via(const BleTransport& transport) {
    return std::string(transport.kind()) == "local" ? "local Bluetooth adapter" : "BLE proxy";
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

class SessionGuard {
public:
    explicit SessionGuard(BleTransport& t) : t_(t) {}
    ~SessionGuard() { t_.end_session(); }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

private:
    BleTransport& t_;
};

// Disconnects on scope exit once armed.
class ConnectionGuard {
public:
    explicit ConnectionGuard(BleTransport& t) : t_(t) {}
    ~ConnectionGuard() { release(); }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

    void arm() { armed_ = true; }

    void release() noexcept {
        if (!armed_) return;
        armed_ = false;
        try {
            t_.set_disconnect_handler(nullptr);
        } catch (const std::exception& e) {
            std::cerr << "[Sync] " << e.what() << std::endl;
        }
        t_.disconnect();
    }

private:
    BleTransport& t_;
    bool armed_ = false;
};

struct Match {
    ScaleAdapter* adapter = nullptr;
    ScanEntry entry;
};

// Shared with the frame callback, which may still be running on a library
// thread after the acquisition returned.
struct ReadState {
    std::mutex mtx;
    ScaleAdapter* adapter = nullptr;
    std::string address;
    PendingReply<ScaleReading> done;
    std::function<void(const ScaleReading&)> on_live_data;
    std::function<void(const ByteArray&, const std::string&)> on_frame;
};

class Acquisition {
public:
    Acquisition(BleTransport& transport, const AdapterList& adapters, const AcquisitionOptions& options)
        : transport_(transport), adapters_(adapters), options_(options),
          started_(std::chrono::steady_clock::now()) {}

    AcquisitionResult run();

private:
    void enter(AcquisitionState next) {
        state_ = next;
        if (options_.on_state) options_.on_state(next);
    }

    Match scan_for_match();
    ScaleAdapter* match_connected(const std::string& address, const std::vector<CharacteristicInfo>& chars);
    ScaleReading read_until_complete(ScaleAdapter& adapter, const std::string& address,
                                     const std::vector<CharacteristicInfo>& chars, ConnectionGuard& link);

    BleTransport& transport_;
    const AdapterList& adapters_;
    const AcquisitionOptions& options_;
    std::chrono::steady_clock::time_point started_;
    AcquisitionState state_ = AcquisitionState::Idle;
};

Match Acquisition::scan_for_match() {
    const auto& target = options_.target_address;
    std::optional<Match> match;

    auto consider = [&](const ScanEntry& e) {
        if (target && !same_address(e.address, *target)) return false;
        const BleDeviceInfo info = e.device_info();
        if (ScaleAdapter* a = target ? find_adapter_for_target(adapters_, info) : find_adapter(adapters_, info)) {
            match = Match{a, e};
            return true;
        }
        return false;
    };

    std::cout << "[Sync] Scanning for BLE devices via " << via(transport_) << "..." << std::endl;
    const std::vector<ScanEntry> entries = transport_.scan(options_.scan_budget, consider);

    // Names and manufacturer data may only have arrived in later advertisements
    if (!match) {
        for (const auto& e : entries) {
            if (consider(e)) break;
        }
    }

    if (!match) {
        std::string msg = "No recognized scale found via " + via(transport_) + ". ";
        if (target) msg += "Target " + *target + " was not matched. ";
        msg += "Scanned " + std::to_string(entries.size()) + " device(s). Adapters: " + adapter_names(adapters_);
        throw AcquisitionError(AcquisitionErrorKind::NoMatch, msg);
    }
    return *match;
}

ScaleAdapter* Acquisition::match_connected(const std::string& address, const std::vector<CharacteristicInfo>& chars) {
    BleDeviceInfo info;
    for (const auto& c : chars) info.service_uuids.push_back(c.uuid);
    if (ScaleAdapter* a = find_adapter(adapters_, info)) return a;

    // Scan to get the device name for adapter matching
    std::cout << "[Sync] No adapter matched by characteristics, scanning for the device name..." << std::endl;
    transport_.scan(options_.scan_budget, [&](const ScanEntry& e) {
        if (!same_address(e.address, address)) return false;
        info.local_name = e.name;
        return true;
    });
    if (ScaleAdapter* a = find_adapter_for_target(adapters_, info)) return a;

    throw AcquisitionError(AcquisitionErrorKind::NoMatch,
                           "Device found (" + (info.local_name.empty() ? address : info.local_name) +
                               ") but no adapter recognized it. Char UUIDs: [" + join(info.service_uuids) +
                               "]. Adapters: " + adapter_names(adapters_));
}

ScaleReading Acquisition::read_until_complete(ScaleAdapter& adapter, const std::string& address,
                                              const std::vector<CharacteristicInfo>& chars, ConnectionGuard& link) {
    enter(AcquisitionState::Subscribing);

    const std::string& notify = adapter.notify_char_uuid();
    if (notify.empty()) {
        throw AcquisitionError(AcquisitionErrorKind::Transport,
                               "Adapter " + adapter.name() + " has no notification characteristic for " + address);
    }
    const bool present = std::any_of(chars.begin(), chars.end(),
                                     [&](const CharacteristicInfo& c) { return c.uuid == notify; });
    if (!present) {
        std::vector<std::string> uuids;
        for (const auto& c : chars) uuids.push_back(c.uuid);
        throw AcquisitionError(AcquisitionErrorKind::Transport,
                               "Target characteristic " + notify + " not found on " + address + ". Char UUIDs: [" +
                                   join(uuids) + "]");
    }

    auto st = std::make_shared<ReadState>();
    st->adapter = &adapter;
    st->address = address;
    st->on_live_data = options_.on_live_data;
    st->on_frame = options_.on_frame;

    const auto started = started_;
    const std::string adapter_name = adapter.name();
    PendingReply<ScaleReading> done = st->done;
    transport_.set_disconnect_handler([done, address, adapter_name, started]() {
        done.set_error(AcquisitionError(AcquisitionErrorKind::Disconnected,
                                        address + " disconnected before reading completed (adapter " +
                                            adapter_name + ", after " + format_elapsed(started) + ")"));
    });

    Subscription sub = transport_.subscribe(notify, [st](const ByteArray& data) {
        try {
            if (st->on_frame) st->on_frame(data, st->address);
            std::optional<ScaleReading> reading;
            bool complete = false;
            {
                std::lock_guard<std::mutex> lk(st->mtx);
                reading = st->adapter->parse_notification(data);
                if (reading) complete = st->adapter->is_complete(*reading);
            }
            if (!reading) return;
            if (st->on_live_data) st->on_live_data(*reading);
            if (complete) st->done.set_value(*reading);
        } catch (const std::exception& e) {
            st->done.set_error(AcquisitionError(AcquisitionErrorKind::Transport,
                                                std::string("Frame handling failed: ") + e.what()));
        }
    });

    adapter.on_connected(transport_);

    std::unique_ptr<PeriodicWriter> unlock;
    if (!adapter.unlock_command().empty() && !adapter.write_char_uuid().empty() &&
        adapter.unlock_interval().count() > 0) {
        unlock = std::make_unique<PeriodicWriter>(transport_, adapter.write_char_uuid(), adapter.unlock_command(),
                                                  adapter.unlock_interval());
    }

    enter(AcquisitionState::Accumulating);
    std::cout << "[Sync] Waiting for a complete reading from " << address << " (" << adapter_name << ")..."
              << std::endl;
    const auto budget_sec = std::chrono::duration_cast<std::chrono::seconds>(options_.read_budget).count();
    const ScaleReading reading = done.wait_for(
        options_.read_budget, "No complete reading from " + address + " within " + std::to_string(budget_sec) +
                                  "s (adapter " + adapter_name + "). Step on the scale and stay still until it finishes.");

    enter(AcquisitionState::Complete);
    unlock.reset();
    sub.release();

    enter(AcquisitionState::Disconnecting);
    link.release();
    return reading;
}

AcquisitionResult Acquisition::run() {
    enter(AcquisitionState::AwaitingLiveness);
    transport_.ensure_ready();

    const auto& target = options_.target_address;
    ConnectionGuard link(transport_);
    ScaleAdapter* adapter = nullptr;
    std::string address;
    std::optional<std::vector<CharacteristicInfo>> chars;
    ScanEntry entry;

    if (target && transport_.prefers_connect_first()) {
        enter(AcquisitionState::Connecting);
        address = *target;
        chars = transport_.connect(address, std::nullopt);
        link.arm();
        adapter = match_connected(address, *chars);
    } else {
        enter(AcquisitionState::Scanning);
        Match m = scan_for_match();
        adapter = m.adapter;
        entry = std::move(m.entry);
        address = entry.address;
    }

    enter(AcquisitionState::Matched);
    std::cout << "[Sync] Matched adapter: " << adapter->name() << " ("
              << (entry.name.empty() ? address : entry.name) << ")" << std::endl;
    transport_.on_scale_matched(address);

    if (!chars) {
        if (adapter->supports_broadcast() && entry.manufacturer) {
            if (auto reading = adapter->parse_broadcast(entry.manufacturer->data)) {
                std::cout << "[Sync] Broadcast reading: " << reading->weight << " kg (no GATT connection needed)"
                          << std::endl;
                if (options_.on_live_data) options_.on_live_data(*reading);
                enter(AcquisitionState::Complete);
                enter(AcquisitionState::Done);
                return AcquisitionResult{*reading, adapter, address};
            }
        }
        enter(AcquisitionState::Connecting);
        chars = transport_.connect(address, entry.addr_type);
        link.arm();
    }

    const ScaleReading reading = read_until_complete(*adapter, address, *chars, link);
    enter(AcquisitionState::Done);
    std::cout << "[Sync] Reading complete: " << reading.weight << " kg, " << reading.impedance << " ohm ("
              << format_elapsed(started_) << ")" << std::endl;
    return AcquisitionResult{reading, adapter, address};
}

}  // namespace

AcquisitionResult acquire_reading(BleTransport& transport, const AdapterList& adapters,
                                  const AcquisitionOptions& options) {
    for (const auto& a : adapters) a->reset();
    SessionGuard session(transport);
    try {
        return Acquisition(transport, adapters, options).run();
    } catch (const std::exception&) {
        if (options.on_state) options.on_state(AcquisitionState::Error);
        throw;
    }
}

BodyComposition acquire_and_compute(BleTransport& transport, const AdapterList& adapters,
                                    const UserProfile& profile, const AcquisitionOptions& options) {
    const AcquisitionResult result = acquire_reading(transport, adapters, options);
    return result.adapter->compute_metrics(result.reading, profile);
}

std::vector<DeviceListing> scan_devices(BleTransport& transport, const AdapterList& adapters,
                                        std::chrono::milliseconds budget) {
    SessionGuard session(transport);
    transport.ensure_ready();

    std::vector<DeviceListing> out;
    for (auto& e : transport.scan(budget, nullptr)) {
        DeviceListing d;
        d.entry = std::move(e);
        if (ScaleAdapter* a = find_adapter(adapters, d.entry.device_info())) d.adapter = a->name();
        out.push_back(std::move(d));
    }
    return out;
}
