#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <thread>

#include "acquisition_error.h"
#include "local_ble_transport.h"

namespace {

constexpr auto POWER_SETTLE = std::chrono::milliseconds(1500);
constexpr auto SCAN_POLL = std::chrono::milliseconds(200);

std::string mac_key(const std::string& address) {
    std::string mac;
    if (canonicalize_mac(address, mac)) return mac;
    // macOS reports UUID identifiers instead of MACs
    return to_lower(address);
}

ByteArray to_bytes(const SimpleBLE::ByteArray& data) {
    return ByteArray(data.begin(), data.end());
}

SimpleBLE::ByteArray to_simpleble(const ByteArray& data) {
    return SimpleBLE::ByteArray(std::string(data.begin(), data.end()));
}

ScanEntry entry_from_peripheral(SimpleBLE::Peripheral& p) {
    ScanEntry e;
    e.address = p.address();
    e.name = p.identifier();
    e.rssi = p.rssi();
    for (auto& service : p.services()) e.services.push_back(normalize_uuid(service.uuid()));
    const auto mfr = p.manufacturer_data();
    if (!mfr.empty()) {
        e.manufacturer = ManufacturerData{mfr.begin()->first, to_bytes(mfr.begin()->second)};
    }
    return e;
}

// Later advertisements may carry the name or manufacturer data the first one lacked.
bool merge_entry(ScanEntry& into, const ScanEntry& from) {
    bool changed = false;
    if (into.name.empty() && !from.name.empty()) {
        into.name = from.name;
        changed = true;
    }
    if (from.manufacturer) {
        into.manufacturer = from.manufacturer;
        changed = true;
    }
    for (const auto& s : from.services) {
        if (std::find(into.services.begin(), into.services.end(), s) == into.services.end()) {
            into.services.push_back(s);
            changed = true;
        }
    }
    into.rssi = from.rssi;
    return changed;
}

}  // namespace

std::optional<SimpleBLE::Adapter> get_first_adapter() {
    try {
        auto adapters = SimpleBLE::Adapter::get_adapters();
        if (adapters.empty()) return std::nullopt;
        return adapters.front();
    } catch (const std::exception& e) {
        std::cerr << "[BLE] Adapter enumeration failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

// Extra teardown helper to ensure clean disconnects on WinRT
void clear_adapter_callbacks(SimpleBLE::Adapter& adapter) {
    adapter.set_callback_on_scan_found({});
    adapter.set_callback_on_scan_updated({});
    adapter.set_callback_on_scan_start({});
    adapter.set_callback_on_scan_stop({});
}

LocalBleTransport::~LocalBleTransport() {
    disconnect();
    end_session();
}

SimpleBLE::Adapter& LocalBleTransport::adapter() {
    if (!adapter_) {
        adapter_ = get_first_adapter();
        if (!adapter_) {
            throw AcquisitionError(AcquisitionErrorKind::UnavailableRadio, "No Bluetooth adapter found.");
        }
    }
    return *adapter_;
}

// power on -> power cycle -> power cycle after a longer settle
void LocalBleTransport::recover_power() {
    auto& a = adapter();
    for (int attempt = 1; attempt <= 3 && !a.is_powered(); ++attempt) {
        std::cerr << "[BLE] Adapter " << a.identifier() << " is not powered, recovery attempt " << attempt
                  << std::endl;
        try {
            if (attempt > 1) {
                a.power_off();
                std::this_thread::sleep_for(POWER_SETTLE * (attempt - 1));
            }
            a.power_on();
        } catch (const std::exception& e) {
            std::cerr << "[BLE] Power recovery failed: " << e.what() << std::endl;
        }
        std::this_thread::sleep_for(POWER_SETTLE);
    }
    if (!a.is_powered()) {
        std::cerr << "[BLE] Adapter still reports powered off; continuing anyway" << std::endl;
    }
}

void LocalBleTransport::ensure_ready() {
    if (!SimpleBLE::Adapter::bluetooth_enabled()) {
        std::cerr << "[BLE] Bluetooth is reported as disabled" << std::endl;
    }
    auto& a = adapter();
    recover_power();
    std::cout << "[BLE] Using adapter " << a.identifier() << " [" << a.address() << "]" << std::endl;
}

std::vector<ScanEntry> LocalBleTransport::scan(std::chrono::milliseconds budget, const ScanCallback& on_found) {
    auto& a = adapter();

    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::string> order;
    std::map<std::string, ScanEntry> entries;
    std::deque<ScanEntry> fresh;

    auto on_advert = [&](SimpleBLE::Peripheral p) {
        ScanEntry e;
        try {
            e = entry_from_peripheral(p);
        } catch (const std::exception& ex) {
            std::cerr << "[BLE] Ignoring advertisement: " << ex.what() << std::endl;
            return;
        }
        const std::string key = mac_key(e.address);
        {
            std::lock_guard<std::mutex> lk(mtx);
            auto it = entries.find(key);
            if (it == entries.end()) {
                order.push_back(key);
                entries.emplace(key, e);
                fresh.push_back(e);
            } else {
                merge_entry(it->second, e);
            }
        }
        {
            std::lock_guard<std::mutex> lk(mtx_);
            seen_[key] = p;
        }
        cv.notify_one();
    };

    a.set_callback_on_scan_found(on_advert);
    a.set_callback_on_scan_updated(on_advert);
    a.set_callback_on_scan_start([]() { std::cout << "[BLE] Scan started." << std::endl; });
    a.set_callback_on_scan_stop([]() { std::cout << "[BLE] Scan stopped." << std::endl; });

    try {
        a.scan_start();
    } catch (const std::exception& e) {
        clear_adapter_callbacks(a);
        throw AcquisitionError(AcquisitionErrorKind::Transport, std::string("Scan start failed: ") + e.what());
    }

    auto stop_scan = [&a]() {
        try {
            a.scan_stop();
        } catch (const std::exception& e) {
            std::cerr << "[BLE] Scan stop failed: " << e.what() << std::endl;
        }
        clear_adapter_callbacks(a);
    };

    const auto deadline = std::chrono::steady_clock::now() + budget;
    bool stop = false;
    try {
        while (!stop && std::chrono::steady_clock::now() < deadline) {
            std::deque<ScanEntry> batch;
            {
                std::unique_lock<std::mutex> lk(mtx);
                cv.wait_for(lk, SCAN_POLL, [&] { return !fresh.empty(); });
                batch.swap(fresh);
            }
            for (const auto& e : batch) {
                if (on_found && on_found(e)) {
                    stop = true;
                    break;
                }
            }
        }
    } catch (const std::exception&) {
        // The callbacks reference this frame
        stop_scan();
        throw;
    }
    stop_scan();

    std::lock_guard<std::mutex> lk(mtx);
    std::vector<ScanEntry> out;
    out.reserve(order.size());
    for (const auto& key : order) out.push_back(entries[key]);
    return out;
}

std::vector<CharacteristicInfo> LocalBleTransport::connect(const std::string& address, std::optional<int> addr_type) {
    (void)addr_type;
    const std::string key = mac_key(address);

    std::optional<SimpleBLE::Peripheral> target;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = seen_.find(key);
        if (it != seen_.end()) target = it->second;
    }
    if (!target) {
        std::cout << "[BLE] " << address << " not seen yet, scanning for it..." << std::endl;
        scan(std::chrono::seconds(15), [&](const ScanEntry& e) { return mac_key(e.address) == key; });
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = seen_.find(key);
        if (it == seen_.end()) {
            throw AcquisitionError(AcquisitionErrorKind::NoMatch,
                                   "Device " + address + " not found. Check that the scale is powered on and in range.");
        }
        target = it->second;
    }

    auto& p = *target;
    std::cout << "[BLE] -> Connecting: " << p.identifier() << " [" << p.address() << "]" << std::endl;
    try {
        p.connect();
    } catch (const std::exception& e) {
        throw AcquisitionError(AcquisitionErrorKind::Transport,
                               "Connection to " + address + " failed: " + e.what());
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        disconnecting_ = false;
        disconnect_fired_ = false;
    }
    p.set_callback_on_disconnected([this]() {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (disconnecting_) return;
            disconnect_fired_ = true;
            fn = on_disconnect_;
        }
        std::cerr << "[BLE] Peripheral disconnected unexpectedly" << std::endl;
        if (fn) fn();
    });

    chars_.clear();
    std::vector<CharacteristicInfo> out;
    try {
        for (auto& service : p.services()) {
            for (auto& chr : service.characteristics()) {
                CharacteristicInfo info;
                info.uuid = normalize_uuid(chr.uuid());
                if (chr.can_read()) info.properties.push_back("read");
                if (chr.can_write_request()) info.properties.push_back("write");
                if (chr.can_write_command()) info.properties.push_back("write-without-response");
                if (chr.can_notify()) info.properties.push_back("notify");
                if (chr.can_indicate()) info.properties.push_back("indicate");
                chars_[info.uuid] = CharRef{service.uuid(), chr.uuid(), chr.can_notify(), chr.can_indicate()};
                out.push_back(std::move(info));
            }
        }
    } catch (const std::exception& e) {
        connected_ = p;
        disconnect();
        throw AcquisitionError(AcquisitionErrorKind::Transport,
                               "Service discovery failed on " + address + ": " + e.what());
    }

    connected_ = p;
    std::cout << "[BLE]    Connected, " << out.size() << " characteristic(s)" << std::endl;
    return out;
}

SimpleBLE::Peripheral& LocalBleTransport::peripheral() {
    if (!connected_) {
        throw AcquisitionError(AcquisitionErrorKind::Transport, "No BLE peripheral connected");
    }
    return *connected_;
}

const LocalBleTransport::CharRef& LocalBleTransport::char_ref(const std::string& char_uuid) const {
    auto it = chars_.find(normalize_uuid(char_uuid));
    if (it == chars_.end()) {
        throw AcquisitionError(AcquisitionErrorKind::Transport, "Target characteristic " + char_uuid + " not found");
    }
    return it->second;
}

Subscription LocalBleTransport::subscribe(const std::string& char_uuid, FrameCallback on_frame) {
    auto& p = peripheral();
    const CharRef ref = char_ref(char_uuid);
    auto deliver = [on_frame](SimpleBLE::ByteArray bytes) { on_frame(to_bytes(bytes)); };

    try {
        if (ref.can_indicate) {
            p.indicate(ref.service, ref.characteristic, deliver);
        } else if (ref.can_notify) {
            p.notify(ref.service, ref.characteristic, deliver);
        } else {
            throw AcquisitionError(AcquisitionErrorKind::Transport,
                                   "Char " + char_uuid + " supports neither indicate nor notify");
        }
    } catch (const AcquisitionError&) {
        throw;
    } catch (const std::exception& e) {
        throw AcquisitionError(AcquisitionErrorKind::Transport, std::string("Subscription failed: ") + e.what());
    }
    std::cout << "[BLE]    " << (ref.can_indicate ? "Indication" : "Notification") << " active on "
              << p.address() << std::endl;

    SimpleBLE::Peripheral handle = p;
    return Subscription([handle, ref]() mutable {
        handle.unsubscribe(ref.service, ref.characteristic);
        // Give CCCD writes time to flush before disconnect
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    });
}

void LocalBleTransport::write(const std::string& char_uuid, const ByteArray& data, bool with_response) {
    auto& p = peripheral();
    const CharRef& ref = char_ref(char_uuid);
    try {
        if (with_response) {
            p.write_request(ref.service, ref.characteristic, to_simpleble(data));
        } else {
            p.write_command(ref.service, ref.characteristic, to_simpleble(data));
        }
    } catch (const std::exception& e) {
        throw AcquisitionError(AcquisitionErrorKind::Transport, "Write to " + char_uuid + " failed: " + e.what());
    }
}

ByteArray LocalBleTransport::read(const std::string& char_uuid) {
    auto& p = peripheral();
    const CharRef& ref = char_ref(char_uuid);
    try {
        return to_bytes(p.read(ref.service, ref.characteristic));
    } catch (const std::exception& e) {
        throw AcquisitionError(AcquisitionErrorKind::Transport, "Read of " + char_uuid + " failed: " + e.what());
    }
}

void LocalBleTransport::disconnect() noexcept {
    if (!connected_) return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        disconnecting_ = true;
    }
    try {
        connected_->disconnect();
    } catch (const std::exception& e) {
        std::cerr << "[BLE] Disconnect failed: " << e.what() << std::endl;
    }
    // Small settle time for the OS/stack to fully tear down the link
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    try {
        connected_->set_callback_on_disconnected({});
    } catch (const std::exception& e) {
        std::cerr << "[BLE] " << e.what() << std::endl;
    }
    connected_.reset();
    chars_.clear();
}

void LocalBleTransport::set_disconnect_handler(std::function<void()> fn) {
    bool already_down = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        on_disconnect_ = fn;
        already_down = disconnect_fired_;
    }
    // The peripheral may have dropped between connect and subscribe
    if (already_down && fn) fn();
}

void LocalBleTransport::end_session() noexcept {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        on_disconnect_ = nullptr;
    }
    if (!adapter_) return;
    try {
        clear_adapter_callbacks(*adapter_);
    } catch (const std::exception& e) {
        std::cerr << "[BLE] Clearing adapter callbacks failed: " << e.what() << std::endl;
    }
}
