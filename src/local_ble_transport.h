#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "simpleble/SimpleBLE.h"

#include "ble_transport.h"

// Shared helpers
std::optional<SimpleBLE::Adapter> get_first_adapter();
void clear_adapter_callbacks(SimpleBLE::Adapter& adapter);

// Drives the first local Bluetooth adapter through SimpleBLE.
class LocalBleTransport : public BleTransport {
public:
    LocalBleTransport() = default;
    ~LocalBleTransport() override;

    LocalBleTransport(const LocalBleTransport&) = delete;
    LocalBleTransport& operator=(const LocalBleTransport&) = delete;

    const char* kind() const override { return "local"; }

    void ensure_ready() override;
    std::vector<ScanEntry> scan(std::chrono::milliseconds budget, const ScanCallback& on_found) override;
    std::vector<CharacteristicInfo> connect(const std::string& address, std::optional<int> addr_type) override;
    Subscription subscribe(const std::string& char_uuid, FrameCallback on_frame) override;
    void write(const std::string& char_uuid, const ByteArray& data, bool with_response) override;
    ByteArray read(const std::string& char_uuid) override;
    void disconnect() noexcept override;
    void set_disconnect_handler(std::function<void()> fn) override;
    void end_session() noexcept override;

private:
    struct CharRef {
        SimpleBLE::BluetoothUUID service;
        SimpleBLE::BluetoothUUID characteristic;
        bool can_notify = false;
        bool can_indicate = false;
    };

    SimpleBLE::Adapter& adapter();
    void recover_power();
    const CharRef& char_ref(const std::string& char_uuid) const;
    SimpleBLE::Peripheral& peripheral();

    std::optional<SimpleBLE::Adapter> adapter_;

    std::mutex mtx_;
    std::map<std::string, SimpleBLE::Peripheral> seen_;  // canonical mac -> peripheral
    std::function<void()> on_disconnect_;
    bool disconnecting_ = false;
    bool disconnect_fired_ = false;  // since the last connect()

    std::optional<SimpleBLE::Peripheral> connected_;
    std::map<std::string, CharRef> chars_;  // normalized uuid -> handles
};
