#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ble_types.h"
#include "scale_adapter.h"

using FrameCallback = std::function<void(const ByteArray&)>;

// Return true to stop scanning early.
using ScanCallback = std::function<bool(const ScanEntry&)>;

// Active notification stream. Unsubscribes when destroyed.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> release) : release_(std::move(release)) {}
    ~Subscription() { release(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept : release_(std::move(other.release_)) { other.release_ = nullptr; }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            release();
            release_ = std::move(other.release_);
            other.release_ = nullptr;
        }
        return *this;
    }

    void release() noexcept;

private:
    std::function<void()> release_;
};

// One radio, local or remote. All calls block until the operation completes
// or its bounded wait expires; failures are thrown as AcquisitionError.
class BleTransport : public GattChannel {
public:
    ~BleTransport() override = default;

    virtual const char* kind() const = 0;

    // Radio availability (adapter power, broker + proxy liveness).
    virtual void ensure_ready() = 0;

    // Reports each device once, as it appears. Returns every device seen.
    virtual std::vector<ScanEntry> scan(std::chrono::milliseconds budget, const ScanCallback& on_found) = 0;

    virtual std::vector<CharacteristicInfo> connect(const std::string& address, std::optional<int> addr_type) = 0;

    virtual Subscription subscribe(const std::string& char_uuid, FrameCallback on_frame) = 0;

    // Best-effort, never throws.
    virtual void disconnect() noexcept = 0;

    // Fired once when the peer (or the remote radio) drops the link. A
    // handler installed after the drop is called immediately.
    virtual void set_disconnect_handler(std::function<void()> fn) = 0;

    // When a target address is known: connect first and match the adapter
    // on the characteristic set instead of scanning.
    virtual bool prefers_connect_first() const { return false; }

    // Called after a device has been matched to an adapter.
    virtual void on_scale_matched(const std::string& address) { (void)address; }

    // Drops per-acquisition state (handlers, callbacks). Never throws.
    virtual void end_session() noexcept {}
};
