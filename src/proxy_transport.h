#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ble_transport.h"
#include "message_bus.h"

struct ProxyConfig {
    std::string broker_url;
    std::string username;
    std::string password;
    std::string device_id;
    std::string topic_prefix = "ble-proxy";
};

// Topic layout under "{prefix}/{device_id}/".
struct ProxyTopics {
    ProxyTopics(const std::string& prefix, const std::string& device_id);

    std::string base;
    std::string status;
    std::string scan_start;
    std::string scan_results;
    std::string connect;
    std::string connected;
    std::string disconnect;
    std::string disconnected;
    std::string config;
    std::string beep;

    std::string notify(const std::string& uuid) const { return base + "/notify/" + uuid; }
    std::string write(const std::string& uuid) const { return base + "/write/" + uuid; }
    std::string read(const std::string& uuid) const { return base + "/read/" + uuid; }
    std::string read_response(const std::string& uuid) const { return read(uuid) + "/response"; }
};

struct ProxyTimeouts {
    std::chrono::milliseconds command{30000};  // broker, liveness, scan, connect
    std::chrono::milliseconds read{5000};
};

// Scale addresses matched during this process. Never shrinks; entries are
// stored upper-case.
class KnownScaleRegistry {
public:
    static KnownScaleRegistry& instance();

    // True when the address was not known yet.
    bool add(const std::string& address);
    bool contains(const std::string& address) const;
    std::vector<std::string> addresses() const;

private:
    KnownScaleRegistry() = default;

    mutable std::mutex mtx_;
    std::vector<std::string> addresses_;
};

nlohmann::json parse_proxy_json(const std::string& topic, const ByteArray& payload);
std::vector<ScanEntry> parse_scan_results(const std::string& topic, const ByteArray& payload);
std::vector<CharacteristicInfo> parse_connected(const std::string& topic, const ByteArray& payload);

// Remote radio reached through the message bus. The bus must outlive the
// transport.
class ProxyTransport : public BleTransport {
public:
    ProxyTransport(MessageBus& bus, ProxyConfig config, ProxyTimeouts timeouts = {});
    ~ProxyTransport() override;

    ProxyTransport(const ProxyTransport&) = delete;
    ProxyTransport& operator=(const ProxyTransport&) = delete;

    const char* kind() const override { return "mqtt-proxy"; }
    const ProxyTopics& topics() const { return topics_; }

    void ensure_ready() override;
    std::vector<ScanEntry> scan(std::chrono::milliseconds budget, const ScanCallback& on_found) override;
    std::vector<CharacteristicInfo> connect(const std::string& address, std::optional<int> addr_type) override;
    Subscription subscribe(const std::string& char_uuid, FrameCallback on_frame) override;
    void write(const std::string& char_uuid, const ByteArray& data, bool with_response) override;
    ByteArray read(const std::string& char_uuid) override;
    void disconnect() noexcept override;
    void set_disconnect_handler(std::function<void()> fn) override;
    bool prefers_connect_first() const override { return true; }
    void on_scale_matched(const std::string& address) override;
    void end_session() noexcept override;

    // Retained {"scales": [...]} so the proxy can beep for known scales.
    void publish_config(const std::vector<std::string>& scales);

    // Adds the address to the process-wide registry; publishes the config
    // only when the set grew. Returns true if it did.
    bool register_scale_address(const std::string& address);

    void publish_beep(std::optional<int> freq = std::nullopt, std::optional<int> duration = std::nullopt,
                      std::optional<int> repeat = std::nullopt);

private:
    struct Session;

    void ensure_broker();
    std::shared_ptr<Session> require_session(const char* op);

    MessageBus& bus_;
    ProxyConfig config_;
    ProxyTimeouts timeouts_;
    ProxyTopics topics_;
    std::shared_ptr<Session> session_;
};
