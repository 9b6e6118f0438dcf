#include <algorithm>
#include <iostream>

#include "acquisition_error.h"
#include "proxy_transport.h"
#include "wait_utils.h"

ProxyTopics::ProxyTopics(const std::string& prefix, const std::string& device_id)
    : base(prefix + "/" + device_id),
      status(base + "/status"),
      scan_start(base + "/scan/start"),
      scan_results(base + "/scan/results"),
      connect(base + "/connect"),
      connected(base + "/connected"),
      disconnect(base + "/disconnect"),
      disconnected(base + "/disconnected"),
      config(base + "/config"),
      beep(base + "/beep") {}

KnownScaleRegistry& KnownScaleRegistry::instance() {
    static KnownScaleRegistry registry;
    return registry;
}

bool KnownScaleRegistry::add(const std::string& address) {
    const std::string upper = to_upper(address);
    std::lock_guard<std::mutex> lk(mtx_);
    if (std::find(addresses_.begin(), addresses_.end(), upper) != addresses_.end()) return false;
    addresses_.push_back(upper);
    return true;
}

bool KnownScaleRegistry::contains(const std::string& address) const {
    const std::string upper = to_upper(address);
    std::lock_guard<std::mutex> lk(mtx_);
    return std::find(addresses_.begin(), addresses_.end(), upper) != addresses_.end();
}

std::vector<std::string> KnownScaleRegistry::addresses() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return addresses_;
}

nlohmann::json parse_proxy_json(const std::string& topic, const ByteArray& payload) {
    try {
        return nlohmann::json::parse(payload.begin(), payload.end());
    } catch (const nlohmann::json::exception& e) {
        throw AcquisitionError(AcquisitionErrorKind::MalformedMessage,
                               "BLE proxy sent invalid JSON on " + topic + ": " + e.what());
    }
}

namespace {

std::string string_or_empty(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

ScanEntry scan_entry_from_json(const nlohmann::json& j) {
    ScanEntry e;
    e.address = j.at("address").get<std::string>();
    e.name = string_or_empty(j, "name");
    if (j.contains("rssi") && j["rssi"].is_number()) e.rssi = j["rssi"].get<int>();
    if (j.contains("services") && j["services"].is_array()) {
        for (const auto& s : j["services"]) e.services.push_back(normalize_uuid(s.get<std::string>()));
    }
    if (j.contains("addr_type") && j["addr_type"].is_number_integer()) e.addr_type = j["addr_type"].get<int>();

    const std::string mfr_hex = string_or_empty(j, "manufacturer_data");
    if (j.contains("manufacturer_id") && j["manufacturer_id"].is_number_integer() && !mfr_hex.empty()) {
        auto bytes = hex_to_bytes(mfr_hex);
        if (!bytes) throw std::invalid_argument("manufacturer_data is not hex: " + mfr_hex);
        e.manufacturer = ManufacturerData{j["manufacturer_id"].get<uint16_t>(), std::move(*bytes)};
    }
    return e;
}

// Registers a handler for the duration of one request.
class TemporaryHandler {
public:
    TemporaryHandler(HandlerScope& scope, MessageBus& bus, std::string topic, MessageBus::Handler handler,
                     bool unsubscribe_after)
        : scope_(scope), bus_(bus), topic_(std::move(topic)), unsubscribe_after_(unsubscribe_after) {
        id_ = scope_.add(topic_, std::move(handler));
    }
    ~TemporaryHandler() {
        scope_.remove(id_);
        if (!unsubscribe_after_) return;
        try {
            bus_.unsubscribe(topic_);
        } catch (const std::exception& e) {
            std::cerr << "[Proxy] " << e.what() << std::endl;
        }
    }

    TemporaryHandler(const TemporaryHandler&) = delete;
    TemporaryHandler& operator=(const TemporaryHandler&) = delete;

private:
    HandlerScope& scope_;
    MessageBus& bus_;
    std::string topic_;
    bool unsubscribe_after_;
    MessageBus::HandlerId id_ = 0;
};

}  // namespace

std::vector<ScanEntry> parse_scan_results(const std::string& topic, const ByteArray& payload) {
    const nlohmann::json j = parse_proxy_json(topic, payload);
    if (!j.is_array()) {
        throw AcquisitionError(AcquisitionErrorKind::MalformedMessage,
                               "BLE proxy sent invalid scan results on " + topic + ": expected an array");
    }
    std::vector<ScanEntry> out;
    try {
        for (const auto& item : j) out.push_back(scan_entry_from_json(item));
    } catch (const std::exception& e) {
        throw AcquisitionError(AcquisitionErrorKind::MalformedMessage,
                               "BLE proxy sent invalid scan results on " + topic + ": " + e.what());
    }
    return out;
}

std::vector<CharacteristicInfo> parse_connected(const std::string& topic, const ByteArray& payload) {
    const nlohmann::json j = parse_proxy_json(topic, payload);
    std::vector<CharacteristicInfo> out;
    try {
        for (const auto& c : j.at("chars")) {
            CharacteristicInfo info;
            info.uuid = normalize_uuid(c.at("uuid").get<std::string>());
            if (c.contains("properties")) info.properties = c["properties"].get<std::vector<std::string>>();
            out.push_back(std::move(info));
        }
    } catch (const nlohmann::json::exception& e) {
        throw AcquisitionError(AcquisitionErrorKind::MalformedMessage,
                               "BLE proxy sent invalid connect response on " + topic + ": " + e.what());
    }
    return out;
}

// Per-acquisition state. Bus handlers hold it weakly.
struct ProxyTransport::Session {
    explicit Session(MessageBus& bus) : scope(bus) {}

    HandlerScope scope;

    std::mutex mtx;
    bool offline = false;
    bool disconnect_fired = false;
    std::function<void()> on_disconnect;
    std::map<uint64_t, std::function<void(const AcquisitionError&)>> pending;
    uint64_t next_pending = 1;

    void fail_pending(const AcquisitionError& error) {
        std::vector<std::function<void(const AcquisitionError&)>> hooks;
        {
            std::lock_guard<std::mutex> lk(mtx);
            for (auto& kv : pending) hooks.push_back(kv.second);
        }
        for (auto& h : hooks) h(error);
    }

    void fire_disconnect() {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (disconnect_fired) return;
            disconnect_fired = true;
            fn = on_disconnect;
        }
        if (fn) fn();
    }

    void link_lost(const std::string& why) {
        std::cerr << "[Proxy] " << why << std::endl;
        fail_pending(AcquisitionError(AcquisitionErrorKind::Disconnected, why));
        fire_disconnect();
    }
};

namespace {

// Fails the reply when the remote link drops while the request is open.
template <typename T, typename SessionT>
class PendingGuard {
public:
    PendingGuard(SessionT& session, const PendingReply<T>& reply) : session_(session) {
        std::lock_guard<std::mutex> lk(session_.mtx);
        id_ = session_.next_pending++;
        session_.pending[id_] = [reply](const AcquisitionError& e) { reply.set_error(e); };
    }
    ~PendingGuard() {
        std::lock_guard<std::mutex> lk(session_.mtx);
        session_.pending.erase(id_);
    }

    PendingGuard(const PendingGuard&) = delete;
    PendingGuard& operator=(const PendingGuard&) = delete;

private:
    SessionT& session_;
    uint64_t id_ = 0;
};

}  // namespace

ProxyTransport::ProxyTransport(MessageBus& bus, ProxyConfig config, ProxyTimeouts timeouts)
    : bus_(bus),
      config_(std::move(config)),
      timeouts_(timeouts),
      topics_(config_.topic_prefix, config_.device_id) {}

ProxyTransport::~ProxyTransport() {
    end_session();
}

void ProxyTransport::ensure_broker() {
    if (!bus_.is_connected()) bus_.connect(timeouts_.command);
}

std::shared_ptr<ProxyTransport::Session> ProxyTransport::require_session(const char* op) {
    if (!session_) {
        throw AcquisitionError(AcquisitionErrorKind::Transport,
                               std::string("BLE proxy ") + op + " called before ensure_ready()");
    }
    {
        std::lock_guard<std::mutex> lk(session_->mtx);
        if (session_->offline) {
            throw AcquisitionError(AcquisitionErrorKind::UnavailableRadio, "BLE proxy is offline.");
        }
    }
    return session_;
}

void ProxyTransport::ensure_ready() {
    end_session();
    ensure_broker();

    session_ = std::make_shared<Session>(bus_);
    std::weak_ptr<Session> weak = session_;
    PendingReply<Signal> online;

    session_->scope.add(topics_.status, [weak, online](const std::string&, const ByteArray& payload) {
        auto s = weak.lock();
        if (!s) return;
        const std::string msg(payload.begin(), payload.end());
        if (msg == "online") {
            {
                std::lock_guard<std::mutex> lk(s->mtx);
                s->offline = false;
            }
            online.set_value(Signal{});
        } else if (msg == "offline") {
            {
                std::lock_guard<std::mutex> lk(s->mtx);
                s->offline = true;
            }
            online.set_error(AcquisitionError(AcquisitionErrorKind::UnavailableRadio,
                                              "BLE proxy is offline. Check the device and its WiFi/MQTT connection."));
            s->link_lost("BLE proxy went offline");
        }
    });

    session_->scope.add(topics_.disconnected, [weak](const std::string&, const ByteArray&) {
        if (auto s = weak.lock()) s->link_lost("BLE proxy reported the scale disconnected");
    });

    online.wait_for(timeouts_.command,
                    "BLE proxy did not respond. Check that it is powered on and connected to MQTT.");
    std::cout << "[Proxy] BLE proxy " << config_.device_id << " is online" << std::endl;
}

std::vector<ScanEntry> ProxyTransport::scan(std::chrono::milliseconds budget, const ScanCallback& on_found) {
    (void)budget;  // the proxy decides how long it scans
    auto s = require_session("scan");

    PendingReply<std::vector<ScanEntry>> results;
    TemporaryHandler handler(s->scope, bus_, topics_.scan_results,
                             [results](const std::string& topic, const ByteArray& payload) {
                                 try {
                                     results.set_value(parse_scan_results(topic, payload));
                                 } catch (const AcquisitionError& e) {
                                     results.set_error(e);
                                 }
                             },
                             false);
    PendingGuard<std::vector<ScanEntry>, Session> guard(*s, results);

    std::cout << "[Proxy] Scanning for BLE devices via proxy..." << std::endl;
    bus_.publish(topics_.scan_start, ByteArray{});
    std::vector<ScanEntry> entries = results.wait_for(
        timeouts_.command, "No scan results received from the BLE proxy. Check that it is powered on and scanning.");

    for (const auto& e : entries) {
        if (on_found && on_found(e)) break;
    }
    return entries;
}

std::vector<CharacteristicInfo> ProxyTransport::connect(const std::string& address, std::optional<int> addr_type) {
    auto s = require_session("connect");
    {
        std::lock_guard<std::mutex> lk(s->mtx);
        s->disconnect_fired = false;
    }

    PendingReply<std::vector<CharacteristicInfo>> reply;
    TemporaryHandler handler(s->scope, bus_, topics_.connected,
                             [reply](const std::string& topic, const ByteArray& payload) {
                                 try {
                                     reply.set_value(parse_connected(topic, payload));
                                 } catch (const AcquisitionError& e) {
                                     reply.set_error(e);
                                 }
                             },
                             false);
    PendingGuard<std::vector<CharacteristicInfo>, Session> guard(*s, reply);

    std::cout << "[Proxy] Connecting to " << address << " via proxy..." << std::endl;
    const nlohmann::json request{{"address", address}, {"addr_type", addr_type.value_or(0)}};
    bus_.publish(topics_.connect, request.dump());

    auto chars = reply.wait_for(timeouts_.command, "BLE proxy failed to connect to BLE device " + address +
                                                       ". Check that the scale is powered on and in range.");
    std::cout << "[Proxy] Connected to " << address << " (" << chars.size() << " characteristic(s))" << std::endl;
    return chars;
}

Subscription ProxyTransport::subscribe(const std::string& char_uuid, FrameCallback on_frame) {
    auto s = require_session("subscribe");
    const std::string topic = topics_.notify(normalize_uuid(char_uuid));

    const auto id = s->scope.add(topic, [on_frame](const std::string&, const ByteArray& payload) {
        on_frame(payload);
    });

    std::weak_ptr<Session> weak = s;
    MessageBus* bus = &bus_;
    return Subscription([weak, bus, topic, id]() {
        if (auto live = weak.lock()) live->scope.remove(id);
        bus->unsubscribe(topic);
    });
}

void ProxyTransport::write(const std::string& char_uuid, const ByteArray& data, bool with_response) {
    (void)with_response;  // the proxy picks the write type from the characteristic
    require_session("write");
    bus_.publish(topics_.write(normalize_uuid(char_uuid)), data);
}

ByteArray ProxyTransport::read(const std::string& char_uuid) {
    auto s = require_session("read");
    const std::string uuid = normalize_uuid(char_uuid);

    PendingReply<ByteArray> reply;
    TemporaryHandler handler(s->scope, bus_, topics_.read_response(uuid),
                             [reply](const std::string&, const ByteArray& payload) { reply.set_value(payload); },
                             true);
    PendingGuard<ByteArray, Session> guard(*s, reply);

    bus_.publish(topics_.read(uuid), ByteArray{});
    return reply.wait_for(timeouts_.read, "Read response timeout for characteristic " + uuid);
}

void ProxyTransport::disconnect() noexcept {
    try {
        bus_.publish(topics_.disconnect, ByteArray{});
    } catch (const std::exception& e) {
        std::cerr << "[Proxy] Disconnect request failed: " << e.what() << std::endl;
    }
}

void ProxyTransport::set_disconnect_handler(std::function<void()> fn) {
    if (!session_) return;
    bool already_down = false;
    {
        std::lock_guard<std::mutex> lk(session_->mtx);
        session_->on_disconnect = fn;
        already_down = session_->disconnect_fired;
    }
    // The link may have dropped between connect and subscribe
    if (already_down && fn) fn();
}

void ProxyTransport::on_scale_matched(const std::string& address) {
    try {
        register_scale_address(address);
    } catch (const std::exception& e) {
        std::cerr << "[Proxy] Could not publish scale config: " << e.what() << std::endl;
    }
}

void ProxyTransport::end_session() noexcept {
    if (!session_) return;
    session_->scope.clear();
    {
        std::lock_guard<std::mutex> lk(session_->mtx);
        session_->on_disconnect = nullptr;
        session_->pending.clear();
    }
    session_.reset();
}

void ProxyTransport::publish_config(const std::vector<std::string>& scales) {
    ensure_broker();
    const nlohmann::json payload{{"scales", scales}};
    bus_.publish(topics_.config, payload.dump(), true);
}

bool ProxyTransport::register_scale_address(const std::string& address) {
    auto& registry = KnownScaleRegistry::instance();
    if (!registry.add(address)) return false;
    const auto all = registry.addresses();
    std::cout << "[Proxy] Registered scale " << to_upper(address) << " for proxy beep (" << all.size()
              << " total)" << std::endl;
    publish_config(all);
    return true;
}

void ProxyTransport::publish_beep(std::optional<int> freq, std::optional<int> duration, std::optional<int> repeat) {
    ensure_broker();
    if (!freq && !duration && !repeat) {
        bus_.publish(topics_.beep, ByteArray{});
        return;
    }
    nlohmann::json payload = nlohmann::json::object();
    if (freq) payload["freq"] = *freq;
    if (duration) payload["duration"] = *duration;
    if (repeat) payload["repeat"] = *repeat;
    bus_.publish(topics_.beep, payload.dump());
}
