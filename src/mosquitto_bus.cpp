#include <iostream>

#include <mosquitto.h>

#include "acquisition_error.h"
#include "mosquitto_bus.h"

namespace {

constexpr int KEEPALIVE_SEC = 30;
constexpr int QOS = 1;

void ensure_lib_initialized() {
    struct LibGuard {
        LibGuard() { mosquitto_lib_init(); }
        ~LibGuard() { mosquitto_lib_cleanup(); }
    };
    static LibGuard guard;
}

void check_rc(int rc, const std::string& what) {
    if (rc != MOSQ_ERR_SUCCESS) {
        throw AcquisitionError(AcquisitionErrorKind::Transport, what + ": " + mosquitto_strerror(rc));
    }
}

}  // namespace

BrokerAddress parse_broker_url(const std::string& url) {
    std::string rest = trim(url);
    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        const std::string scheme = to_lower(rest.substr(0, scheme_end));
        if (scheme != "mqtt" && scheme != "tcp") {
            throw AcquisitionError(AcquisitionErrorKind::Transport,
                                   "Unsupported broker URL scheme '" + scheme + "' in " + url);
        }
        rest = rest.substr(scheme_end + 3);
    }
    // Drop any path component
    const auto slash = rest.find('/');
    if (slash != std::string::npos) rest = rest.substr(0, slash);

    BrokerAddress out;
    const auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        try {
            out.port = std::stoi(rest.substr(colon + 1));
        } catch (const std::exception&) {
            throw AcquisitionError(AcquisitionErrorKind::Transport, "Invalid port in broker URL " + url);
        }
        rest = rest.substr(0, colon);
    }
    if (rest.empty()) {
        throw AcquisitionError(AcquisitionErrorKind::Transport, "Missing host in broker URL " + url);
    }
    out.host = rest;
    return out;
}

MosquittoBus::MosquittoBus(std::string broker_url, std::string client_id, std::string username,
                           std::string password)
    : broker_url_(std::move(broker_url)), username_(std::move(username)), password_(std::move(password)) {
    ensure_lib_initialized();
    mosq_ = mosquitto_new(client_id.c_str(), true, this);
    if (!mosq_) {
        throw AcquisitionError(AcquisitionErrorKind::Transport, "mosquitto_new failed for client " + client_id);
    }
    mosquitto_connect_callback_set(mosq_, &MosquittoBus::on_connect);
    mosquitto_disconnect_callback_set(mosq_, &MosquittoBus::on_disconnect);
    mosquitto_message_callback_set(mosq_, &MosquittoBus::on_message);
}

MosquittoBus::~MosquittoBus() {
    disconnect();
    if (mosq_) mosquitto_destroy(mosq_);
}

void MosquittoBus::connect(std::chrono::milliseconds timeout) {
    const BrokerAddress addr = parse_broker_url(broker_url_);
    if (!username_.empty()) {
        check_rc(mosquitto_username_pw_set(mosq_, username_.c_str(), password_.empty() ? nullptr : password_.c_str()),
                 "Setting broker credentials failed");
    }

    const std::string unreachable =
        "MQTT broker unreachable at " + broker_url_ + ". Check your mqtt_proxy.broker_url config.";

    // Reconnect after a dropped session: stop the old network thread first
    if (loop_running_) {
        mosquitto_loop_stop(mosq_, true);
        loop_running_ = false;
    }
    connack_ = PendingReply<int>();

    int rc = mosquitto_connect_async(mosq_, addr.host.c_str(), addr.port, KEEPALIVE_SEC);
    if (rc != MOSQ_ERR_SUCCESS) {
        throw AcquisitionError(AcquisitionErrorKind::Transport, unreachable + " (" + mosquitto_strerror(rc) + ")");
    }
    check_rc(mosquitto_loop_start(mosq_), "Starting the MQTT network thread failed");
    loop_running_ = true;

    const int connack = connack_.wait_for(timeout, unreachable);
    if (connack != 0) {
        throw AcquisitionError(AcquisitionErrorKind::Transport,
                               std::string("MQTT broker refused the connection: ") + mosquitto_connack_string(connack));
    }
    std::cout << "[Proxy] Connected to broker " << addr.host << ":" << addr.port << std::endl;
}

void MosquittoBus::disconnect() noexcept {
    if (!mosq_) return;
    if (connected_) mosquitto_disconnect(mosq_);
    if (loop_running_) {
        mosquitto_loop_stop(mosq_, false);
        loop_running_ = false;
    }
    connected_ = false;
}

void MosquittoBus::subscribe(const std::string& topic) {
    check_rc(mosquitto_subscribe(mosq_, nullptr, topic.c_str(), QOS), "Subscribe to " + topic + " failed");
    track_topic(topic);
}

void MosquittoBus::unsubscribe(const std::string& topic) {
    untrack_topic(topic);
    check_rc(mosquitto_unsubscribe(mosq_, nullptr, topic.c_str()), "Unsubscribe from " + topic + " failed");
}

void MosquittoBus::publish(const std::string& topic, const ByteArray& payload, bool retain) {
    check_rc(mosquitto_publish(mosq_, nullptr, topic.c_str(), static_cast<int>(payload.size()),
                               payload.empty() ? nullptr : payload.data(), QOS, retain),
             "Publish to " + topic + " failed");
}

void MosquittoBus::on_connect(mosquitto* mosq, void* obj, int rc) {
    auto* self = static_cast<MosquittoBus*>(obj);
    self->connected_ = (rc == 0);
    if (rc == 0) {
        // Automatic reconnects start a clean session
        for (const auto& topic : self->tracked_topics()) {
            const int sub_rc = mosquitto_subscribe(mosq, nullptr, topic.c_str(), QOS);
            if (sub_rc != MOSQ_ERR_SUCCESS) {
                std::cerr << "[Proxy] Resubscribe to " << topic << " failed: " << mosquitto_strerror(sub_rc)
                          << std::endl;
            }
        }
    }
    self->connack_.set_value(rc);
}

void MosquittoBus::on_disconnect(mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MosquittoBus*>(obj);
    self->connected_ = false;
    if (rc != 0) std::cerr << "[Proxy] Broker connection lost (" << mosquitto_strerror(rc) << ")" << std::endl;
}

void MosquittoBus::on_message(mosquitto*, void* obj, const mosquitto_message* msg) {
    auto* self = static_cast<MosquittoBus*>(obj);
    const auto* bytes = static_cast<const uint8_t*>(msg->payload);
    ByteArray payload;
    if (bytes && msg->payloadlen > 0) payload.assign(bytes, bytes + msg->payloadlen);
    try {
        self->dispatch(msg->topic, payload);
    } catch (const std::exception& e) {
        std::cerr << "[Proxy] Handler for " << msg->topic << " failed: " << e.what() << std::endl;
    }
}
