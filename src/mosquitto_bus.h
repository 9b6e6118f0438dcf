#pragma once

#include <atomic>
#include <string>

#include "message_bus.h"
#include "wait_utils.h"

struct mosquitto;
struct mosquitto_message;

struct BrokerAddress {
    std::string host;
    int port = 1883;
};

// Accepts "mqtt://host[:port]", "tcp://host[:port]" or "host[:port]".
BrokerAddress parse_broker_url(const std::string& url);

// MessageBus over libmosquitto with its own network thread.
class MosquittoBus : public MessageBus {
public:
    MosquittoBus(std::string broker_url, std::string client_id, std::string username, std::string password);
    ~MosquittoBus() override;

    MosquittoBus(const MosquittoBus&) = delete;
    MosquittoBus& operator=(const MosquittoBus&) = delete;

    void connect(std::chrono::milliseconds timeout) override;
    bool is_connected() const override { return connected_; }
    void disconnect() noexcept override;

    void subscribe(const std::string& topic) override;
    void unsubscribe(const std::string& topic) override;
    void publish(const std::string& topic, const ByteArray& payload, bool retain = false) override;
    using MessageBus::publish;

private:
    static void on_connect(mosquitto* mosq, void* obj, int rc);
    static void on_disconnect(mosquitto* mosq, void* obj, int rc);
    static void on_message(mosquitto* mosq, void* obj, const mosquitto_message* msg);

    std::string broker_url_;
    std::string username_;
    std::string password_;
    mosquitto* mosq_ = nullptr;
    bool loop_running_ = false;
    std::atomic<bool> connected_{false};
    PendingReply<int> connack_;
};
