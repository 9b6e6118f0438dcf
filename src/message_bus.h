#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "ble_types.h"

// Publish/subscribe client with exact-topic handlers. Backends deliver
// incoming messages through dispatch(), usually from their network thread.
class MessageBus {
public:
    using Handler = std::function<void(const std::string& topic, const ByteArray& payload)>;
    using HandlerId = uint64_t;

    virtual ~MessageBus() = default;

    // Throws AcquisitionError(Timeout) when the broker does not accept the
    // session within the timeout.
    virtual void connect(std::chrono::milliseconds timeout) = 0;
    virtual bool is_connected() const = 0;
    virtual void disconnect() noexcept = 0;

    virtual void subscribe(const std::string& topic) = 0;
    virtual void unsubscribe(const std::string& topic) = 0;
    virtual void publish(const std::string& topic, const ByteArray& payload, bool retain = false) = 0;

    void publish(const std::string& topic, const std::string& payload, bool retain = false) {
        publish(topic, ByteArray(payload.begin(), payload.end()), retain);
    }

    HandlerId add_handler(const std::string& topic, Handler handler);
    void remove_handler(HandlerId id);
    size_t handler_count() const;

protected:
    // Handlers are called without the registry lock held; a handler may
    // add or remove handlers.
    void dispatch(const std::string& topic, const ByteArray& payload);

    // Topics to restore after the backend reconnects with a clean session.
    void track_topic(const std::string& topic);
    void untrack_topic(const std::string& topic);
    std::vector<std::string> tracked_topics() const;

private:
    struct Entry {
        HandlerId id;
        std::string topic;
        Handler handler;
    };

    mutable std::mutex mtx_;
    std::vector<Entry> handlers_;
    HandlerId next_id_ = 1;
    std::set<std::string> topics_;
};

// Handlers registered for one acquisition. Subscribes on add, removes every
// handler on destruction.
class HandlerScope {
public:
    explicit HandlerScope(MessageBus& bus) : bus_(bus) {}
    ~HandlerScope() { clear(); }

    HandlerScope(const HandlerScope&) = delete;
    HandlerScope& operator=(const HandlerScope&) = delete;

    MessageBus::HandlerId add(const std::string& topic, MessageBus::Handler handler);
    void remove(MessageBus::HandlerId id);
    void clear() noexcept;

private:
    MessageBus& bus_;
    std::vector<MessageBus::HandlerId> ids_;
};
