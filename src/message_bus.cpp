#include <algorithm>

#include "message_bus.h"

MessageBus::HandlerId MessageBus::add_handler(const std::string& topic, Handler handler) {
    std::lock_guard<std::mutex> lk(mtx_);
    const HandlerId id = next_id_++;
    handlers_.push_back(Entry{id, topic, std::move(handler)});
    return id;
}

void MessageBus::remove_handler(HandlerId id) {
    std::lock_guard<std::mutex> lk(mtx_);
    handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                   [id](const Entry& e) { return e.id == id; }),
                    handlers_.end());
}

size_t MessageBus::handler_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return handlers_.size();
}

void MessageBus::dispatch(const std::string& topic, const ByteArray& payload) {
    std::vector<Handler> matching;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& e : handlers_) {
            if (e.topic == topic) matching.push_back(e.handler);
        }
    }
    for (const auto& h : matching) h(topic, payload);
}

void MessageBus::track_topic(const std::string& topic) {
    std::lock_guard<std::mutex> lk(mtx_);
    topics_.insert(topic);
}

void MessageBus::untrack_topic(const std::string& topic) {
    std::lock_guard<std::mutex> lk(mtx_);
    topics_.erase(topic);
}

std::vector<std::string> MessageBus::tracked_topics() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<std::string>(topics_.begin(), topics_.end());
}

MessageBus::HandlerId HandlerScope::add(const std::string& topic, MessageBus::Handler handler) {
    const auto id = bus_.add_handler(topic, std::move(handler));
    ids_.push_back(id);
    // Handler first: a retained message may arrive as soon as we subscribe
    bus_.subscribe(topic);
    return id;
}

void HandlerScope::remove(MessageBus::HandlerId id) {
    bus_.remove_handler(id);
    ids_.erase(std::remove(ids_.begin(), ids_.end(), id), ids_.end());
}

void HandlerScope::clear() noexcept {
    for (auto id : ids_) bus_.remove_handler(id);
    ids_.clear();
}
