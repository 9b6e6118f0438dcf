#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "acquisition_error.h"

// One-shot reply slot filled from a library thread (bus or radio callback)
// and awaited by the acquisition thread. Copies share the same slot, so a
// handler can hold one by value after the waiter has given up.
template <typename T>
class PendingReply {
public:
    PendingReply() : state_(std::make_shared<State>()) {}

    // First completion wins; later ones are ignored.
    void set_value(T value) const {
        {
            std::lock_guard<std::mutex> lk(state_->mtx);
            if (state_->done) return;
            state_->value = std::move(value);
            state_->done = true;
        }
        state_->cv.notify_all();
    }

    void set_error(const AcquisitionError& error) const {
        {
            std::lock_guard<std::mutex> lk(state_->mtx);
            if (state_->done) return;
            state_->error = error;
            state_->done = true;
        }
        state_->cv.notify_all();
    }

    T wait_for(std::chrono::milliseconds timeout, const std::string& timeout_message) const {
        std::unique_lock<std::mutex> lk(state_->mtx);
        if (!state_->cv.wait_for(lk, timeout, [this] { return state_->done; })) {
            throw AcquisitionError(AcquisitionErrorKind::Timeout, timeout_message);
        }
        if (state_->error) throw *state_->error;
        return *state_->value;
    }

private:
    struct State {
        std::mutex mtx;
        std::condition_variable cv;
        bool done = false;
        std::optional<T> value;
        std::optional<AcquisitionError> error;
    };
    std::shared_ptr<State> state_;
};

// Completion signal without a payload.
struct Signal {};

inline std::string format_elapsed(std::chrono::steady_clock::time_point since) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since);
    return std::to_string(ms.count() / 1000) + "." + std::to_string((ms.count() % 1000) / 100) + "s";
}
