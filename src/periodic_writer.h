#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "scale_adapter.h"

// Writes a command immediately and then at a fixed interval until stopped.
// Some scales only stream measurements while they keep receiving it.
class PeriodicWriter {
public:
    PeriodicWriter(GattChannel& gatt, std::string char_uuid, ByteArray command, std::chrono::milliseconds interval);
    ~PeriodicWriter();

    PeriodicWriter(const PeriodicWriter&) = delete;
    PeriodicWriter& operator=(const PeriodicWriter&) = delete;

    void stop();
    int writes() const;

private:
    void run();

    GattChannel& gatt_;
    std::string char_uuid_;
    ByteArray command_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stopping_ = false;
    int writes_ = 0;
    std::thread worker_;
};
