#include <iostream>

#include "periodic_writer.h"

PeriodicWriter::PeriodicWriter(GattChannel& gatt, std::string char_uuid, ByteArray command,
                               std::chrono::milliseconds interval)
    : gatt_(gatt), char_uuid_(std::move(char_uuid)), command_(std::move(command)), interval_(interval) {
    worker_ = std::thread([this] { run(); });
}

PeriodicWriter::~PeriodicWriter() {
    stop();
}

void PeriodicWriter::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

int PeriodicWriter::writes() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return writes_;
}

void PeriodicWriter::run() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!stopping_) {
        lk.unlock();
        try {
            gatt_.write(char_uuid_, command_, false);
        } catch (const std::exception& e) {
            std::cerr << "[BLE] Unlock write failed: " << e.what() << std::endl;
        }
        lk.lock();
        ++writes_;
        cv_.wait_for(lk, interval_, [this] { return stopping_; });
    }
}
