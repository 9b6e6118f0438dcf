#include <iostream>

#include "ble_transport.h"

void Subscription::release() noexcept {
    if (!release_) return;
    auto fn = std::move(release_);
    release_ = nullptr;
    try {
        fn();
    } catch (const std::exception& e) {
        std::cerr << "[BLE] Unsubscribe failed: " << e.what() << std::endl;
    }
}
