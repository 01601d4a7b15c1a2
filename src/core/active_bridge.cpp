#include "active_bridge.hpp"

namespace retrohost {

std::atomic<CoreBridge*> ActiveBridge::s_current{nullptr};

bool ActiveBridge::acquire(CoreBridge* bridge) {
    CoreBridge* expected = nullptr;
    if (s_current.compare_exchange_strong(expected, bridge,
                                          std::memory_order_release,
                                          std::memory_order_relaxed)) {
        return true;
    }
    // Re-acquiring by the current holder is allowed
    return expected == bridge;
}

void ActiveBridge::release(CoreBridge* bridge) {
    CoreBridge* expected = bridge;
    s_current.compare_exchange_strong(expected, nullptr,
                                      std::memory_order_release,
                                      std::memory_order_relaxed);
}

CoreBridge* ActiveBridge::current() {
    return s_current.load(std::memory_order_acquire);
}

} // namespace retrohost
