#pragma once

#include <atomic>

namespace retrohost {

class CoreBridge;

// Process-wide slot naming the bridge that C callbacks route to
// libretro callbacks carry no user data, so at most one bridge can be live.
class ActiveBridge {
public:
    // Claim the slot. Fails if another bridge already holds it.
    static bool acquire(CoreBridge* bridge);

    // Clear the slot if it is held by this bridge
    static void release(CoreBridge* bridge);

    // Bridge that callbacks should reach, or nullptr
    static CoreBridge* current();

private:
    static std::atomic<CoreBridge*> s_current;
};

} // namespace retrohost
