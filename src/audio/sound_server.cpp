#include "audio/sound_server.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>

void requestDucking() {
    static std::once_flag once;
    std::call_once(once, [] {
        // An existing PULSE_PROP set by the user wins.
        if (setenv("PULSE_PROP", "media.role=phone", 0) != 0) {
            std::cerr << "[Audio Input] [WARN] could not set PULSE_PROP" << std::endl;
        }
    });
}
