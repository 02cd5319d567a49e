#pragma once

#include <cstdint>

namespace bgupload::upload {

// Lifecycle shared by both relays. DETACHED is terminal.
enum class RelayState : std::uint8_t {
    UNBOUND,
    SUBSCRIBED,
    DETACHED
};

inline const char* to_string(RelayState state) {
    switch (state) {
        case RelayState::UNBOUND: return "unbound";
        case RelayState::SUBSCRIBED: return "subscribed";
        case RelayState::DETACHED: return "detached";
    }
    return "unknown";
}

}
