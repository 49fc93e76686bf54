#pragma once
#include <string_view>
namespace peerdrop::protocol {

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected
};

enum class SessionRole {
    None,
    Caller,
    Answerer
};

[[nodiscard]] constexpr std::string_view ToString(const ConnectionStatus status) noexcept {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
    }
    return "unknown";
}
}
