#pragma once

#include <ruidapipe/common.hpp>

#include <string>

namespace ruidapipe {

    // UDP endpoint - host and port
    struct UdpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }

        // Stream ownership is keyed on the exact address/port pair a datagram came from
        inline bool operator==(const UdpEndpoint &other) const { return port == other.port && host == other.host; }
        inline bool operator!=(const UdpEndpoint &other) const { return !(*this == other); }
    };

} // namespace ruidapipe
