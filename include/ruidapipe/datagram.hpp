#pragma once

#include <ruidapipe/endpoint.hpp>

namespace ruidapipe {

    // Abstract base class for connectionless transports carrying Ruida chunks
    // Datagrams are unreliable, unordered, connectionless messages
    class Datagram {
      public:
        virtual ~Datagram() = default;

        // Bind to local address for receiving
        // Must be called before recv_from()
        virtual dp::Res<void> bind(const UdpEndpoint &endpoint) = 0;

        // Restrict the transport to one peer; datagrams from anyone else are discarded
        // Returns the peer as recv_from() will report it (numeric host)
        virtual dp::Res<UdpEndpoint> connect(const UdpEndpoint &peer) = 0;

        // Send a message to a specific destination
        // Fire and forget - may or may not arrive
        // No framing needed - message boundaries preserved by transport
        virtual dp::Res<void> send_to(const Message &msg, const UdpEndpoint &dest) = 0;

        // Receive a message
        // Blocks until a message arrives or the receive timeout expires
        // A timeout is reported as dp::Error::TIMEOUT
        // Returns the message and the source endpoint
        virtual dp::Res<dp::Pair<Message, UdpEndpoint>> recv_from() = 0;

        // Set receive timeout in milliseconds
        // 0 means no timeout (blocking forever)
        virtual dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) = 0;

        // Descriptor for readiness polling, -1 when there is none
        virtual dp::i32 native_handle() const = 0;

        // Close and release resources
        virtual void close() = 0;
    };

} // namespace ruidapipe
