#pragma once

#include <ruidapipe/common.hpp>

namespace ruidapipe {
    namespace protocol {

        // Single-byte response alphabet
        static constexpr dp::u8 ACK = 0xC6;
        static constexpr dp::u8 NACK = 0x46; // checksum error or stream busy

        // A job's last chunk carries this byte somewhere in its payload
        static constexpr dp::u8 END_OF_JOB = 0xD7;

        // Well-known ports: the board listens on 50200 and answers to 40200
        static constexpr dp::u16 DEVICE_PORT = 50200;
        static constexpr dp::u16 SOURCE_PORT = 40200;

        static constexpr dp::usize CHECKSUM_SIZE = 2;
        static constexpr dp::usize DEFAULT_MTU = 1470;       // payload bytes per chunk, excluding checksum
        static constexpr dp::usize MAX_DATAGRAM_SIZE = 10000; // relay receive buffer
        static constexpr dp::usize MAX_CHUNK_PAYLOAD = MAX_DATAGRAM_SIZE - CHECKSUM_SIZE;

        static constexpr dp::u32 ACK_TIMEOUT_MS = 3000;
        static constexpr dp::u32 RETRY_INITIAL_MS = 200;
        static constexpr dp::u32 RETRY_MAX_MS = 5000;
        static constexpr dp::u32 SESSION_TIMEOUT_MS = 10000;

        enum class Response : dp::u8 {
            Empty,   // zero-length reply
            Ack,     // 0xC6
            Nack,    // 0x46
            Unknown, // anything else
        };

        // Only the first byte of a reply is significant
        inline Response classify(const Message &reply) {
            if (reply.empty()) {
                return Response::Empty;
            }
            if (reply[0] == ACK) {
                return Response::Ack;
            }
            if (reply[0] == NACK) {
                return Response::Nack;
            }
            return Response::Unknown;
        }

        inline const char *to_string(Response response) {
            switch (response) {
            case Response::Empty:
                return "empty";
            case Response::Ack:
                return "ack";
            case Response::Nack:
                return "nack";
            case Response::Unknown:
                return "unknown";
            }
            return "unknown";
        }

        inline Message ack() { return Message{ACK}; }
        inline Message nack() { return Message{NACK}; }

    } // namespace protocol
} // namespace ruidapipe
