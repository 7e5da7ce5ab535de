#pragma once

#include <ruidapipe/protocol.hpp>

namespace ruidapipe {

    // Additive checksum: plain byte sum truncated to 16 bits
    inline dp::u16 sum16(const dp::u8 *data, dp::usize len) {
        dp::u32 sum = 0;
        for (dp::usize i = 0; i < len; ++i) {
            sum += data[i];
        }
        return static_cast<dp::u16>(sum & 0xFFFF);
    }

    inline dp::Array<dp::u8, 2> checksum(const dp::u8 *data, dp::usize len) { return encode_u16_be(sum16(data, len)); }

    inline dp::Array<dp::u8, 2> checksum(const Message &payload) { return checksum(payload.data(), payload.size()); }

    // Checks the 2-byte prefix of a wire chunk against the bytes that follow it
    inline bool verify(const Message &chunk) {
        if (chunk.size() < protocol::CHECKSUM_SIZE) {
            echo::trace("verify: chunk too short (", chunk.size(), " bytes)");
            return false;
        }
        dp::u16 expected = decode_u16_be(chunk.data());
        dp::u16 actual = sum16(chunk.data() + protocol::CHECKSUM_SIZE, chunk.size() - protocol::CHECKSUM_SIZE);
        if (expected != actual) {
            echo::trace("verify: checksum mismatch expected=", expected, " actual=", actual);
            return false;
        }
        return true;
    }

    // Builds [csumHi][csumLo][payload...]
    inline Message make_chunk(const dp::u8 *payload, dp::usize len) {
        Message chunk;
        append_u16_be(chunk, sum16(payload, len));
        chunk.insert(chunk.end(), payload, payload + len);
        return chunk;
    }

    inline Message make_chunk(const Message &payload) { return make_chunk(payload.data(), payload.size()); }

    // Payload view of a wire chunk; datagrams too short to carry a prefix have none
    inline const dp::u8 *chunk_payload(const Message &chunk) {
        return chunk.size() > protocol::CHECKSUM_SIZE ? chunk.data() + protocol::CHECKSUM_SIZE : nullptr;
    }

    inline dp::usize chunk_payload_size(const Message &chunk) {
        return chunk.size() > protocol::CHECKSUM_SIZE ? chunk.size() - protocol::CHECKSUM_SIZE : 0;
    }

} // namespace ruidapipe
