#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace ruidapipe {

    // Message type - just a vector of bytes
    using Message = dp::Vector<dp::u8>;

    // Big-endian encoding for the chunk checksum prefix
    inline dp::Array<dp::u8, 2> encode_u16_be(dp::u16 value) {
        echo::trace("encode_u16_be: value=", value);
        dp::Array<dp::u8, 2> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[1] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    // Big-endian decoding for the chunk checksum prefix
    inline dp::u16 decode_u16_be(const dp::u8 *bytes) {
        dp::u16 value = static_cast<dp::u16>((static_cast<dp::u16>(bytes[0]) << 8) | static_cast<dp::u16>(bytes[1]));
        echo::trace("decode_u16_be: value=", value);
        return value;
    }

    // Helper to encode u16 directly into a vector
    inline void append_u16_be(Message &buffer, dp::u16 value) {
        auto bytes = encode_u16_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    // Substring search over raw bytes; an empty needle never matches
    inline bool contains_bytes(const dp::u8 *haystack, dp::usize haystack_len, const Message &needle) {
        if (needle.empty() || haystack_len < needle.size()) {
            return false;
        }
        for (dp::usize i = 0; i + needle.size() <= haystack_len; ++i) {
            if (std::memcmp(haystack + i, needle.data(), needle.size()) == 0) {
                return true;
            }
        }
        return false;
    }

    // Helper to write exactly n bytes to a file descriptor
    // Returns dp::Res<void> - ok if all bytes written, error otherwise
    // ERROR CATEGORIZATION:
    // - not_found: descriptor closed or invalid (EBADF, EPIPE)
    // - io_error: other I/O errors (disk full, quota, ...)
    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count) {
        dp::usize total_written = 0;
        while (total_written < count) {
            dp::isize n = ::write(fd, buffer + total_written, count - total_written);
            if (n < 0) {
                // EINTR: Interrupted by signal - retry transparently
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }

                if (errno == EBADF) {
                    echo::trace("write failed: bad file descriptor (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("bad file descriptor"));
                }
                if (errno == EPIPE) {
                    echo::trace("write failed: broken pipe (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("broken pipe"));
                }

                echo::trace("write failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("write error: ") + strerror(errno)));
            }

            total_written += static_cast<dp::usize>(n);
            echo::trace("wrote ", n, " bytes, total=", total_written, "/", count, " (fd=", fd, ")");
        }
        return dp::result::ok();
    }

} // namespace ruidapipe
