#pragma once

#include <ruidapipe/chunker.hpp>
#include <ruidapipe/config.hpp>
#include <ruidapipe/datagram.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace ruidapipe {

    // Injected so retry timing can be observed without real delays
    using SleepFn = std::function<void(dp::u32 delay_ms)>;

    inline void sleep_ms(dp::u32 delay_ms) { std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms)); }

    /// Truncated binary backoff used while the board NACKs the first chunk
    class BackoffPolicy {
      private:
        dp::u32 initial_ms_;
        dp::u32 max_ms_;
        dp::u32 current_ms_;

      public:
        BackoffPolicy(dp::u32 initial_ms, dp::u32 max_ms)
            : initial_ms_(initial_ms), max_ms_(max_ms < initial_ms ? initial_ms : max_ms), current_ms_(initial_ms) {}

        /// Delay to wait now; the following one doubles, saturating at max
        dp::u32 next() {
            dp::u32 delay = current_ms_;
            current_ms_ = (current_ms_ > max_ms_ / 2) ? max_ms_ : current_ms_ * 2;
            return delay;
        }

        dp::u32 peek() const { return current_ms_; }

        void reset() { current_ms_ = initial_ms_; }
    };

    /// How one chunk's send-wait cycle ended
    enum class ChunkResult {
        Acked,   // board answered 0xC6
        Silent,  // timeout or empty reply: the peer gave up
        Unknown, // unrecognised reply byte
    };

    inline const char *to_string(ChunkResult result) {
        switch (result) {
        case ChunkResult::Acked:
            return "acked";
        case ChunkResult::Silent:
            return "silent";
        case ChunkResult::Unknown:
            return "unknown";
        }
        return "unknown";
    }

    /// Drives send / wait / retry for one chunk at a time
    /// Only the first chunk of a job is retried on NACK; a NACK on any later
    /// chunk is a checksum error and fails the transfer.
    /// Only datagrams from the configured device count as its answer.
    class AckEngine {
      private:
        Datagram &link_;
        UdpEndpoint device_;
        dp::u32 retry_initial_ms_;
        dp::u32 retry_max_ms_;
        dp::u32 chunk_pause_ms_;
        bool verbose_;
        SleepFn sleep_;
        dp::u32 last_retries_;
        dp::u64 strays_;

        // Next datagram from the board; anything from another source is skipped
        dp::Res<Message> await_reply(const Chunk &chunk) {
            while (true) {
                auto recv_res = link_.recv_from();
                if (recv_res.is_err()) {
                    return dp::result::err(recv_res.error());
                }
                auto [reply, src] = std::move(recv_res.value());
                if (src != device_) {
                    echo::warn("ignoring ", reply.size(), " bytes from ", src.to_string(), " while waiting on ",
                               device_.to_string(), " (offset ", chunk.offset, ")");
                    ++strays_;
                    continue;
                }
                echo::trace("reply of ", reply.size(), " bytes from ", src.to_string());
                return dp::result::ok(std::move(reply));
            }
        }

      public:
        AckEngine(Datagram &link, const SenderConfig &config, SleepFn sleep = sleep_ms)
            : link_(link), device_(config.device), retry_initial_ms_(config.retry_initial_ms),
              retry_max_ms_(config.retry_max_ms), chunk_pause_ms_(config.chunk_pause_ms), verbose_(config.verbose),
              sleep_(std::move(sleep)), last_retries_(0), strays_(0) {}

        /// Retries spent on the most recent deliver() call
        dp::u32 last_retries() const { return last_retries_; }

        /// Datagrams discarded because they did not come from the board
        dp::u64 strays() const { return strays_; }

        dp::Res<ChunkResult> deliver(const Chunk &chunk) {
            last_retries_ = 0;
            if (chunk_pause_ms_ > 0) {
                sleep_(chunk_pause_ms_);
            }

            BackoffPolicy backoff(retry_initial_ms_, retry_max_ms_);
            while (true) {
                auto send_res = link_.send_to(chunk.bytes, device_);
                if (send_res.is_err()) {
                    // A first chunk that cannot leave the host is retried like a NACK
                    if (chunk.is_first) {
                        dp::u32 delay = backoff.next();
                        echo::warn("send of first chunk failed (", send_res.error().message.c_str(), "), retrying in ",
                                   delay, "ms");
                        ++last_retries_;
                        sleep_(delay);
                        continue;
                    }
                    echo::error("send failed at offset ", chunk.offset, ": ", send_res.error().message.c_str());
                    return dp::result::err(send_res.error());
                }

                auto reply_res = await_reply(chunk);
                if (reply_res.is_err()) {
                    if (reply_res.error().code == dp::Error::TIMEOUT) {
                        echo::warn("no response for chunk at offset ", chunk.offset);
                        return dp::result::ok(ChunkResult::Silent);
                    }
                    echo::error("recv failed at offset ", chunk.offset, ": ", reply_res.error().message.c_str());
                    return dp::result::err(reply_res.error());
                }

                Message reply = std::move(reply_res.value());
                switch (protocol::classify(reply)) {
                case protocol::Response::Empty:
                    if (verbose_) {
                        echo::info("received nothing (empty)");
                    }
                    return dp::result::ok(ChunkResult::Silent);

                case protocol::Response::Ack:
                    if (verbose_) {
                        echo::info("received ACK for chunk at offset ", chunk.offset);
                    }
                    return dp::result::ok(ChunkResult::Acked);

                case protocol::Response::Nack:
                    if (!chunk.is_first) {
                        echo::error("checksum error at offset ", chunk.offset);
                        return dp::result::err(dp::Error::io_error(dp::String("checksum error at offset ") +
                                                                   std::to_string(chunk.offset).c_str()));
                    }
                    {
                        dp::u32 delay = backoff.next();
                        if (verbose_) {
                            echo::info("device busy, retrying in ", delay, "ms");
                        }
                        ++last_retries_;
                        sleep_(delay);
                    }
                    break;

                case protocol::Response::Unknown:
                    echo::warn("unknown response ", static_cast<dp::u32>(reply[0]));
                    return dp::result::ok(ChunkResult::Unknown);
                }
            }
        }
    };

} // namespace ruidapipe
