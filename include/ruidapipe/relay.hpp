#pragma once

#include <ruidapipe/datagram.hpp>
#include <ruidapipe/session.hpp>
#include <ruidapipe/stats.hpp>

#include <atomic>
#include <poll.h>

namespace ruidapipe {

    // Transparent relay between workstations and one laser board
    //
    // World-facing datagrams pass through the SessionArbiter; admitted ones are sent
    // unmodified to the board, persisted, and ACKed to their sender. Everything else
    // is NACKed. Replies from the board are handed back to the stream owner.
    // Single-threaded: run() multiplexes both sockets with poll().
    class Relay {
      private:
        Datagram &world_;
        Datagram &device_;
        RelayConfig config_;
        SessionArbiter arbiter_;
        Session session_;
        UdpEndpoint board_; // config_.device as resolved by open()
        RelayStats stats_;
        std::atomic<bool> running_;
        std::atomic<bool> stop_requested_;
        dp::u32 recv_errors_in_row_;

        static constexpr dp::i32 POLL_INTERVAL_MS = 200; // stop() latency
        static constexpr dp::u32 MAX_CONSECUTIVE_RECV_ERRORS = 32;

        void reply(dp::u8 code, const UdpEndpoint &to) {
            auto res = world_.send_to(Message{code}, to);
            if (res.is_err()) {
                echo::warn("reply to ", to.to_string(), " failed: ", res.error().message.c_str());
            }
        }

        bool forward(const Message &msg) {
            auto res = device_.send_to(msg, board_);
            if (res.is_err()) {
                ++stats_.forward_failures;
                echo::warn("forward of ", msg.size(), " bytes to ", board_.to_string(),
                           " failed: ", res.error().message.c_str());
                return false;
            }
            ++stats_.datagrams_forwarded;
            return true;
        }

        // Drains one readable socket; a failed receive costs that datagram only
        void service(Datagram &socket, bool world) {
            auto recv_res = socket.recv_from();
            if (recv_res.is_err()) {
                if (recv_res.error().code != dp::Error::TIMEOUT) {
                    ++stats_.receive_errors;
                    ++recv_errors_in_row_;
                    echo::warn(world ? "world" : "device", " receive failed: ", recv_res.error().message.c_str());
                }
                return;
            }
            recv_errors_in_row_ = 0;
            auto [msg, src] = std::move(recv_res.value());
            if (world) {
                handle_world(msg, src, Clock::now());
            } else {
                handle_device(msg, src);
            }
        }

      public:
        Relay(Datagram &world, Datagram &device, const RelayConfig &config)
            : Relay(world, device, config, file_sink_factory(config.capture_dir)) {}

        Relay(Datagram &world, Datagram &device, const RelayConfig &config, SinkFactory sink_factory)
            : world_(world), device_(device), config_(config), arbiter_(config, std::move(sink_factory)),
              board_(config.device), running_(false), stop_requested_(false), recv_errors_in_row_(0) {
            echo::trace("Relay constructed");
        }

        ~Relay() { shutdown(); }

        Relay(const Relay &) = delete;
        Relay &operator=(const Relay &) = delete;

        // Binds the world-facing listener and the port the board answers to
        dp::Res<void> open() {
            auto res = world_.bind(config_.world);
            if (res.is_err()) {
                echo::error("cannot bind world socket ", config_.world.to_string());
                return res;
            }
            res = device_.bind(config_.device_local);
            if (res.is_err()) {
                echo::error("cannot bind device socket ", config_.device_local.to_string());
                world_.close();
                return res;
            }
            // Only the board may talk to the device-facing socket
            auto board_res = device_.connect(config_.device);
            if (board_res.is_err()) {
                echo::error("cannot reach board ", config_.device.to_string());
                device_.close();
                world_.close();
                return dp::result::err(board_res.error());
            }
            board_ = board_res.value();
            echo::info("relaying ", config_.world.to_string(), " -> ", board_.to_string());
            return dp::result::ok();
        }

        // One datagram from a workstation
        void handle_world(const Message &msg, const UdpEndpoint &from, Clock::time_point now) {
            ++stats_.datagrams_received;
            if (config_.verbose) {
                echo::info("received ", msg.size(), " bytes from ", from.to_string());
            }

            // Too large to forward unmodified
            if (msg.size() > protocol::MAX_DATAGRAM_SIZE) {
                echo::warn("rejecting ", msg.size(), " byte datagram from ", from.to_string());
                ++stats_.datagrams_rejected;
                reply(protocol::NACK, from);
                return;
            }

            Admission admission = arbiter_.admit(session_, msg, from, now);

            if (admission.superseded) {
                ++stats_.sessions_superseded;
                // The board must see the stale job end before the new one begins
                forward(admission.end_marker);
            }
            if (admission.failed) {
                ++stats_.sessions_failed;
            }
            if (admission.started) {
                ++stats_.sessions_started;
            }

            if (admission.verdict == Verdict::Reject) {
                ++stats_.datagrams_rejected;
                reply(protocol::NACK, from);
                return;
            }

            // Session is kept so the owner can resend
            if (!forward(msg)) {
                reply(protocol::NACK, from);
                return;
            }

            auto commit_res = arbiter_.commit(session_, msg, now);
            if (commit_res.is_err()) {
                ++stats_.sessions_failed;
                // The board already has this chunk; close its job the way a takeover would
                forward(arbiter_.end_marker());
                reply(protocol::NACK, from);
                return;
            }

            ++stats_.datagrams_admitted;
            stats_.bytes_persisted += chunk_payload_size(msg);
            if (commit_res.value()) {
                ++stats_.sessions_completed;
            }
            reply(protocol::ACK, from);
        }

        // One datagram from the board
        void handle_device(const Message &msg, const UdpEndpoint &from) {
            if (from != board_) {
                ++stats_.stray_datagrams;
                echo::warn("dropping ", msg.size(), " bytes from ", from.to_string(), ": not the board");
                return;
            }
            ++stats_.replies_from_device;

            // The relay has already acknowledged the chunk to its sender
            if (msg.size() == 1 && (msg[0] == protocol::ACK || msg[0] == protocol::NACK)) {
                if (msg[0] == protocol::NACK) {
                    echo::warn("board ", from.to_string(), " NACKed a forwarded chunk");
                } else {
                    echo::trace("board ", from.to_string(), " ACKed a forwarded chunk");
                }
                return;
            }

            if (!session_.busy) {
                echo::debug("dropping ", msg.size(), " byte reply from ", from.to_string(), ": no active stream");
                return;
            }

            auto res = world_.send_to(msg, session_.owner);
            if (res.is_err()) {
                echo::warn("reply to owner ", session_.owner.to_string(), " failed: ", res.error().message.c_str());
            }
        }

        // Ends an expired session without waiting for new traffic
        bool reap(Clock::time_point now) {
            if (!arbiter_.reap(session_, now)) {
                return false;
            }
            ++stats_.sessions_superseded;
            forward(arbiter_.end_marker());
            return true;
        }

        // Event loop; returns after stop() or on an unrecoverable socket error
        dp::Res<void> run() {
            struct pollfd fds[2] = {};
            fds[0].fd = world_.native_handle();
            fds[0].events = POLLIN;
            fds[1].fd = device_.native_handle();
            fds[1].events = POLLIN;

            if (fds[0].fd < 0 || fds[1].fd < 0) {
                echo::error("run called but sockets not open");
                return dp::result::err(dp::Error::invalid_argument("not bound"));
            }

            running_ = true;
            recv_errors_in_row_ = 0;
            echo::debug("relay loop started");

            dp::String failure;
            while (!stop_requested_ && failure.empty()) {
                if (config_.reap_idle) {
                    reap(Clock::now());
                }

                dp::i32 n = ::poll(fds, 2, POLL_INTERVAL_MS);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    echo::error("poll failed: ", strerror(errno));
                    failure = dp::String("poll failed: ") + strerror(errno);
                    break;
                }
                if (n == 0) {
                    continue;
                }

                for (dp::usize i = 0; i < 2 && failure.empty(); ++i) {
                    const char *side = i == 0 ? "world" : "device";
                    if (fds[i].revents & POLLNVAL) {
                        echo::error(side, " socket closed under the relay");
                        failure = dp::String(side) + " socket closed";
                    } else if (fds[i].revents & (POLLIN | POLLERR)) {
                        // A pending socket error is collected by the receive
                        service(i == 0 ? world_ : device_, i == 0);
                        if (recv_errors_in_row_ >= MAX_CONSECUTIVE_RECV_ERRORS) {
                            echo::error(side, " socket keeps failing, giving up");
                            failure = dp::String(side) + " socket keeps failing";
                        }
                    }
                }
            }

            running_ = false;
            stop_requested_ = false;
            shutdown();
            echo::debug("relay loop stopped");
            if (!failure.empty()) {
                return dp::result::err(dp::Error::io_error(failure));
            }
            return dp::result::ok();
        }

        // Async-signal-safe: only raises a flag. A stop() that lands before run()
        // makes the next run() return at once.
        void stop() { stop_requested_ = true; }

        bool is_running() const { return running_; }

        // Closes the capture of an unfinished stream
        void shutdown() {
            if (session_.busy) {
                echo::info("closing unfinished stream of ", session_.owner.to_string());
                SessionArbiter::finish(session_);
            }
        }

        const Session &session() const { return session_; }

        const RelayStats &stats() const { return stats_; }
    };

} // namespace ruidapipe
