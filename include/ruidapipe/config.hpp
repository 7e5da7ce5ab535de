#pragma once

#include <ruidapipe/endpoint.hpp>
#include <ruidapipe/protocol.hpp>

#include <cstdlib>
#include <string>

namespace ruidapipe {

    namespace detail {

        // Parses a decimal environment value into [min, max]
        inline dp::Res<dp::u32> parse_env_u32(const char *name, const char *text, dp::u32 min, dp::u32 max) {
            if (text == nullptr || *text == '\0') {
                return dp::result::err(dp::Error::invalid_argument(dp::String(name) + " is empty"));
            }
            char *end = nullptr;
            errno = 0;
            unsigned long long value = std::strtoull(text, &end, 10);
            if (errno != 0 || end == text || *end != '\0' || text[0] == '-' || value < min || value > max) {
                echo::error("invalid value for ", name, ": '", text, "'");
                return dp::result::err(dp::Error::invalid_argument(dp::String("invalid value for ") + name + ": " +
                                                                   text));
            }
            return dp::result::ok(static_cast<dp::u32>(value));
        }

        inline bool env_flag(const char *text) {
            if (text == nullptr) {
                return false;
            }
            dp::String value(text);
            return value == "1" || value == "true" || value == "yes" || value == "on";
        }

    } // namespace detail

    // Sender role: one job file pushed to the board
    struct SenderConfig {
        UdpEndpoint device{"", protocol::DEVICE_PORT};
        dp::u16 local_port = protocol::SOURCE_PORT;
        dp::usize mtu = protocol::DEFAULT_MTU;
        dp::u32 ack_timeout_ms = protocol::ACK_TIMEOUT_MS;
        dp::u32 retry_initial_ms = protocol::RETRY_INITIAL_MS;
        dp::u32 retry_max_ms = protocol::RETRY_MAX_MS;
        dp::u32 chunk_pause_ms = 0; // debugging aid only
        bool verbose = false;

        // Overlays RUIDAPIPE_* environment variables
        // UDPSENDRUIDA_LOCALPORT is honoured for older setup scripts
        inline dp::Res<void> apply_env() {
            const char *port = std::getenv("RUIDAPIPE_LOCALPORT");
            const char *port_name = "RUIDAPIPE_LOCALPORT";
            if (port == nullptr) {
                port = std::getenv("UDPSENDRUIDA_LOCALPORT");
                port_name = "UDPSENDRUIDA_LOCALPORT";
            }
            if (port != nullptr) {
                auto res = detail::parse_env_u32(port_name, port, 1, 65535);
                if (res.is_err()) {
                    return dp::result::err(res.error());
                }
                local_port = static_cast<dp::u16>(res.value());
            }

            if (const char *mtu_env = std::getenv("RUIDAPIPE_MTU")) {
                auto res = detail::parse_env_u32("RUIDAPIPE_MTU", mtu_env, 1,
                                                 static_cast<dp::u32>(protocol::MAX_CHUNK_PAYLOAD));
                if (res.is_err()) {
                    return dp::result::err(res.error());
                }
                mtu = res.value();
            }

            if (const char *timeout = std::getenv("RUIDAPIPE_TIMEOUT_MS")) {
                auto res = detail::parse_env_u32("RUIDAPIPE_TIMEOUT_MS", timeout, 1, 3600000);
                if (res.is_err()) {
                    return dp::result::err(res.error());
                }
                ack_timeout_ms = res.value();
            }

            if (const char *verbose_env = std::getenv("RUIDAPIPE_VERBOSE")) {
                verbose = detail::env_flag(verbose_env);
            }
            return dp::result::ok();
        }

        inline dp::Res<void> validate() const {
            if (device.host.empty()) {
                return dp::result::err(dp::Error::invalid_argument("device address missing"));
            }
            if (device.port == 0) {
                return dp::result::err(dp::Error::invalid_argument("device port must be non-zero"));
            }
            if (mtu == 0 || mtu > protocol::MAX_CHUNK_PAYLOAD) {
                return dp::result::err(dp::Error::invalid_argument(dp::String("mtu out of range: ") +
                                                                   std::to_string(mtu).c_str()));
            }
            if (retry_initial_ms == 0 || retry_initial_ms > retry_max_ms) {
                return dp::result::err(dp::Error::invalid_argument("retry backoff bounds invalid"));
            }
            return dp::result::ok();
        }
    };

    // Relay role: world-facing listener in front of one board
    struct RelayConfig {
        UdpEndpoint world{"0.0.0.0", protocol::DEVICE_PORT};        // where workstations send jobs
        UdpEndpoint device_local{"0.0.0.0", protocol::SOURCE_PORT}; // where the board answers
        UdpEndpoint device{"", protocol::DEVICE_PORT};              // the board itself
        dp::u32 session_timeout_ms = protocol::SESSION_TIMEOUT_MS;
        Message end_token{protocol::END_OF_JOB};
        dp::String capture_dir = ".";
        bool verify_checksum = false;
        bool reap_idle = false;
        bool verbose = false;

        inline dp::Res<void> apply_env() {
            if (const char *timeout = std::getenv("RUIDAPIPE_TIMEOUT_MS")) {
                auto res = detail::parse_env_u32("RUIDAPIPE_TIMEOUT_MS", timeout, 1, 3600000);
                if (res.is_err()) {
                    return dp::result::err(res.error());
                }
                session_timeout_ms = res.value();
            }
            if (const char *dir = std::getenv("RUIDAPIPE_CAPTURE_DIR")) {
                capture_dir = dp::String(dir);
            }
            if (const char *verbose_env = std::getenv("RUIDAPIPE_VERBOSE")) {
                verbose = detail::env_flag(verbose_env);
            }
            return dp::result::ok();
        }

        inline dp::Res<void> validate() const {
            if (device.host.empty()) {
                return dp::result::err(dp::Error::invalid_argument("device address missing"));
            }
            if (world.port == 0 || device_local.port == 0 || device.port == 0) {
                return dp::result::err(dp::Error::invalid_argument("ports must be non-zero"));
            }
            if (world.port == device_local.port && world.host == device_local.host) {
                return dp::result::err(dp::Error::invalid_argument("world and device sockets share an address"));
            }
            if (session_timeout_ms == 0) {
                return dp::result::err(dp::Error::invalid_argument("session timeout must be non-zero"));
            }
            if (end_token.empty()) {
                return dp::result::err(dp::Error::invalid_argument("end token must not be empty"));
            }
            if (capture_dir.empty()) {
                return dp::result::err(dp::Error::invalid_argument("capture directory missing"));
            }
            return dp::result::ok();
        }
    };

} // namespace ruidapipe
