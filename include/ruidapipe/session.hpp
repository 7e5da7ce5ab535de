#pragma once

#include <ruidapipe/checksum.hpp>
#include <ruidapipe/config.hpp>
#include <ruidapipe/sink.hpp>

#include <chrono>
#include <memory>

namespace ruidapipe {

    using Clock = std::chrono::steady_clock;

    /// One logical job stream seen by the relay
    /// Idle when busy == false; the owner is fixed until the session ends
    struct Session {
        bool busy = false;
        UdpEndpoint owner{"", 0};
        Clock::time_point started{};
        Clock::time_point last_activity{};
        std::unique_ptr<CaptureSink> sink;
        dp::u64 datagrams = 0;
        dp::u64 bytes = 0;
    };

    enum class Verdict {
        Accept, // forward, persist, ACK
        Reject, // NACK, drop
    };

    /// Outcome of admitting one world-facing datagram
    struct Admission {
        Verdict verdict = Verdict::Reject;
        bool started = false;    // a new session was opened for this datagram
        bool superseded = false; // a stale session was forcibly ended first
        bool failed = false;     // the new session could not open its sink
        UdpEndpoint previous_owner{"", 0};
        Message end_marker; // to forward on behalf of the superseded session
    };

    /// Ownership and framing rules for the relay's single stream
    ///
    /// The arbiter holds no stream state of its own: the caller owns the Session and
    /// passes it to every call. Timeouts are evaluated lazily when a datagram arrives,
    /// or from reap() if the caller chooses to poll it.
    class SessionArbiter {
      private:
        Clock::duration timeout_;
        Message end_token_;
        bool verify_checksum_;
        SinkFactory sink_factory_;

        void start(Session &session, const UdpEndpoint &from, Clock::time_point now, Admission &admission) {
            auto sink_res = sink_factory_();
            if (sink_res.is_err()) {
                echo::error("session for ", from.to_string(), " not started: ", sink_res.error().message.c_str());
                admission.failed = true;
                admission.verdict = Verdict::Reject;
                return;
            }

            session.busy = true;
            session.owner = from;
            session.started = now;
            session.last_activity = now;
            session.sink = std::move(sink_res.value());
            session.datagrams = 0;
            session.bytes = 0;

            admission.started = true;
            admission.verdict = Verdict::Accept;
            echo::info("stream started by ", from.to_string(), " -> ", session.sink->name().c_str());
        }

      public:
        SessionArbiter(const RelayConfig &config, SinkFactory sink_factory)
            : timeout_(std::chrono::milliseconds(config.session_timeout_ms)), end_token_(config.end_token),
              verify_checksum_(config.verify_checksum), sink_factory_(std::move(sink_factory)) {}

        /// True when the owner has been quiet for longer than the timeout
        bool expired(const Session &session, Clock::time_point now) const {
            return session.busy && (now - session.last_activity) > timeout_;
        }

        /// End-token search over the chunk payload (the datagram minus its checksum prefix)
        bool has_end_token(const Message &datagram) const {
            return contains_bytes(chunk_payload(datagram), chunk_payload_size(datagram), end_token_);
        }

        /// The datagram forwarded downstream when a stream is ended on its owner's behalf
        Message end_marker() const { return make_chunk(end_token_); }

        /// Decides whether a datagram may enter the stream, opening or superseding
        /// a session when needed. Never forwards or writes anything itself.
        Admission admit(Session &session, const Message &datagram, const UdpEndpoint &from, Clock::time_point now) {
            Admission admission;

            if (verify_checksum_ && !verify(datagram)) {
                echo::debug("rejecting ", datagram.size(), " bytes from ", from.to_string(), ": bad checksum");
                return admission;
            }

            if (!session.busy) {
                start(session, from, now, admission);
                return admission;
            }

            if (from == session.owner) {
                admission.verdict = Verdict::Accept;
                return admission;
            }

            if (!expired(session, now)) {
                echo::debug("rejecting ", from.to_string(), ": stream owned by ", session.owner.to_string());
                return admission;
            }

            auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - session.last_activity);
            echo::warn("stream of ", session.owner.to_string(), " idle for ", idle.count(), "ms, handing over to ",
                       from.to_string());
            admission.superseded = true;
            admission.previous_owner = session.owner;
            admission.end_marker = end_marker();
            finish(session);

            start(session, from, now, admission);
            return admission;
        }

        /// Persists an accepted datagram that has been forwarded, refreshes activity
        /// and closes the session when the end token is present.
        /// Returns true when the stream ended. A sink error ends the session.
        dp::Res<bool> commit(Session &session, const Message &datagram, Clock::time_point now) {
            if (!session.busy || !session.sink) {
                return dp::result::err(dp::Error::not_found("no active session"));
            }

            dp::usize len = chunk_payload_size(datagram);
            if (len > 0) {
                auto res = session.sink->write(chunk_payload(datagram), len);
                if (res.is_err()) {
                    echo::error("capture failed, dropping stream of ", session.owner.to_string());
                    finish(session);
                    return dp::result::err(res.error());
                }
            }

            ++session.datagrams;
            session.bytes += len;
            session.last_activity = now;

            if (has_end_token(datagram)) {
                echo::info("stream of ", session.owner.to_string(), " complete: ", session.datagrams, " datagrams, ",
                           session.bytes, " bytes");
                finish(session);
                return dp::result::ok(true);
            }
            return dp::result::ok(false);
        }

        /// Active expiry for callers that run a reaper. Ends an expired session and
        /// returns true; the caller forwards end_marker() downstream.
        bool reap(Session &session, Clock::time_point now) {
            if (!expired(session, now)) {
                return false;
            }
            echo::warn("reaping idle stream of ", session.owner.to_string());
            finish(session);
            return true;
        }

        /// Closes the sink and returns the session to idle
        static void finish(Session &session) {
            if (session.sink) {
                session.sink->close();
                session.sink.reset();
            }
            session.busy = false;
            session.owner = UdpEndpoint{"", 0};
            session.datagrams = 0;
            session.bytes = 0;
        }
    };

} // namespace ruidapipe
