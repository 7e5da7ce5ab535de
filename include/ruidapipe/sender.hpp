#pragma once

#include <ruidapipe/ack.hpp>

namespace ruidapipe {

    enum class TransferOutcome {
        Complete,        // every chunk ACKed (or nothing to send)
        PeerSilent,      // a chunk got no reply; the transfer stopped there
        UnknownResponse, // a chunk got an unrecognised reply; the transfer stopped there
    };

    inline const char *to_string(TransferOutcome outcome) {
        switch (outcome) {
        case TransferOutcome::Complete:
            return "complete";
        case TransferOutcome::PeerSilent:
            return "peer silent";
        case TransferOutcome::UnknownResponse:
            return "unknown response";
        }
        return "unknown";
    }

    struct TransferReport {
        TransferOutcome outcome = TransferOutcome::Complete;
        dp::usize chunks_total = 0;
        dp::usize chunks_acked = 0;
        dp::u32 retries = 0;
        dp::usize bytes_sent = 0; // payload bytes of ACKed chunks
    };

    // Pushes a whole job to the board, one acknowledged chunk at a time
    // A job owns the link for the duration of write(); there is no concurrency within a job
    class Sender {
      private:
        Datagram &link_;
        SenderConfig config_;
        SleepFn sleep_;

      public:
        Sender(Datagram &link, const SenderConfig &config, SleepFn sleep = sleep_ms)
            : link_(link), config_(config), sleep_(std::move(sleep)) {}

        // Binds the local source port, locks the link to the board and arms the
        // per-chunk reply timeout
        dp::Res<void> open() {
            auto bind_res = link_.bind(UdpEndpoint{"0.0.0.0", config_.local_port});
            if (bind_res.is_err()) {
                echo::error("cannot bind local port ", config_.local_port);
                return bind_res;
            }
            auto peer_res = link_.connect(config_.device);
            if (peer_res.is_err()) {
                echo::error("cannot reach ", config_.device.to_string());
                return dp::result::err(peer_res.error());
            }
            // Replies are matched against the resolved address
            config_.device = peer_res.value();
            return link_.set_recv_timeout(config_.ack_timeout_ms);
        }

        const UdpEndpoint &device() const { return config_.device; }

        dp::Res<TransferReport> write(const Message &job) {
            if (config_.mtu == 0 || config_.mtu > protocol::MAX_CHUNK_PAYLOAD) {
                echo::error("invalid mtu: ", config_.mtu);
                return dp::result::err(dp::Error::invalid_argument("invalid mtu"));
            }

            TransferReport report;
            ChunkSplitter splitter(job, config_.mtu);
            report.chunks_total = splitter.count();

            if (report.chunks_total == 0) {
                echo::info("empty job, nothing to send");
                return dp::result::ok(report);
            }

            echo::info("sending ", job.size(), " bytes in ", report.chunks_total, " chunks to ",
                       config_.device.to_string());

            AckEngine engine(link_, config_, sleep_);
            while (splitter.has_next()) {
                Chunk chunk = splitter.next();
                auto res = engine.deliver(chunk);
                report.retries += engine.last_retries();
                if (res.is_err()) {
                    echo::error("transfer aborted after ", report.chunks_acked, "/", report.chunks_total, " chunks");
                    return dp::result::err(res.error());
                }

                if (res.value() == ChunkResult::Silent) {
                    report.outcome = TransferOutcome::PeerSilent;
                    echo::warn("peer went silent after ", report.chunks_acked, "/", report.chunks_total, " chunks");
                    return dp::result::ok(report);
                }
                if (res.value() == ChunkResult::Unknown) {
                    report.outcome = TransferOutcome::UnknownResponse;
                    return dp::result::ok(report);
                }

                ++report.chunks_acked;
                report.bytes_sent += chunk.length;
                if (config_.verbose) {
                    echo::info("chunk ", report.chunks_acked, "/", report.chunks_total, " acknowledged");
                }
            }

            echo::info("transfer complete: ", report.bytes_sent, " bytes, ", report.retries, " retries");
            return dp::result::ok(report);
        }
    };

} // namespace ruidapipe
