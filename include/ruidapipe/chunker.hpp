#pragma once

#include <ruidapipe/checksum.hpp>

#include <string>

namespace ruidapipe {

    // One wire chunk of a job
    struct Chunk {
        Message bytes;       // checksum prefix + payload slice, ready to send
        dp::usize offset;    // position of the payload slice inside the job
        dp::usize length;    // payload length, excluding checksum
        bool is_first;       // only the first chunk is retried on NACK

        inline const dp::u8 *payload() const { return bytes.data() + protocol::CHECKSUM_SIZE; }
    };

    // Lazy producer of wire chunks over a job buffer
    // The job must outlive the splitter; reset() restarts from the first chunk
    class ChunkSplitter {
      private:
        const Message &job_;
        dp::usize mtu_;
        dp::usize position_;

      public:
        ChunkSplitter(const Message &job, dp::usize mtu) : job_(job), mtu_(mtu), position_(0) {
            echo::trace("ChunkSplitter over ", job.size(), " bytes, mtu=", mtu);
        }

        // Number of chunks the whole job produces: ceil(len / mtu), zero for an empty job
        dp::usize count() const {
            if (mtu_ == 0 || job_.empty()) {
                return 0;
            }
            return (job_.size() + mtu_ - 1) / mtu_;
        }

        bool has_next() const { return mtu_ > 0 && position_ < job_.size(); }

        // Precondition: has_next()
        Chunk next() {
            dp::usize length = job_.size() - position_;
            if (length > mtu_) {
                length = mtu_;
            }

            Chunk chunk{make_chunk(job_.data() + position_, length), position_, length, position_ == 0};
            echo::trace("chunk offset=", position_, " len=", length, chunk.is_first ? " (first)" : "");
            position_ += length;
            return chunk;
        }

        void reset() { position_ = 0; }

        dp::usize mtu() const { return mtu_; }
    };

    // Materialises every chunk of a job
    inline dp::Vector<Chunk> split(const Message &job, dp::usize mtu) {
        dp::Vector<Chunk> chunks;
        ChunkSplitter splitter(job, mtu);
        while (splitter.has_next()) {
            chunks.push_back(splitter.next());
        }
        return chunks;
    }

    // split() with the MTU range checked
    inline dp::Res<dp::Vector<Chunk>> split_checked(const Message &job, dp::usize mtu) {
        if (mtu == 0 || mtu > protocol::MAX_CHUNK_PAYLOAD) {
            echo::error("invalid mtu: ", mtu);
            return dp::result::err(dp::Error::invalid_argument(dp::String("invalid mtu: ") +
                                                               std::to_string(mtu).c_str()));
        }
        return dp::result::ok(split(job, mtu));
    }

} // namespace ruidapipe
