#pragma once

#include <ruidapipe/common.hpp>

#include <chrono>
#include <cstdio>
#include <fcntl.h>
#include <functional>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace ruidapipe {

    // Byte destination owned by one relay session
    class CaptureSink {
      public:
        virtual ~CaptureSink() = default;

        // Append bytes in arrival order
        virtual dp::Res<void> write(const dp::u8 *data, dp::usize len) = 0;

        // Flush and release; safe to call more than once
        virtual void close() = 0;

        virtual bool is_open() const = 0;

        virtual dp::String name() const = 0;
    };

    // Creates the sink for a new session
    using SinkFactory = std::function<dp::Res<std::unique_ptr<CaptureSink>>()>;

    // out_<unix seconds>.<microseconds>.rd
    inline dp::String capture_file_name(std::chrono::system_clock::time_point when) {
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(when.time_since_epoch()).count();
        char buf[64];
        std::snprintf(buf, sizeof(buf), "out_%lld.%06lld.rd", static_cast<long long>(us / 1000000),
                      static_cast<long long>(us % 1000000));
        return dp::String(buf);
    }

    // Capture file on disk; closed by the destructor on every path
    class FileSink : public CaptureSink {
      private:
        dp::i32 fd_;
        dp::String path_;
        dp::usize written_;

        FileSink(dp::i32 fd, const dp::String &path) : fd_(fd), path_(path), written_(0) {}

      public:
        ~FileSink() override { close(); }

        FileSink(const FileSink &) = delete;
        FileSink &operator=(const FileSink &) = delete;

        // Exclusive create; an existing file is never overwritten
        static dp::Res<std::unique_ptr<CaptureSink>> create(const dp::String &path) {
            dp::i32 fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
            if (fd < 0) {
                echo::error("cannot create capture file ", path.c_str(), ": ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("open failed: ") + strerror(errno)));
            }
            echo::info("capture file ", path.c_str(), " opened");
            return dp::result::ok(std::unique_ptr<CaptureSink>(new FileSink(fd, path)));
        }

        dp::Res<void> write(const dp::u8 *data, dp::usize len) override {
            if (fd_ < 0) {
                return dp::result::err(dp::Error::not_found("capture file closed"));
            }
            auto res = write_exact(fd_, data, len);
            if (res.is_err()) {
                echo::error("write to ", path_.c_str(), " failed: ", res.error().message.c_str());
                return res;
            }
            written_ += len;
            return dp::result::ok();
        }

        void close() override {
            if (fd_ >= 0) {
                if (::fsync(fd_) < 0) {
                    echo::warn("fsync ", path_.c_str(), " failed: ", strerror(errno));
                }
                ::close(fd_);
                fd_ = -1;
                echo::info("capture file ", path_.c_str(), " closed after ", written_, " bytes");
            }
        }

        bool is_open() const override { return fd_ >= 0; }

        dp::String name() const override { return path_; }

        dp::usize bytes_written() const { return written_; }
    };

    // Timestamped capture files under dir; a name clash gets a numeric suffix
    inline SinkFactory file_sink_factory(const dp::String &dir) {
        return [dir]() -> dp::Res<std::unique_ptr<CaptureSink>> {
            dp::String base = dir + "/" + capture_file_name(std::chrono::system_clock::now());
            dp::String path = base;
            for (dp::u32 attempt = 1; ::access(path.c_str(), F_OK) == 0 && attempt < 16; ++attempt) {
                echo::debug("capture file exists: ", path.c_str());
                path = base + "." + dp::String(std::to_string(attempt).c_str());
            }
            return FileSink::create(path);
        };
    }

} // namespace ruidapipe
