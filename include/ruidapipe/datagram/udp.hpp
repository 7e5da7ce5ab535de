#pragma once

#include <ruidapipe/datagram.hpp>
#include <ruidapipe/protocol.hpp>

#include <arpa/inet.h>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>

namespace ruidapipe {

    // UDP datagram implementation using BSD sockets
    // Unreliable, unordered, connectionless transport
    // Message boundaries preserved - the datagram length delimits the chunk
    class UdpDatagram : public Datagram {
      private:
        dp::i32 fd_;
        bool bound_;
        UdpEndpoint local_endpoint_;

        static constexpr dp::usize MAX_UDP_SIZE = protocol::MAX_DATAGRAM_SIZE;

        dp::Res<void> ensure_socket() {
            if (fd_ >= 0) {
                return dp::result::ok();
            }
            fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }
            echo::trace("udp socket created fd=", fd_);
            return dp::result::ok();
        }

        // IPv4 address of host:port, resolving names
        static dp::Res<void> resolve(const UdpEndpoint &dest, struct sockaddr_in &out) {
            struct addrinfo hints = {};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_DGRAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(dest.port).c_str());
            dp::i32 ret = ::getaddrinfo(dest.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0) {
                echo::error("getaddrinfo ", dest.to_string(), " failed: ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error("getaddrinfo failed"));
            }
            std::memcpy(&out, result->ai_addr, sizeof(out));
            ::freeaddrinfo(result);
            return dp::result::ok();
        }

        static UdpEndpoint to_endpoint(const struct sockaddr_in &addr) {
            char ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
            return UdpEndpoint{dp::String(ip), ntohs(addr.sin_port)};
        }

        // recvfrom with EINTR retried; -1 leaves errno set
        dp::isize recv_retrying(void *buf, dp::usize len, dp::i32 flags, struct sockaddr_in *src) {
            socklen_t src_len = sizeof(struct sockaddr_in);
            while (true) {
                dp::isize n = ::recvfrom(fd_, buf, len, flags, reinterpret_cast<struct sockaddr *>(src),
                                         src != nullptr ? &src_len : nullptr);
                if (n >= 0 || errno != EINTR) {
                    return n;
                }
                echo::trace("recvfrom interrupted by signal, retrying");
            }
        }

        dp::Error recv_error() const {
            // EAGAIN/EWOULDBLOCK: Timeout - expected behavior with SO_RCVTIMEO
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                echo::trace("recvfrom timeout (fd=", fd_, ")");
                return dp::Error::timeout("recv timeout");
            }
            echo::error("recvfrom failed: ", strerror(errno));
            return dp::Error::io_error(dp::String("recv error: ") + strerror(errno));
        }

      public:
        UdpDatagram() : fd_(-1), bound_(false) { echo::trace("UdpDatagram constructed"); }

        ~UdpDatagram() override {
            if (fd_ >= 0) {
                close();
            }
        }

        UdpDatagram(const UdpDatagram &) = delete;
        UdpDatagram &operator=(const UdpDatagram &) = delete;

        // Bind to local address for receiving
        dp::Res<void> bind(const UdpEndpoint &endpoint) override {
            echo::trace("binding to ", endpoint.to_string());

            auto sock_res = ensure_socket();
            if (sock_res.is_err()) {
                return sock_res;
            }

            // Set SO_REUSEADDR
            dp::i32 opt = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            // Bind to address
            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(endpoint.port);

            if (endpoint.host == "0.0.0.0" || endpoint.host.empty()) {
                addr.sin_addr.s_addr = INADDR_ANY;
            } else {
                if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) <= 0) {
                    ::close(fd_);
                    fd_ = -1;
                    echo::error("invalid address: ", endpoint.host.c_str());
                    return dp::result::err(dp::Error::invalid_argument("invalid argument"));
                }
            }

            if (::bind(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                ::close(fd_);
                fd_ = -1;
                echo::error("bind failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }

            bound_ = true;
            local_endpoint_ = endpoint;
            echo::debug("UdpDatagram bound to port ", endpoint.port);
            echo::info("UdpDatagram listening on ", endpoint.to_string());

            return dp::result::ok();
        }

        // Connected UDP: the kernel drops datagrams from other sources
        dp::Res<UdpEndpoint> connect(const UdpEndpoint &peer) override {
            auto sock_res = ensure_socket();
            if (sock_res.is_err()) {
                return dp::result::err(sock_res.error());
            }

            struct sockaddr_in addr = {};
            auto addr_res = resolve(peer, addr);
            if (addr_res.is_err()) {
                return dp::result::err(addr_res.error());
            }

            if (::connect(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                echo::error("connect ", peer.to_string(), " failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("connect failed: ") + strerror(errno)));
            }

            UdpEndpoint resolved = to_endpoint(addr);
            echo::debug("UdpDatagram connected to ", resolved.to_string());
            return dp::result::ok(resolved);
        }

        // Send a message to a specific destination
        dp::Res<void> send_to(const Message &msg, const UdpEndpoint &dest) override {
            auto sock_res = ensure_socket();
            if (sock_res.is_err()) {
                return sock_res;
            }

            // Check message size
            if (msg.size() > MAX_UDP_SIZE) {
                echo::warn("message too large: ", msg.size(), " > ", MAX_UDP_SIZE);
                return dp::result::err(dp::Error::invalid_argument(dp::String("message too large: ") +
                                                                   std::to_string(msg.size()).c_str()));
            }

            echo::trace("sendto ", dest.to_string(), " len=", msg.size());

            struct sockaddr_in addr = {};
            auto addr_res = resolve(dest, addr);
            if (addr_res.is_err()) {
                return addr_res;
            }

            dp::isize n = ::sendto(fd_, msg.data(), msg.size(), 0, (struct sockaddr *)&addr, sizeof(addr));

            if (n < 0) {
                echo::error("sendto failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }

            echo::debug("sent ", n, " bytes to ", dest.to_string());
            return dp::result::ok();
        }

        // Receive a message
        dp::Res<dp::Pair<Message, UdpEndpoint>> recv_from() override {
            if (fd_ < 0) {
                echo::error("recv_from called but socket not created");
                return dp::result::err(dp::Error::invalid_argument("not bound"));
            }

            echo::trace("recv_from waiting for message");

            // Peek at the real length so a datagram is never cut short
            dp::isize pending = recv_retrying(nullptr, 0, MSG_PEEK | MSG_TRUNC, nullptr);
            if (pending < 0) {
                return dp::result::err(recv_error());
            }

            Message msg(static_cast<dp::usize>(pending));
            struct sockaddr_in src_addr = {};
            dp::isize n = recv_retrying(msg.data(), msg.size(), MSG_TRUNC, &src_addr);
            if (n < 0) {
                return dp::result::err(recv_error());
            }
            if (static_cast<dp::usize>(n) > msg.size()) {
                echo::error("datagram of ", n, " bytes truncated to ", msg.size());
                return dp::result::err(dp::Error::io_error("datagram truncated"));
            }
            msg.resize(static_cast<dp::usize>(n));

            UdpEndpoint src_endpoint = to_endpoint(src_addr);

            echo::debug("received ", n, " bytes from ", src_endpoint.to_string());

            return dp::result::ok(dp::Pair<Message, UdpEndpoint>(std::move(msg), src_endpoint));
        }

        // Set receive timeout in milliseconds
        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) override {
            auto sock_res = ensure_socket();
            if (sock_res.is_err()) {
                return sock_res;
            }

            struct timeval tv;
            tv.tv_sec = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;

            if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
                echo::error("setsockopt SO_RCVTIMEO failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("failed to set timeout"));
            }

            echo::trace("set recv timeout to ", timeout_ms, "ms");
            return dp::result::ok();
        }

        dp::i32 native_handle() const override { return fd_; }

        bool is_bound() const { return bound_; }

        // Close the socket
        void close() override {
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                bound_ = false;
                echo::debug("UdpDatagram closed");
            }
        }
    };

} // namespace ruidapipe
