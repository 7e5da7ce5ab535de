#include <chrono>
#include <doctest/doctest.h>
#include <ruidapipe/checksum.hpp>
#include <ruidapipe/datagram/udp.hpp>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

TEST_CASE("UdpDatagram - Basic send and receive") {
    SUBCASE("Chunk arrives with its boundary intact") {
        ruidapipe::UdpDatagram receiver;
        ruidapipe::UdpEndpoint recv_endpoint{"127.0.0.1", 19201};

        auto bind_res = receiver.bind(recv_endpoint);
        REQUIRE(bind_res.is_ok());
        REQUIRE(receiver.set_recv_timeout(2000).is_ok());

        std::thread sender_thread([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            ruidapipe::UdpDatagram sender;

            ruidapipe::Message chunk = ruidapipe::make_chunk(ruidapipe::Message(1470, 0x5A));
            auto send_res = sender.send_to(chunk, recv_endpoint);
            CHECK(send_res.is_ok());

            sender.close();
        });

        auto recv_res = receiver.recv_from();
        REQUIRE(recv_res.is_ok());

        auto [msg, src] = std::move(recv_res.value());
        CHECK(msg.size() == 1472);
        CHECK(ruidapipe::verify(msg));
        CHECK(src.host == "127.0.0.1");

        sender_thread.join();
        receiver.close();
    }

    SUBCASE("Single byte reply") {
        ruidapipe::UdpDatagram receiver;
        ruidapipe::UdpEndpoint recv_endpoint{"127.0.0.1", 19202};

        REQUIRE(receiver.bind(recv_endpoint).is_ok());
        REQUIRE(receiver.set_recv_timeout(2000).is_ok());

        ruidapipe::UdpDatagram sender;
        REQUIRE(sender.send_to(ruidapipe::protocol::ack(), recv_endpoint).is_ok());

        auto recv_res = receiver.recv_from();
        REQUIRE(recv_res.is_ok());
        auto [msg, src] = std::move(recv_res.value());
        CHECK(msg.size() == 1);
        CHECK(msg[0] == ruidapipe::protocol::ACK);

        sender.close();
        receiver.close();
    }
}

TEST_CASE("UdpDatagram - Receive timeout") {
    ruidapipe::UdpDatagram receiver;
    REQUIRE(receiver.bind(ruidapipe::UdpEndpoint{"127.0.0.1", 19203}).is_ok());
    REQUIRE(receiver.set_recv_timeout(100).is_ok());

    auto start = std::chrono::steady_clock::now();
    auto recv_res = receiver.recv_from();
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(recv_res.is_err());
    CHECK(recv_res.error().code == dp::Error::TIMEOUT);
    CHECK(elapsed >= std::chrono::milliseconds(90));

    receiver.close();
}

TEST_CASE("UdpDatagram - Connected peer") {
    ruidapipe::UdpDatagram board;
    ruidapipe::UdpEndpoint board_endpoint{"127.0.0.1", 19211};
    REQUIRE(board.bind(board_endpoint).is_ok());

    ruidapipe::UdpDatagram link;
    REQUIRE(link.bind(ruidapipe::UdpEndpoint{"127.0.0.1", 19212}).is_ok());
    REQUIRE(link.set_recv_timeout(300).is_ok());

    SUBCASE("Resolves names to the address replies come from") {
        auto peer_res = link.connect(ruidapipe::UdpEndpoint{"localhost", 19211});
        REQUIRE(peer_res.is_ok());
        CHECK(peer_res.value() == board_endpoint);
    }

    SUBCASE("Only the peer is heard") {
        REQUIRE(link.connect(board_endpoint).is_ok());

        ruidapipe::UdpDatagram other;
        REQUIRE(other.send_to(ruidapipe::protocol::ack(), ruidapipe::UdpEndpoint{"127.0.0.1", 19212}).is_ok());
        other.close();

        auto stray = link.recv_from();
        REQUIRE(stray.is_err());
        CHECK(stray.error().code == dp::Error::TIMEOUT);

        REQUIRE(board.send_to(ruidapipe::protocol::ack(), ruidapipe::UdpEndpoint{"127.0.0.1", 19212}).is_ok());
        auto reply = link.recv_from();
        REQUIRE(reply.is_ok());
        auto [msg, src] = std::move(reply.value());
        CHECK(src == board_endpoint);
        REQUIRE(msg.size() == 1);
        CHECK(msg[0] == ruidapipe::protocol::ACK);
    }

    SUBCASE("Unresolvable peer") {
        CHECK(link.connect(ruidapipe::UdpEndpoint{"no-such-host.invalid", 19211}).is_err());
    }

    link.close();
    board.close();
}

TEST_CASE("UdpDatagram - Datagrams above the send limit arrive whole") {
    ruidapipe::UdpDatagram receiver;
    ruidapipe::UdpEndpoint recv_endpoint{"127.0.0.1", 19213};
    REQUIRE(receiver.bind(recv_endpoint).is_ok());
    REQUIRE(receiver.set_recv_timeout(2000).is_ok());

    // Plain socket: UdpDatagram itself refuses to send this much
    int raw = ::socket(AF_INET, SOCK_DGRAM, 0);
    REQUIRE(raw >= 0);
    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(19213);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    std::vector<dp::u8> big(12000, 0x7E);
    CHECK(::sendto(raw, big.data(), big.size(), 0, (struct sockaddr *)&addr, sizeof(addr)) == 12000);
    ::close(raw);

    auto recv_res = receiver.recv_from();
    REQUIRE(recv_res.is_ok());
    auto [msg, src] = std::move(recv_res.value());
    CHECK(msg.size() == 12000);
    CHECK(msg[11999] == 0x7E);

    receiver.close();
}

TEST_CASE("UdpDatagram - Error handling") {
    SUBCASE("Oversized datagram is refused") {
        ruidapipe::UdpDatagram sender;
        ruidapipe::Message big(ruidapipe::protocol::MAX_DATAGRAM_SIZE + 1, 0x00);
        auto res = sender.send_to(big, ruidapipe::UdpEndpoint{"127.0.0.1", 19204});
        CHECK(res.is_err());
        sender.close();
    }

    SUBCASE("Invalid bind address") {
        ruidapipe::UdpDatagram socket;
        auto res = socket.bind(ruidapipe::UdpEndpoint{"not-an-ip", 19205});
        CHECK(res.is_err());
        CHECK_FALSE(socket.is_bound());
        CHECK(socket.native_handle() < 0);
    }

    SUBCASE("Receive before bind") {
        ruidapipe::UdpDatagram socket;
        CHECK(socket.recv_from().is_err());
    }

    SUBCASE("Close is idempotent") {
        ruidapipe::UdpDatagram socket;
        REQUIRE(socket.bind(ruidapipe::UdpEndpoint{"127.0.0.1", 19206}).is_ok());
        CHECK(socket.is_bound());
        socket.close();
        socket.close();
        CHECK_FALSE(socket.is_bound());
    }
}
