#include <doctest/doctest.h>
#include <ruidapipe/checksum.hpp>

TEST_CASE("sum16") {
    SUBCASE("Empty payload") {
        CHECK(ruidapipe::sum16(nullptr, 0) == 0);
    }

    SUBCASE("Plain byte sum") {
        ruidapipe::Message payload = {0x01, 0x02, 0x03};
        CHECK(ruidapipe::sum16(payload.data(), payload.size()) == 6);
    }

    SUBCASE("Truncated to 16 bits") {
        // 300 * 0xFF = 76500 = 0x12AD4 -> 0x2AD4
        ruidapipe::Message payload(300, 0xFF);
        CHECK(ruidapipe::sum16(payload.data(), payload.size()) == 0x2AD4);
    }
}

TEST_CASE("checksum encodes high byte first") {
    ruidapipe::Message payload = {0xFF, 0xFF, 0x02}; // 0x0200
    auto csum = ruidapipe::checksum(payload);
    CHECK(csum[0] == 0x02);
    CHECK(csum[1] == 0x00);
}

TEST_CASE("make_chunk layout") {
    ruidapipe::Message payload = {0xD7};
    auto chunk = ruidapipe::make_chunk(payload);
    REQUIRE(chunk.size() == 3);
    CHECK(chunk[0] == 0x00);
    CHECK(chunk[1] == 0xD7);
    CHECK(chunk[2] == 0xD7);
    CHECK(ruidapipe::chunk_payload_size(chunk) == 1);
    CHECK(ruidapipe::chunk_payload(chunk)[0] == 0xD7);
}

TEST_CASE("verify") {
    SUBCASE("Checksum prefix verifies for varied payloads") {
        for (dp::usize len : {0, 1, 2, 255, 256, 1470, 4000}) {
            ruidapipe::Message payload(len);
            for (dp::usize i = 0; i < len; ++i) {
                payload[i] = static_cast<dp::u8>((i * 31 + 7) % 256);
            }
            CHECK(ruidapipe::verify(ruidapipe::make_chunk(payload)));
        }
    }

    SUBCASE("Mutated payload byte fails") {
        ruidapipe::Message payload = {0x10, 0x20, 0x30, 0x40};
        auto chunk = ruidapipe::make_chunk(payload);
        for (dp::usize i = 2; i < chunk.size(); ++i) {
            auto mutated = chunk;
            mutated[i] = static_cast<dp::u8>(mutated[i] + 1);
            CHECK_FALSE(ruidapipe::verify(mutated));
        }
    }

    SUBCASE("Mutated prefix fails") {
        auto chunk = ruidapipe::make_chunk(ruidapipe::Message{0x01, 0x02});
        chunk[0] ^= 0x80;
        CHECK_FALSE(ruidapipe::verify(chunk));
    }

    SUBCASE("Too short to carry a prefix") {
        CHECK_FALSE(ruidapipe::verify(ruidapipe::Message{}));
        CHECK_FALSE(ruidapipe::verify(ruidapipe::Message{0x00}));
        CHECK(ruidapipe::verify(ruidapipe::Message{0x00, 0x00}));
    }
}
