#include <doctest/doctest.h>
#include <ruidapipe/sink.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

namespace {

    // Fresh directory under /tmp, removed with its files on scope exit
    struct TempDir {
        std::string path;

        TempDir() {
            char tmpl[] = "/tmp/ruidapipe_sink_XXXXXX";
            char *dir = ::mkdtemp(tmpl);
            REQUIRE(dir != nullptr);
            path = dir;
        }

        ~TempDir() {
            std::string cmd = "rm -rf '" + path + "'";
            CHECK(std::system(cmd.c_str()) == 0);
        }
    };

    std::string slurp(const std::string &file) {
        std::ifstream in(file, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

} // namespace

TEST_CASE("capture_file_name - Timestamp layout") {
    std::chrono::system_clock::time_point when{std::chrono::microseconds(1700000000000042LL)};
    CHECK(ruidapipe::capture_file_name(when) == "out_1700000000.000042.rd");

    std::chrono::system_clock::time_point whole{std::chrono::seconds(12)};
    CHECK(ruidapipe::capture_file_name(whole) == "out_12.000000.rd");
}

TEST_CASE("FileSink - Write and close") {
    TempDir dir;
    std::string file = dir.path + "/job.rd";

    auto res = ruidapipe::FileSink::create(dp::String(file.c_str()));
    REQUIRE(res.is_ok());
    auto sink = std::move(res.value());
    CHECK(sink->is_open());
    CHECK(sink->name() == dp::String(file.c_str()));

    const dp::u8 first[] = {0xD8, 0x12};
    const dp::u8 second[] = {0xD7};
    REQUIRE(sink->write(first, sizeof(first)).is_ok());
    REQUIRE(sink->write(second, sizeof(second)).is_ok());
    sink->close();
    CHECK_FALSE(sink->is_open());

    std::string bytes = slurp(file);
    REQUIRE(bytes.size() == 3);
    CHECK(static_cast<dp::u8>(bytes[0]) == 0xD8);
    CHECK(static_cast<dp::u8>(bytes[2]) == 0xD7);

    SUBCASE("Write after close fails") {
        CHECK(sink->write(first, sizeof(first)).is_err());
    }

    SUBCASE("Second close is harmless") {
        sink->close();
        CHECK_FALSE(sink->is_open());
    }
}

TEST_CASE("FileSink - Never overwrites") {
    TempDir dir;
    std::string file = dir.path + "/taken.rd";
    {
        std::ofstream out(file);
        out << "x";
    }
    auto res = ruidapipe::FileSink::create(dp::String(file.c_str()));
    CHECK(res.is_err());
    CHECK(slurp(file) == "x");
}

TEST_CASE("FileSink - Missing directory") {
    auto res = ruidapipe::FileSink::create("/nonexistent_ruidapipe_dir/out.rd");
    CHECK(res.is_err());
}

TEST_CASE("file_sink_factory - Distinct files per session") {
    TempDir dir;
    auto factory = ruidapipe::file_sink_factory(dp::String(dir.path.c_str()));

    // Back-to-back sessions may land on the same microsecond
    auto a = factory();
    auto b = factory();
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK_FALSE(a.value()->name() == b.value()->name());

    std::string name = a.value()->name().c_str();
    CHECK(name.rfind(dir.path + "/out_", 0) == 0);
    CHECK(name.find(".rd") != std::string::npos);
}
