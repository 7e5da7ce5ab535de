#include <doctest/doctest.h>
#include <ruidapipe/endpoint.hpp>

TEST_CASE("UdpEndpoint") {
    SUBCASE("Create and convert to string") {
        ruidapipe::UdpEndpoint endpoint{"192.168.1.100", 50200};
        CHECK(endpoint.host == "192.168.1.100");
        CHECK(endpoint.port == 50200);
        CHECK(endpoint.to_string() == "192.168.1.100:50200");
    }

    SUBCASE("Any address") {
        ruidapipe::UdpEndpoint endpoint{"0.0.0.0", 40200};
        CHECK(endpoint.to_string() == "0.0.0.0:40200");
    }

    SUBCASE("Equality needs host and port") {
        ruidapipe::UdpEndpoint a{"10.0.0.1", 40200};
        ruidapipe::UdpEndpoint same{"10.0.0.1", 40200};
        ruidapipe::UdpEndpoint other_port{"10.0.0.1", 40201};
        ruidapipe::UdpEndpoint other_host{"10.0.0.2", 40200};
        CHECK(a == same);
        CHECK(a != other_port);
        CHECK(a != other_host);
    }
}
