#include <CLI/CLI.hpp>
#include <ruidapipe/ruidapipe.hpp>

#include <csignal>
#include <string>

// Relay Ruida UDP jobs to one controller, one job stream at a time
//
// Workstations send to this host's port 50200 as if it were the laser.
// Datagrams of the current stream are forwarded to the controller and captured
// to out_<timestamp>.rd; everyone else gets NACK until the stream ends with
// an END token or stays idle past the timeout.
//
// Usage:
//   ./ruida_proxy 192.168.1.100
//   ./ruida_proxy --capture-dir /var/spool/ruida --timeout 15000 192.168.1.100

static ruidapipe::Relay *g_relay = nullptr;

static void on_signal(int) {
    if (g_relay != nullptr) {
        g_relay->stop();
    }
}

int main(int argc, char **argv) {
    ruidapipe::RelayConfig config;
    auto env_res = config.apply_env();
    if (env_res.is_err()) {
        echo::error("environment: ", env_res.error().message.c_str());
        return 2;
    }

    CLI::App app{"Forward Ruida UDP job streams to a laser controller"};

    std::string host;
    std::string capture_dir = config.capture_dir.c_str();
    dp::u16 world_port = config.world.port;
    dp::u16 device_local_port = config.device_local.port;
    dp::u16 device_port = config.device.port;
    dp::u32 timeout_ms = config.session_timeout_ms;

    app.add_option("host", host, "Controller IP address")->required();
    app.add_option("--listen-port", world_port, "Port workstations send to")->capture_default_str();
    app.add_option("--reply-port", device_local_port, "Local port the controller answers to")
        ->capture_default_str();
    app.add_option("--device-port", device_port, "Controller UDP port")->capture_default_str();
    app.add_option("--timeout", timeout_ms, "Idle ms before a stream may be taken over")->capture_default_str();
    app.add_option("--capture-dir", capture_dir, "Directory for captured jobs")->check(CLI::ExistingDirectory);
    app.add_flag("--verify-checksum", config.verify_checksum, "NACK datagrams with a bad chunk checksum");
    app.add_flag("--reap", config.reap_idle, "End idle streams without waiting for new traffic");
    app.add_flag("-v,--verbose", config.verbose, "Report every datagram");

    CLI11_PARSE(app, argc, argv);

    config.world.port = world_port;
    config.device_local.port = device_local_port;
    config.device = ruidapipe::UdpEndpoint{dp::String(host.c_str()), device_port};
    config.session_timeout_ms = timeout_ms;
    config.capture_dir = dp::String(capture_dir.c_str());

    auto valid_res = config.validate();
    if (valid_res.is_err()) {
        echo::error("configuration: ", valid_res.error().message.c_str());
        return 2;
    }

    ruidapipe::UdpDatagram world;
    ruidapipe::UdpDatagram device;
    ruidapipe::Relay relay(world, device, config);

    auto open_res = relay.open();
    if (open_res.is_err()) {
        echo::error("socket setup failed: ", open_res.error().message.c_str());
        return 1;
    }

    g_relay = &relay;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto res = relay.run();
    g_relay = nullptr;

    const auto &stats = relay.stats();
    echo::info("streams: ", stats.sessions_started.load(), " started, ", stats.sessions_completed.load(),
               " completed, ", stats.sessions_superseded.load(), " superseded; ", stats.datagrams_rejected.load(),
               " datagrams rejected");

    world.close();
    device.close();

    if (res.is_err()) {
        echo::error("relay stopped: ", res.error().message.c_str());
        return 1;
    }
    return 0;
}
