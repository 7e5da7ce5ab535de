#include <CLI/CLI.hpp>
#include <ruidapipe/ruidapipe.hpp>

#include <fstream>
#include <iterator>
#include <string>

// Send an .rd job file to a Ruida controller over UDP
//
// Usage:
//   ./ruida_send 192.168.1.100 job.rd
//   RUIDAPIPE_LOCALPORT=40300 ./ruida_send --verbose 192.168.1.100 job.rd
//
// Test against a listener:
//   ncat -l -u -v 50200

static dp::Res<ruidapipe::Message> read_job(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return dp::result::err(dp::Error::not_found(dp::String("cannot open ") + path.c_str()));
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return dp::result::err(dp::Error::io_error(dp::String("cannot read ") + path.c_str()));
    }
    return dp::result::ok(ruidapipe::Message(bytes.begin(), bytes.end()));
}

int main(int argc, char **argv) {
    ruidapipe::SenderConfig config;
    auto env_res = config.apply_env();
    if (env_res.is_err()) {
        echo::error("environment: ", env_res.error().message.c_str());
        return 2;
    }

    CLI::App app{"Send an RD file to a Ruida laser controller via UDP"};

    std::string host;
    std::string file;
    dp::u16 device_port = config.device.port;
    dp::usize mtu = config.mtu;
    dp::u32 timeout_ms = config.ack_timeout_ms;
    dp::u32 retry_initial_ms = config.retry_initial_ms;
    dp::u32 retry_max_ms = config.retry_max_ms;
    dp::u32 chunk_pause_ms = config.chunk_pause_ms;
    dp::u16 local_port = config.local_port;

    app.add_option("host", host, "Controller IP address")->required();
    app.add_option("file", file, "RD job file")->required()->check(CLI::ExistingFile);
    app.add_option("--port", device_port, "Controller UDP port")->capture_default_str();
    app.add_option("--local-port", local_port, "Local source port")->capture_default_str();
    app.add_option("--mtu", mtu, "Payload bytes per chunk")->capture_default_str();
    app.add_option("--timeout", timeout_ms, "Reply timeout in ms")->capture_default_str();
    app.add_option("--retry-initial", retry_initial_ms, "First-chunk retry delay in ms")->capture_default_str();
    app.add_option("--retry-max", retry_max_ms, "First-chunk retry delay ceiling in ms")->capture_default_str();
    app.add_option("--chunk-pause", chunk_pause_ms, "Pause before each chunk in ms (debugging)");
    app.add_flag("-v,--verbose", config.verbose, "Report every chunk");

    CLI11_PARSE(app, argc, argv);

    config.device = ruidapipe::UdpEndpoint{dp::String(host.c_str()), device_port};
    config.local_port = local_port;
    config.mtu = mtu;
    config.ack_timeout_ms = timeout_ms;
    config.retry_initial_ms = retry_initial_ms;
    config.retry_max_ms = retry_max_ms;
    config.chunk_pause_ms = chunk_pause_ms;

    auto valid_res = config.validate();
    if (valid_res.is_err()) {
        echo::error("configuration: ", valid_res.error().message.c_str());
        return 2;
    }

    auto job_res = read_job(file);
    if (job_res.is_err()) {
        echo::error(job_res.error().message.c_str());
        return 1;
    }
    auto job = std::move(job_res.value());

    ruidapipe::UdpDatagram link;
    ruidapipe::Sender sender(link, config);

    auto open_res = sender.open();
    if (open_res.is_err()) {
        echo::error("socket setup failed: ", open_res.error().message.c_str());
        return 1;
    }

    auto res = sender.write(job);
    link.close();

    if (res.is_err()) {
        echo::error("transfer failed: ", res.error().message.c_str());
        return 1;
    }

    const auto &report = res.value();
    echo::info("result: ", ruidapipe::to_string(report.outcome), ", ", report.chunks_acked, "/",
               report.chunks_total, " chunks acknowledged");
    return 0;
}
