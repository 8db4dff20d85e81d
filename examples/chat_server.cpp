#include <csignal>
#include <cstdlib>
#include <mailpipe/mailpipe.hpp>

// Mailpipe chat server
//
// Usage:
//   ./chat_server [--port 12000] [--ttl-minutes 30] [--max-mailbox 1000] [--drop 0.0]
//                 [--mailbox-file mailpipe_mailboxes.json]
//
// --drop simulates packet loss on the server socket (both directions)
// --mailbox-file "" keeps undelivered mail in memory only

namespace {
    mailpipe::CancelToken g_cancel;

    void on_signal(int) { g_cancel.cancel(); }

    void usage(const char *prog) {
        echo::info("Usage: ", prog,
                   " [--port N] [--ttl-minutes N] [--max-mailbox N] [--drop RATE] [--mailbox-file PATH]");
    }
} // namespace

int main(int argc, char **argv) {
    mailpipe::ServerConfig config;
    config.mailbox_file = "mailpipe_mailboxes.json";
    double drop_rate = 0.0;

    for (int i = 1; i < argc; i++) {
        dp::String arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            echo::error("Missing value for ", arg.c_str());
            usage(argv[0]);
            return 1;
        }
        const char *value = argv[++i];
        if (arg == "--port") {
            config.bind.port = static_cast<dp::u16>(std::atoi(value));
        } else if (arg == "--ttl-minutes") {
            config.user_ttl_ms = static_cast<dp::u64>(std::atoll(value)) * 60 * 1000;
        } else if (arg == "--max-mailbox") {
            config.max_mailbox_size = static_cast<dp::usize>(std::atoll(value));
        } else if (arg == "--drop") {
            drop_rate = std::atof(value);
        } else if (arg == "--mailbox-file") {
            config.mailbox_file = value;
        } else {
            echo::error("Unknown option: ", arg.c_str());
            usage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    mailpipe::UdpDatagram udp;
    mailpipe::LossyDatagram lossy(udp, mailpipe::LossyDatagram::Options{drop_rate, 0.0, 42});
    mailpipe::Datagram &transport = drop_rate > 0.0 ? static_cast<mailpipe::Datagram &>(lossy) : udp;
    if (drop_rate > 0.0) {
        echo::warn("Simulating ", drop_rate * 100.0, "% packet loss").yellow();
    }

    mailpipe::Directory directory(config.max_mailbox_size);
    mailpipe::ChatServer server(transport, directory, config);

    auto bind_res = server.bind();
    if (bind_res.is_err()) {
        echo::error("Failed to start server: ", bind_res.error().message.c_str());
        return 1;
    }

    auto serve_res = server.serve(g_cancel);
    if (serve_res.is_err()) {
        echo::error("Server failed: ", serve_res.error().message.c_str());
        return 1;
    }

    udp.close();
    echo::info("Server done").green();
    return 0;
}
