#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mailpipe/mailpipe.hpp>
#include <string>

// Mailpipe chat client
//
// Usage:
//   ./chat_client [--host 127.0.0.1] [--port 12000] [--retries 3] [--timeout-ms 5000]
//                 [--session .mailpipe_session.json] [--drop 0.0]
//
// Ctrl-C aborts a request in flight, sends a disconnect notice and exits.

namespace {
    mailpipe::CancelToken g_cancel;

    void on_signal(int) { g_cancel.cancel(); }

    // No SA_RESTART so a blocking read of stdin returns on Ctrl-C
    void install_signal_handlers() {
        struct sigaction sa = {};
        sa.sa_handler = on_signal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
    }

    bool prompt(const char *label, std::string &out) {
        std::cout << label << std::flush;
        if (!std::getline(std::cin, out) || g_cancel.is_cancelled()) {
            return false;
        }
        return true;
    }

    void report_failure(const char *action, mailpipe::Status status, const dp::String &detail) {
        echo::error(action, " failed: ", mailpipe::status_name(status), detail.empty() ? "" : " (",
                    detail.c_str(), detail.empty() ? "" : ")");
    }

    void usage(const char *prog) {
        echo::info("Usage: ", prog,
                   " [--host H] [--port N] [--retries N] [--timeout-ms N] [--session PATH] [--drop RATE]");
    }
} // namespace

int main(int argc, char **argv) {
    mailpipe::ClientConfig config;
    std::string session_path = ".mailpipe_session.json";
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
        if (arg == "--host") {
            config.server.host = dp::String(value);
        } else if (arg == "--port") {
            config.server.port = static_cast<dp::u16>(std::atoi(value));
        } else if (arg == "--retries") {
            config.max_retries = static_cast<dp::u32>(std::atoi(value));
        } else if (arg == "--timeout-ms") {
            config.timeout_ms = static_cast<dp::u32>(std::atoi(value));
        } else if (arg == "--session") {
            session_path = value;
        } else if (arg == "--drop") {
            drop_rate = std::atof(value);
        } else {
            echo::error("Unknown option: ", arg.c_str());
            usage(argv[0]);
            return 1;
        }
    }

    install_signal_handlers();

    mailpipe::UdpDatagram udp;
    auto bind_res = udp.bind(mailpipe::UdpEndpoint{"0.0.0.0", 0});
    if (bind_res.is_err()) {
        echo::error("Bind failed: ", bind_res.error().message.c_str());
        return 1;
    }
    mailpipe::LossyDatagram lossy(udp, mailpipe::LossyDatagram::Options{drop_rate, 0.0, 7});
    mailpipe::Datagram &transport = drop_rate > 0.0 ? static_cast<mailpipe::Datagram &>(lossy) : udp;

    mailpipe::SessionStore store(session_path);
    mailpipe::ChatClient client(transport, config, store, g_cancel);

    if (client.resume()) {
        echo::info("Welcome back, ", client.session()->first_name.c_str()).green();
    }

    while (!client.connected()) {
        std::string username;
        std::string first_name;
        if (!prompt("Username: ", username) || !prompt("First name: ", first_name)) {
            client.disconnect();
            return 0;
        }
        auto res = client.connect(dp::String(username.c_str()), dp::String(first_name.c_str()));
        if (res.ok()) {
            echo::info("Connected as ", username.c_str()).green();
        } else if (res.status == mailpipe::Status::Cancelled) {
            client.disconnect();
            return 0;
        } else {
            report_failure("Connect", res.status, res.detail);
        }
    }

    while (!g_cancel.is_cancelled()) {
        std::cout << "\n1) List users\n2) Send message\n3) Retrieve messages\n4) Retrieve messages from user\n"
                     "5) Quit\n";
        std::string choice;
        if (!prompt("> ", choice)) {
            break;
        }

        if (choice == "1") {
            auto res = client.list_users();
            if (!res.ok()) {
                report_failure("List", res.status, res.detail);
                continue;
            }
            for (const auto &user : res.value) {
                std::cout << "  " << user.username.c_str() << " (" << user.first_name.c_str() << ")\n";
            }
            if (!res.detail.empty()) {
                echo::warn(res.detail.c_str());
            }
        } else if (choice == "2") {
            std::string to;
            std::string body;
            if (!prompt("To: ", to) || !prompt("Message: ", body)) {
                break;
            }
            auto res = client.send_message(dp::String(to.c_str()), dp::String(body.c_str()));
            if (res.ok()) {
                echo::info("Message sent").green();
            } else {
                report_failure("Send", res.status, res.detail);
            }
        } else if (choice == "3" || choice == "4") {
            std::string from;
            if (choice == "4" && !prompt("From: ", from)) {
                break;
            }
            auto res = client.retrieve_messages(dp::String(from.c_str()));
            for (const auto &item : res.value) {
                std::cout << "  " << item.from.c_str() << ": " << item.body.c_str() << "\n";
            }
            if (!res.ok()) {
                report_failure("Retrieve", res.status, res.detail);
            } else if (res.value.empty()) {
                echo::info("No new messages");
            }
        } else if (choice == "5") {
            break;
        } else {
            echo::warn("Unknown choice: ", choice.c_str());
        }
    }

    client.disconnect();
    echo::info("Goodbye");
    return 0;
}
