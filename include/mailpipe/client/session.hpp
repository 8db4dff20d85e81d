#pragma once

#include <mailpipe/endpoint.hpp>
#include <mailpipe/file.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace mailpipe {

    /// Client identity persisted between runs
    struct SessionRecord {
        dp::String username;
        dp::String first_name;
        UdpEndpoint server;
        dp::u64 last_login = 0; // unix seconds
    };

    inline dp::u64 unix_now_seconds() {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<dp::u64>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }

    /// Session record file
    /// Format: {"username", "first_name", "server": {"host", "port"}, "last_login"}
    /// Written to a temporary file beside the target and renamed over it, so a crash
    /// mid-write leaves either the old record or the new one.
    class SessionStore {
      private:
        std::filesystem::path path_;

      public:
        explicit SessionStore(std::filesystem::path path = ".mailpipe_session.json") : path_(std::move(path)) {}

        const std::filesystem::path &path() const { return path_; }

        bool exists() const { return file_exists(path_); }

        /// Errors: not_found when there is no record, invalid_argument when it is unreadable
        dp::Res<SessionRecord> load() const {
            std::ifstream in(path_);
            if (!in) {
                return dp::result::err(dp::Error::not_found("no session record"));
            }

            using json = nlohmann::json;
            try {
                json j = json::parse(in);
                if (!j.is_object() || !j.contains("username") || !j.contains("first_name") || !j.contains("server")) {
                    echo::warn("session record ", path_.string(), " missing fields");
                    return dp::result::err(dp::Error::invalid_argument("session record missing fields"));
                }

                const auto &server = j.at("server");
                SessionRecord record;
                record.username = dp::String(j.at("username").get<std::string>().c_str());
                record.first_name = dp::String(j.at("first_name").get<std::string>().c_str());
                record.server.host = dp::String(server.at("host").get<std::string>().c_str());
                auto port = server.at("port").get<dp::i64>();
                if (port <= 0 || port > 65535) {
                    echo::warn("session record ", path_.string(), " has port ", port, " out of range");
                    return dp::result::err(dp::Error::invalid_argument("session record port out of range"));
                }
                record.server.port = static_cast<dp::u16>(port);
                record.last_login = j.value("last_login", dp::u64{0});

                if (record.username.empty() || record.server.host.empty()) {
                    return dp::result::err(dp::Error::invalid_argument("session record has empty fields"));
                }
                echo::debug("loaded session for '", record.username.c_str(), "' from ", path_.string());
                return dp::result::ok(std::move(record));
            } catch (const json::exception &e) {
                echo::warn("corrupt session record ", path_.string(), ": ", e.what());
                return dp::result::err(dp::Error::invalid_argument(dp::String("corrupt session record: ") + e.what()));
            }
        }

        /// Errors: io_error when the record could not be written or renamed into place
        dp::Res<void> save(const SessionRecord &record) const {
            nlohmann::json j;
            j["username"] = record.username.c_str();
            j["first_name"] = record.first_name.c_str();
            j["server"] = {{"host", record.server.host.c_str()}, {"port", record.server.port}};
            j["last_login"] = record.last_login;

            auto written = write_file_atomically(path_, j.dump(2) + "\n", "session record");
            if (written.is_err()) {
                return written;
            }
            echo::debug("saved session for '", record.username.c_str(), "' to ", path_.string());
            return dp::result::ok();
        }

        /// Delete the record; a missing file is not an error
        dp::Res<void> clear() const {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            if (ec) {
                echo::error("cannot remove ", path_.string(), ": ", ec.message());
                return dp::result::err(dp::Error::io_error("cannot remove session record"));
            }
            echo::debug("cleared session record ", path_.string());
            return dp::result::ok();
        }
    };

} // namespace mailpipe
