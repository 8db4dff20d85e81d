#pragma once

#include <mailpipe/file.hpp>
#include <mailpipe/server/directory.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace mailpipe {

    /// Undelivered mail kept on disk across server restarts
    /// Format: {"mailboxes": {"<recipient>": [{"from", "body", "sent_at_ms"}, ...]}}
    /// Saved through a temporary file renamed over the target.
    class MailboxStore {
      private:
        std::filesystem::path path_;

      public:
        explicit MailboxStore(std::filesystem::path path) : path_(std::move(path)) {}

        const std::filesystem::path &path() const { return path_; }

        bool exists() const { return file_exists(path_); }

        /// Errors: not_found when nothing was saved yet, invalid_argument when the file is unreadable
        dp::Res<Mailboxes> load() const {
            std::ifstream in(path_);
            if (!in) {
                return dp::result::err(dp::Error::not_found("no saved mailboxes"));
            }

            using json = nlohmann::json;
            try {
                json j = json::parse(in);
                if (!j.is_object() || !j.contains("mailboxes") || !j.at("mailboxes").is_object()) {
                    echo::warn("mailbox file ", path_.string(), " has no mailboxes object");
                    return dp::result::err(dp::Error::invalid_argument("mailbox file missing fields"));
                }

                Mailboxes boxes;
                for (const auto &[recipient, items] : j.at("mailboxes").items()) {
                    auto &box = boxes[dp::String(recipient.c_str())];
                    for (const auto &item : items) {
                        protocol::MailItem mail;
                        mail.from = dp::String(item.at("from").get<std::string>().c_str());
                        mail.body = dp::String(item.at("body").get<std::string>().c_str());
                        mail.sent_at_ms = item.value("sent_at_ms", dp::u64{0});
                        box.push_back(std::move(mail));
                    }
                }
                echo::debug("loaded ", boxes.size(), " mailbox(es) from ", path_.string());
                return dp::result::ok(std::move(boxes));
            } catch (const json::exception &e) {
                echo::warn("corrupt mailbox file ", path_.string(), ": ", e.what());
                return dp::result::err(dp::Error::invalid_argument(dp::String("corrupt mailbox file: ") + e.what()));
            }
        }

        /// Errors: io_error when the file could not be written or renamed into place
        dp::Res<void> save(const Mailboxes &boxes) const {
            nlohmann::json all = nlohmann::json::object();
            for (const auto &[recipient, items] : boxes) {
                auto &list = all[recipient.c_str()];
                list = nlohmann::json::array();
                for (const auto &mail : items) {
                    list.push_back(
                        {{"from", mail.from.c_str()}, {"body", mail.body.c_str()}, {"sent_at_ms", mail.sent_at_ms}});
                }
            }
            nlohmann::json j;
            j["mailboxes"] = std::move(all);

            auto written = write_file_atomically(path_, j.dump(2) + "\n", "mailbox file");
            if (written.is_err()) {
                return written;
            }
            echo::trace("saved ", boxes.size(), " mailbox(es) to ", path_.string());
            return dp::result::ok();
        }
    };

} // namespace mailpipe
