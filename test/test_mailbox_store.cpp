#include <doctest/doctest.h>
#include <mailpipe/server/mailbox_store.hpp>

#include <filesystem>
#include <fstream>

namespace {
    std::filesystem::path temp_file(const char *name) {
        auto path = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove(path);
        return path;
    }
} // namespace

TEST_CASE("MailboxStore - save and load") {
    auto path = temp_file("mailpipe_mailboxes_roundtrip.json");
    mailpipe::MailboxStore store(path);
    CHECK_FALSE(store.exists());

    mailpipe::Mailboxes boxes;
    boxes["bob"].push_back({"alice", "first", 100});
    boxes["bob"].push_back({"carol", "second", 200});
    boxes["carol"].push_back({"bob", "reply", 300});
    REQUIRE(store.save(boxes).is_ok());
    CHECK(store.exists());
    CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto loaded = store.load();
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value() == boxes);

    // Saving an empty directory empties the file too
    REQUIRE(store.save(mailpipe::Mailboxes{}).is_ok());
    CHECK(store.load().value().empty());

    std::filesystem::remove(path);
}

TEST_CASE("MailboxStore - file format") {
    auto path = temp_file("mailpipe_mailboxes_format.json");
    {
        std::ofstream out(path);
        out << R"({"mailboxes": {"bob": [{"from": "alice", "body": "hi"}]}})";
    }
    auto loaded = mailpipe::MailboxStore(path).load();
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().at("bob").size() == 1);
    CHECK(loaded.value().at("bob")[0].from == "alice");
    CHECK(loaded.value().at("bob")[0].sent_at_ms == 0);
    std::filesystem::remove(path);
}

TEST_CASE("MailboxStore - unreadable files") {
    SUBCASE("Missing") { CHECK(mailpipe::MailboxStore(temp_file("mailpipe_mailboxes_missing.json")).load().is_err()); }

    SUBCASE("Not JSON") {
        auto path = temp_file("mailpipe_mailboxes_garbage.json");
        {
            std::ofstream out(path);
            out << "bob: hi\n";
        }
        CHECK(mailpipe::MailboxStore(path).load().is_err());
        std::filesystem::remove(path);
    }

    SUBCASE("Entries of the wrong shape") {
        auto path = temp_file("mailpipe_mailboxes_shape.json");
        {
            std::ofstream out(path);
            out << R"({"mailboxes": {"bob": [{"from": 1}]}})";
        }
        CHECK(mailpipe::MailboxStore(path).load().is_err());
        std::filesystem::remove(path);
    }

    SUBCASE("Unwritable location") {
        mailpipe::MailboxStore store(std::filesystem::temp_directory_path() / "mailpipe_no_such_dir" / "mail.json");
        CHECK(store.save(mailpipe::Mailboxes{}).is_err());
    }
}
