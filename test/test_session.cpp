#include <doctest/doctest.h>
#include <mailpipe/client/session.hpp>

#include <filesystem>
#include <fstream>

namespace {
    std::filesystem::path temp_session(const char *name) {
        auto path = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove(path);
        return path;
    }
} // namespace

TEST_CASE("SessionStore - save and load") {
    auto path = temp_session("mailpipe_session_roundtrip.json");
    mailpipe::SessionStore store(path);

    mailpipe::SessionRecord record{"alice", "Alice", {"127.0.0.1", 12000}, 1700000000};
    REQUIRE(store.save(record).is_ok());
    CHECK(store.exists());
    CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto loaded = store.load();
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value().username == "alice");
    CHECK(loaded.value().first_name == "Alice");
    CHECK(loaded.value().server == mailpipe::UdpEndpoint{"127.0.0.1", 12000});
    CHECK(loaded.value().last_login == 1700000000);

    // Overwrite replaces the whole record
    record.username = "alicia";
    REQUIRE(store.save(record).is_ok());
    CHECK(store.load().value().username == "alicia");

    std::filesystem::remove(path);
}

TEST_CASE("SessionStore - file format") {
    auto path = temp_session("mailpipe_session_format.json");
    {
        std::ofstream out(path);
        out << R"({"username": "bob", "first_name": "Bob", "server": {"host": "10.0.0.5", "port": 12001}})";
    }

    mailpipe::SessionStore store(path);
    auto loaded = store.load();
    REQUIRE(loaded.is_ok());
    CHECK(loaded.value().username == "bob");
    CHECK(loaded.value().server.host == "10.0.0.5");
    CHECK(loaded.value().server.port == 12001);
    CHECK(loaded.value().last_login == 0);

    std::filesystem::remove(path);
}

TEST_CASE("SessionStore - missing and corrupt records") {
    SUBCASE("Missing file") {
        mailpipe::SessionStore store(temp_session("mailpipe_session_missing.json"));
        CHECK_FALSE(store.exists());
        CHECK(store.load().is_err());
    }

    SUBCASE("Not JSON") {
        auto path = temp_session("mailpipe_session_garbage.json");
        {
            std::ofstream out(path);
            out << "username=alice\n";
        }
        mailpipe::SessionStore store(path);
        CHECK(store.load().is_err());
        std::filesystem::remove(path);
    }

    SUBCASE("Missing fields") {
        auto path = temp_session("mailpipe_session_partial.json");
        {
            std::ofstream out(path);
            out << R"({"username": "alice"})";
        }
        mailpipe::SessionStore store(path);
        CHECK(store.load().is_err());
        std::filesystem::remove(path);
    }

    SUBCASE("Wrong types") {
        auto path = temp_session("mailpipe_session_types.json");
        {
            std::ofstream out(path);
            out << R"({"username": 5, "first_name": "A", "server": {"host": "h", "port": "x"}})";
        }
        mailpipe::SessionStore store(path);
        CHECK(store.load().is_err());
        std::filesystem::remove(path);
    }
}

TEST_CASE("SessionStore - clear") {
    auto path = temp_session("mailpipe_session_clear.json");
    mailpipe::SessionStore store(path);
    REQUIRE(store.save({"alice", "Alice", {"127.0.0.1", 12000}, 1}).is_ok());
    REQUIRE(store.clear().is_ok());
    CHECK_FALSE(store.exists());
    // Clearing again is fine
    CHECK(store.clear().is_ok());
}

TEST_CASE("SessionStore - unwritable location") {
    mailpipe::SessionStore store(std::filesystem::temp_directory_path() / "mailpipe_no_such_dir" / "session.json");
    CHECK(store.save({"alice", "Alice", {"127.0.0.1", 12000}, 1}).is_err());
}

TEST_CASE("SessionStore - port out of range") {
    auto path = temp_session("mailpipe_session_port.json");
    mailpipe::SessionStore store(path);

    for (const char *port : {"70000", "0", "-1"}) {
        {
            std::ofstream out(path);
            out << R"({"username": "alice", "first_name": "Alice", "server": {"host": "127.0.0.1", "port": )" << port
                << "}}";
        }
        CAPTURE(port);
        CHECK(store.load().is_err());
    }

    {
        std::ofstream out(path);
        out << R"({"username": "alice", "first_name": "Alice", "server": {"host": "127.0.0.1", "port": 65535}})";
    }
    REQUIRE(store.load().is_ok());
    CHECK(store.load().value().server.port == 65535);
    std::filesystem::remove(path);
}
