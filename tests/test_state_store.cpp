#include <doctest/doctest.h>
#include "hopmesh/state_store.hpp"

#include <sys/stat.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "nlohmann/json.hpp"

using namespace hopmesh;
namespace fs = std::filesystem;

namespace {

// Unique scratch file under the system temp dir, removed on scope exit.
struct TempFile {
    fs::path path;
    TempFile() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("hopmesh-test-" + std::to_string(stamp)) / "state.json";
    }
    ~TempFile() {
        std::error_code ec;
        fs::remove_all(path.parent_path(), ec);
    }
};

struct ScopedUmask {
    mode_t old;
    explicit ScopedUmask(mode_t mask) : old(::umask(mask)) {}
    ~ScopedUmask() { ::umask(old); }
};

} // namespace

TEST_CASE("JSON store starts empty when the file does not exist") {
    TempFile tmp;
    JsonStateStore store(tmp.path.string());

    std::string id;
    CHECK_FALSE(store.load_device_id(id));

    std::set<std::string> blocked{"stale"};
    CHECK(store.load_blocklist(blocked));
    CHECK(blocked.empty());

    IdentityKeyBlob keys;
    CHECK_FALSE(store.load_identity_keys(keys));
}

TEST_CASE("JSON store keeps every field when another one is written") {
    TempFile tmp;
    JsonStateStore store(tmp.path.string());

    REQUIRE(store.save_device_id("0a1b2c3d-4e5f-4a6b-8c7d-8e9fa0b1c2d3"));
    REQUIRE(store.save_blocklist({"AA:BB:CC:DD:EE:FF"}));

    IdentityKeyBlob keys;
    keys.signing.assign(32, 0x11);
    keys.agreement.assign(32, 0xA5);
    REQUIRE(store.save_identity_keys(keys));

    JsonStateStore reopened(tmp.path.string());
    std::string id;
    REQUIRE(reopened.load_device_id(id));
    CHECK(id == "0a1b2c3d-4e5f-4a6b-8c7d-8e9fa0b1c2d3");

    std::set<std::string> blocked;
    REQUIRE(reopened.load_blocklist(blocked));
    CHECK(blocked == std::set<std::string>{"AA:BB:CC:DD:EE:FF"});

    IdentityKeyBlob back;
    REQUIRE(reopened.load_identity_keys(back));
    CHECK(back.signing == keys.signing);
    CHECK(back.agreement == keys.agreement);

    CHECK_FALSE(fs::exists(tmp.path.string() + ".tmp"));
}

TEST_CASE("JSON store writes the documented schema") {
    TempFile tmp;
    JsonStateStore store(tmp.path.string());
    REQUIRE(store.save_device_id("0a1b2c3d-4e5f-4a6b-8c7d-8e9fa0b1c2d3"));
    REQUIRE(store.save_blocklist({"11:11:11:11:11:11", "22:22:22:22:22:22"}));

    std::ifstream in(tmp.path);
    const nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    REQUIRE(doc.is_object());
    CHECK(doc["device_id"] == "0a1b2c3d-4e5f-4a6b-8c7d-8e9fa0b1c2d3");
    REQUIRE(doc["blocked"].is_array());
    CHECK(doc["blocked"].size() == 2);
}

TEST_CASE("The state file stays owner-only on every save") {
    TempFile tmp;
    ScopedUmask umask_022(022);
    const fs::perms owner_only = fs::perms::owner_read | fs::perms::owner_write;
    auto mode = [&] { return fs::status(tmp.path).permissions() & fs::perms::all; };

    // A file left world-readable by an older writer is tightened on the next save.
    fs::create_directories(tmp.path.parent_path());
    {
        std::ofstream out(tmp.path);
        out << "{}";
    }
    fs::permissions(tmp.path, owner_only | fs::perms::group_read | fs::perms::others_read);
    {
        std::ofstream stale(tmp.path.string() + ".tmp");
        stale << "leftover";
    }

    JsonStateStore store(tmp.path.string());
    IdentityKeyBlob keys;
    keys.signing.assign(32, 0x11);
    keys.agreement.assign(32, 0xA5);
    REQUIRE(store.save_identity_keys(keys));
    CHECK(mode() == owner_only);

    REQUIRE(store.save_blocklist({"AA:BB:CC:DD:EE:FF"}));
    CHECK(mode() == owner_only);
    REQUIRE(store.save_device_id("0a1b2c3d-4e5f-4a6b-8c7d-8e9fa0b1c2d3"));
    CHECK(mode() == owner_only);
    store.clear_device_id();
    CHECK(mode() == owner_only);

    IdentityKeyBlob back;
    REQUIRE(store.load_identity_keys(back));
    CHECK(back.agreement == keys.agreement);
    CHECK_FALSE(fs::exists(tmp.path.string() + ".tmp"));
}

TEST_CASE("A corrupted JSON file reads as a first run") {
    TempFile tmp;
    fs::create_directories(tmp.path.parent_path());
    {
        std::ofstream out(tmp.path);
        out << "{ not json";
    }
    JsonStateStore store(tmp.path.string());
    std::string id;
    CHECK_FALSE(store.load_device_id(id));

    // And it can be written over.
    REQUIRE(store.save_device_id("0a1b2c3d-4e5f-4a6b-8c7d-8e9fa0b1c2d3"));
    REQUIRE(store.load_device_id(id));
}

TEST_CASE("Clearing the device id keeps the rest of the document") {
    TempFile tmp;
    JsonStateStore store(tmp.path.string());
    REQUIRE(store.save_device_id("0a1b2c3d-4e5f-4a6b-8c7d-8e9fa0b1c2d3"));
    REQUIRE(store.save_blocklist({"AA:BB:CC:DD:EE:FF"}));

    store.clear_device_id();

    std::string id;
    CHECK_FALSE(store.load_device_id(id));
    std::set<std::string> blocked;
    REQUIRE(store.load_blocklist(blocked));
    CHECK(blocked.size() == 1);
}

TEST_CASE("Memory store round-trips identity keys") {
    MemoryStateStore store;
    IdentityKeyBlob keys;
    CHECK_FALSE(store.load_identity_keys(keys));

    keys.signing.assign(32, 1);
    keys.agreement.assign(32, 2);
    REQUIRE(store.save_identity_keys(keys));

    IdentityKeyBlob back;
    REQUIRE(store.load_identity_keys(back));
    CHECK(back.signing == keys.signing);
}
