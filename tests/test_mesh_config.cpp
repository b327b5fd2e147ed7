#include <doctest/doctest.h>
#include "hopmesh/mesh_config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

#include "nlohmann/json.hpp"

using namespace hopmesh;
using json = nlohmann::json;

TEST_CASE("Defaults are valid and match the documented values") {
    MeshConfig cfg;
    CHECK(cfg.default_ttl == 7);
    CHECK(cfg.max_connections == 7);
    CHECK(cfg.connection_timeout_ms == 30000);
    CHECK(cfg.cache_capacity == 1000);
    CHECK(cfg.cache_expiration_ms == 300000);
    CHECK(cfg.stale_peer_timeout_ms == 60000);
    CHECK(cfg.power_mode == PowerMode::Balanced);
    CHECK(cfg.max_known_senders == 256);
    CHECK(cfg.known_sender_timeout_ms == 3600000);
    CHECK(validate_mesh_config(cfg) == ConfigResult::Ok);
}

TEST_CASE("Only the keys present are applied") {
    MeshConfig cfg;
    const json doc = {{"default_ttl", 3}, {"nickname", "relay-7"}, {"power_mode", "power_saver"}};
    REQUIRE(apply_mesh_config(doc, cfg) == ConfigResult::Ok);
    CHECK(cfg.default_ttl == 3);
    CHECK(cfg.nickname == "relay-7");
    CHECK(cfg.power_mode == PowerMode::PowerSaver);
    CHECK(cfg.max_connections == 7);
}

TEST_CASE("A bad key leaves the whole config untouched") {
    MeshConfig cfg;
    json doc;
    SUBCASE("negative number")  { doc = {{"default_ttl", 2}, {"max_connections", -1}}; }
    SUBCASE("ttl above a byte") { doc = {{"default_ttl", 300}}; }
    SUBCASE("wrong type")       { doc = {{"default_ttl", 2}, {"announce_on_connect", "yes"}}; }
    SUBCASE("unknown mode")     { doc = {{"default_ttl", 2}, {"power_mode", "turbo"}}; }
    SUBCASE("not an object")    { doc = json::array({1, 2}); }

    CHECK(apply_mesh_config(doc, cfg) != ConfigResult::Ok);
    CHECK(cfg.default_ttl == 7);
    CHECK(cfg.power_mode == PowerMode::Balanced);
}

TEST_CASE("Power modes stretch the sweep intervals") {
    MeshConfig cfg;
    cfg.cache_sweep_interval_ms = 1000;
    cfg.stale_sweep_interval_ms = 500;

    cfg.power_mode = PowerMode::Performance;
    CHECK(cfg.effective_cache_sweep_ms() == 1000);
    cfg.power_mode = PowerMode::PowerSaver;
    CHECK(cfg.effective_cache_sweep_ms() == 3000);
    cfg.power_mode = PowerMode::UltraLowPower;
    CHECK(cfg.effective_stale_sweep_ms() == 3000);

    PowerMode m;
    CHECK(parse_power_mode("ultra_low_power", m));
    CHECK(m == PowerMode::UltraLowPower);
    CHECK(std::string(to_string(PowerMode::Balanced)) == "balanced");
}

TEST_CASE("Validation names the offending setting") {
    MeshConfig cfg;
    std::string why;

    cfg.default_ttl = 0;
    CHECK(validate_mesh_config(cfg, &why) == ConfigResult::InvalidValue);
    CHECK(why.find("default_ttl") != std::string::npos);

    cfg = MeshConfig();
    cfg.cache_capacity = 100000;
    CHECK(validate_mesh_config(cfg, &why) == ConfigResult::InvalidValue);
    CHECK(why.find("cache_capacity") != std::string::npos);

    cfg = MeshConfig();
    cfg.connect_check_interval_ms = 0;
    CHECK(validate_mesh_config(cfg, nullptr) == ConfigResult::InvalidValue);

    cfg = MeshConfig();
    cfg.max_known_senders = 0;
    CHECK(validate_mesh_config(cfg, &why) == ConfigResult::InvalidValue);
    CHECK(why.find("known sender") != std::string::npos);

    cfg = MeshConfig();
    cfg.known_sender_timeout_ms = 0;
    CHECK(validate_mesh_config(cfg, nullptr) == ConfigResult::InvalidValue);

    cfg = MeshConfig();
    cfg.nickname.assign(256, 'n');
    CHECK(validate_mesh_config(cfg, &why) == ConfigResult::InvalidValue);
}

TEST_CASE("Config files load and save") {
    namespace fs = std::filesystem;
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path path = fs::temp_directory_path() / ("hopmesh-config-" + std::to_string(stamp) + ".json");

    MeshConfig out;
    CHECK(load_mesh_config(path.string(), out) == ConfigResult::FileNotFound);

    MeshConfig cfg;
    cfg.default_ttl = 4;
    cfg.nickname    = "base";
    cfg.power_mode  = PowerMode::UltraLowPower;
    REQUIRE(save_mesh_config(path.string(), cfg) == ConfigResult::Ok);

    REQUIRE(load_mesh_config(path.string(), out) == ConfigResult::Ok);
    CHECK(out.default_ttl == 4);
    CHECK(out.nickname == "base");
    CHECK(out.power_mode == PowerMode::UltraLowPower);

    {
        std::ofstream bad(path, std::ios::trunc);
        bad << "{ \"default_ttl\": ";
    }
    CHECK(load_mesh_config(path.string(), out) == ConfigResult::ParseError);

    std::error_code ec;
    fs::remove(path, ec);
}
