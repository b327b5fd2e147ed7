/**
 * @file mesh_config.hpp
 * @brief Protocol and timing knobs, with JSON load/save through nlohmann/json.
 *
 * @details
 * Example file (every key optional, unknown keys ignored):
 * @code{.json}
 * {
 *   "default_ttl": 7,
 *   "max_connections": 7,
 *   "connection_timeout_ms": 30000,
 *   "cache_capacity": 1000,
 *   "cache_expiration_ms": 300000,
 *   "power_mode": "balanced",
 *   "nickname": "relay-3"
 * }
 * @endcode
 *
 * A key with the wrong JSON type fails the whole load (TypeMismatch) and
 * leaves the caller's config untouched.
 */
#ifndef HOPMESH_MESH_CONFIG_HPP
#define HOPMESH_MESH_CONFIG_HPP

#include <stdint.h>
#include <string>

#include "nlohmann/json.hpp"

namespace hopmesh {

enum class PowerMode : uint8_t { Performance = 0, Balanced = 1, PowerSaver = 2, UltraLowPower = 3 };

enum class ConfigResult : uint8_t {
  Ok           = 0,
  FileNotFound = 1,
  ParseError   = 2,
  TypeMismatch = 3,
  InvalidValue = 4,
  WriteError   = 5,
};

const char* to_string(PowerMode m);
const char* to_string(ConfigResult r);
bool        parse_power_mode(const std::string& text, PowerMode& out);

/// Sweep interval multiplier for a power mode (1, 1, 3, 6).
uint32_t sweep_multiplier(PowerMode m);

struct MeshConfig {
  uint8_t     default_ttl{7};
  uint32_t    max_connections{7};
  uint64_t    connection_timeout_ms{30000};
  uint32_t    cache_capacity{1000};
  uint64_t    cache_expiration_ms{300000};
  uint64_t    cache_sweep_interval_ms{60000};
  uint64_t    stale_peer_timeout_ms{60000};
  uint64_t    stale_sweep_interval_ms{30000};
  uint64_t    connect_check_interval_ms{1000};
  uint64_t    session_max_age_ms{86400000};
  uint64_t    session_max_uses{10000};
  uint32_t    max_known_senders{256};          ///< senders whose keys and nickname are held
  uint64_t    known_sender_timeout_ms{3600000};
  std::string nickname{"hopmesh"};
  bool        announce_on_connect{true};
  PowerMode   power_mode{PowerMode::Balanced};

  uint64_t effective_cache_sweep_ms() const { return cache_sweep_interval_ms * sweep_multiplier(power_mode); }
  uint64_t effective_stale_sweep_ms() const { return stale_sweep_interval_ms * sweep_multiplier(power_mode); }
};

/// Apply the keys present in `doc` on top of `cfg`. `cfg` changes only on Ok.
ConfigResult apply_mesh_config(const nlohmann::json& doc, MeshConfig& cfg);

ConfigResult load_mesh_config(const std::string& path, MeshConfig& cfg);
ConfigResult save_mesh_config(const std::string& path, const MeshConfig& cfg);

nlohmann::json mesh_config_to_json(const MeshConfig& cfg);

/**
 * @brief Reject values the core cannot run with.
 * @param why Receives a short reason on failure (may be nullptr).
 */
ConfigResult validate_mesh_config(const MeshConfig& cfg, std::string* why = nullptr);

} // namespace hopmesh

#endif // HOPMESH_MESH_CONFIG_HPP
