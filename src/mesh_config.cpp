// -----------------------------------------------------------------------------
// mesh_config.cpp: MeshConfig JSON mapping and validation.
// -----------------------------------------------------------------------------
#include "hopmesh/mesh_config.hpp"
#include "hopmesh/log.hpp"
#include "hopmesh/message_cache.hpp"

#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace hopmesh {

const char* to_string(PowerMode m) {
  switch (m) {
    case PowerMode::Performance:   return "performance";
    case PowerMode::Balanced:      return "balanced";
    case PowerMode::PowerSaver:    return "power_saver";
    case PowerMode::UltraLowPower: return "ultra_low_power";
  }
  return "?";
}

const char* to_string(ConfigResult r) {
  switch (r) {
    case ConfigResult::Ok:           return "ok";
    case ConfigResult::FileNotFound: return "file not found";
    case ConfigResult::ParseError:   return "parse error";
    case ConfigResult::TypeMismatch: return "type mismatch";
    case ConfigResult::InvalidValue: return "invalid value";
    case ConfigResult::WriteError:   return "write error";
  }
  return "?";
}

bool parse_power_mode(const std::string& text, PowerMode& out) {
  if (text == "performance")     { out = PowerMode::Performance;   return true; }
  if (text == "balanced")        { out = PowerMode::Balanced;      return true; }
  if (text == "power_saver")     { out = PowerMode::PowerSaver;    return true; }
  if (text == "ultra_low_power") { out = PowerMode::UltraLowPower; return true; }
  return false;
}

uint32_t sweep_multiplier(PowerMode m) {
  switch (m) {
    case PowerMode::Performance:   return 1;
    case PowerMode::Balanced:      return 1;
    case PowerMode::PowerSaver:    return 3;
    case PowerMode::UltraLowPower: return 6;
  }
  return 1;
}

namespace {

// Read an unsigned field bounded by `max`. Missing key: untouched, Ok.
template <typename T>
ConfigResult read_unsigned(const json& doc, const char* key, T& out,
                           uint64_t max = std::numeric_limits<T>::max()) {
  auto it = doc.find(key);
  if (it == doc.end()) return ConfigResult::Ok;
  if (!it->is_number_unsigned()) {
    HOPMESH_LOG_WARN("core", "config key '" << key << "' must be a non-negative integer");
    return ConfigResult::TypeMismatch;
  }
  const uint64_t v = it->get<uint64_t>();
  if (v > max) {
    HOPMESH_LOG_WARN("core", "config key '" << key << "' out of range: " << v);
    return ConfigResult::InvalidValue;
  }
  out = static_cast<T>(v);
  return ConfigResult::Ok;
}

} // namespace

ConfigResult apply_mesh_config(const json& doc, MeshConfig& cfg) {
  if (!doc.is_object()) return ConfigResult::TypeMismatch;

  MeshConfig next = cfg;
  ConfigResult r = ConfigResult::Ok;

#define HM_READ(field)                                                  \
  r = read_unsigned(doc, #field, next.field);                           \
  if (r != ConfigResult::Ok) return r;

  HM_READ(default_ttl)
  HM_READ(max_connections)
  HM_READ(connection_timeout_ms)
  HM_READ(cache_capacity)
  HM_READ(cache_expiration_ms)
  HM_READ(cache_sweep_interval_ms)
  HM_READ(stale_peer_timeout_ms)
  HM_READ(stale_sweep_interval_ms)
  HM_READ(connect_check_interval_ms)
  HM_READ(session_max_age_ms)
  HM_READ(session_max_uses)
  HM_READ(max_known_senders)
  HM_READ(known_sender_timeout_ms)
#undef HM_READ

  auto nick = doc.find("nickname");
  if (nick != doc.end()) {
    if (!nick->is_string()) return ConfigResult::TypeMismatch;
    next.nickname = nick->get<std::string>();
  }

  auto announce = doc.find("announce_on_connect");
  if (announce != doc.end()) {
    if (!announce->is_boolean()) return ConfigResult::TypeMismatch;
    next.announce_on_connect = announce->get<bool>();
  }

  auto mode = doc.find("power_mode");
  if (mode != doc.end()) {
    if (!mode->is_string()) return ConfigResult::TypeMismatch;
    if (!parse_power_mode(mode->get<std::string>(), next.power_mode)) return ConfigResult::InvalidValue;
  }

  cfg = next;
  return ConfigResult::Ok;
}

ConfigResult load_mesh_config(const std::string& path, MeshConfig& cfg) {
  std::ifstream in(path);
  if (!in) return ConfigResult::FileNotFound;

  json doc = json::parse(in, nullptr, /*allow_exceptions*/ false);
  if (doc.is_discarded()) {
    HOPMESH_LOG_WARN("core", "config " << path << " is not valid JSON");
    return ConfigResult::ParseError;
  }
  return apply_mesh_config(doc, cfg);
}

json mesh_config_to_json(const MeshConfig& cfg) {
  return json{
    {"default_ttl",               cfg.default_ttl},
    {"max_connections",           cfg.max_connections},
    {"connection_timeout_ms",     cfg.connection_timeout_ms},
    {"cache_capacity",            cfg.cache_capacity},
    {"cache_expiration_ms",       cfg.cache_expiration_ms},
    {"cache_sweep_interval_ms",   cfg.cache_sweep_interval_ms},
    {"stale_peer_timeout_ms",     cfg.stale_peer_timeout_ms},
    {"stale_sweep_interval_ms",   cfg.stale_sweep_interval_ms},
    {"connect_check_interval_ms", cfg.connect_check_interval_ms},
    {"session_max_age_ms",        cfg.session_max_age_ms},
    {"session_max_uses",          cfg.session_max_uses},
    {"max_known_senders",         cfg.max_known_senders},
    {"known_sender_timeout_ms",   cfg.known_sender_timeout_ms},
    {"nickname",                  cfg.nickname},
    {"announce_on_connect",       cfg.announce_on_connect},
    {"power_mode",                to_string(cfg.power_mode)},
  };
}

ConfigResult save_mesh_config(const std::string& path, const MeshConfig& cfg) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) return ConfigResult::WriteError;
  out << mesh_config_to_json(cfg).dump(2) << '\n';
  return out ? ConfigResult::Ok : ConfigResult::WriteError;
}

ConfigResult validate_mesh_config(const MeshConfig& cfg, std::string* why) {
  auto fail = [why](const char* reason) {
    if (why) *why = reason;
    return ConfigResult::InvalidValue;
  };
  if (cfg.default_ttl == 0)                          return fail("default_ttl must be at least 1");
  if (cfg.max_connections == 0)                      return fail("max_connections must be at least 1");
  if (cfg.cache_capacity == 0)                       return fail("cache_capacity must be at least 1");
  if (cfg.cache_capacity > MessageCache::MAX_CAPACITY) return fail("cache_capacity exceeds cache storage");
  if (cfg.cache_expiration_ms == 0)                  return fail("cache_expiration_ms must be positive");
  if (cfg.connection_timeout_ms == 0)                return fail("connection_timeout_ms must be positive");
  if (cfg.cache_sweep_interval_ms == 0 ||
      cfg.stale_sweep_interval_ms == 0 ||
      cfg.connect_check_interval_ms == 0)            return fail("sweep intervals must be positive");
  if (cfg.stale_peer_timeout_ms == 0)                return fail("stale_peer_timeout_ms must be positive");
  if (cfg.session_max_age_ms == 0 || cfg.session_max_uses == 0) return fail("session limits must be positive");
  if (cfg.max_known_senders == 0 ||
      cfg.known_sender_timeout_ms == 0)             return fail("known sender limits must be positive");
  if (cfg.nickname.size() > 255)                     return fail("nickname longer than 255 bytes");
  return ConfigResult::Ok;
}

} // namespace hopmesh
