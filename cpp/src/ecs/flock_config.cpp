#include "flock_config.h"
#include <cstdint>
#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace murmur {

bool validate_flock_config(const FlockConfig &cfg, std::string &error) {
  if (cfg.visual_range < 0.0f || cfg.protected_range < 0.0f) {
    error = "ranges must be non-negative";
    return false;
  }
  if (cfg.protected_range > cfg.visual_range) {
    error = "protected_range exceeds visual_range";
    return false;
  }
  if (cfg.centering_factor < 0.0f || cfg.matching_factor < 0.0f ||
      cfg.avoidance_factor < 0.0f || cfg.turn_factor < 0.0f ||
      cfg.edge_margin < 0.0f || cfg.bias < 0.0f) {
    error = "factors must be non-negative";
    return false;
  }
  if (cfg.min_speed < 0.0f || cfg.min_speed > cfg.max_speed) {
    error = "speed band must satisfy 0 <= min_speed <= max_speed";
    return false;
  }
  if (cfg.spawn_min > cfg.spawn_max || cfg.spawn_count < 0) {
    error = "invalid spawn settings";
    return false;
  }
  // The host draws spawn coordinates as min + rand() % span.
  int64_t span = (int64_t)cfg.spawn_max - (int64_t)cfg.spawn_min + 1;
  if (span > (int64_t)RAND_MAX) {
    error = "spawn square is wider than the random range";
    return false;
  }
  return true;
}

bool parse_flock_config(const std::string &text, FlockConfig &cfg,
                        std::string &error) {
  FlockConfig next = cfg;

  try {
    json j = json::parse(text);
    if (!j.is_object()) {
      error = "root must be an object";
      return false;
    }

    next.visual_range = j.value("visual_range", next.visual_range);
    next.protected_range = j.value("protected_range", next.protected_range);
    next.centering_factor = j.value("centering_factor", next.centering_factor);
    next.matching_factor = j.value("matching_factor", next.matching_factor);
    next.avoidance_factor = j.value("avoidance_factor", next.avoidance_factor);
    next.turn_factor = j.value("turn_factor", next.turn_factor);
    next.edge_margin = j.value("edge_margin", next.edge_margin);
    next.min_speed = j.value("min_speed", next.min_speed);
    next.max_speed = j.value("max_speed", next.max_speed);
    next.bias = j.value("bias", next.bias);

    if (j.contains("spawn")) {
      auto &spawn = j["spawn"];
      next.spawn_min = spawn.value("min", next.spawn_min);
      next.spawn_max = spawn.value("max", next.spawn_max);
      next.spawn_count = spawn.value("count", next.spawn_count);
    }
  } catch (json::parse_error &e) {
    error = e.what();
    return false;
  } catch (json::type_error &e) {
    error = e.what();
    return false;
  }

  if (!validate_flock_config(next, error))
    return false;

  cfg = next;
  return true;
}

} // namespace murmur
