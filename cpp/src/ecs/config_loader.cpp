#include "config_loader.h"
#include "flock_config.h"
#include "murmur_components.h"
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <string>

namespace murmur {

bool load_flock_config(flecs::world &ecs) {
  godot::String path = "res://res/data/flock.json";
  if (!godot::FileAccess::file_exists(path)) {
    godot::UtilityFunctions::print(
        "[Murmur] No res://res/data/flock.json, using default flock config.");
    return true;
  }

  godot::String content = godot::FileAccess::get_file_as_string(path);
  FlockConfig cfg = ecs.get<FlockConfig>();
  std::string error;

  if (!parse_flock_config(content.utf8().get_data(), cfg, error)) {
    godot::UtilityFunctions::printerr("[Murmur] Rejected flock.json: ",
                                      error.c_str());
    return false;
  }

  ecs.set<FlockConfig>(cfg);
  godot::UtilityFunctions::print(
      "[Murmur] Flock config loaded (visual=", cfg.visual_range,
      ", protected=", cfg.protected_range, ", speed=", cfg.min_speed, "..",
      cfg.max_speed, ")");
  return true;
}

} // namespace murmur
