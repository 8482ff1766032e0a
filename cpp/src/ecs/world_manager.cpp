#include "world_manager.h"
#include "config_loader.h"
#include "murmur_components.h"
#include "murmur_systems.h"
#include "rendering_bridge.h"
#include <cstdint>
#include <cstdlib>
#include <godot_cpp/classes/engine.hpp>
#include <godot_cpp/classes/viewport.hpp>
#include <godot_cpp/variant/rect2.hpp>
#include <godot_cpp/variant/utility_functions.hpp>

namespace godot {

MurmurServer::MurmurServer() {}

MurmurServer::~MurmurServer() {}

void MurmurServer::_bind_methods() {
  ClassDB::bind_method(D_METHOD("spawn_flock", "count"),
                       &MurmurServer::spawn_flock);
  ClassDB::bind_method(D_METHOD("spawn_boid", "x", "y", "role_kind", "group"),
                       &MurmurServer::spawn_boid);
  ClassDB::bind_method(D_METHOD("reload_config"),
                       &MurmurServer::reload_config);

  ClassDB::bind_method(D_METHOD("get_boid_count"),
                       &MurmurServer::get_boid_count);
  ClassDB::bind_method(D_METHOD("get_tick_count"),
                       &MurmurServer::get_tick_count);
  ClassDB::bind_method(D_METHOD("is_stepping"), &MurmurServer::is_stepping);

  ClassDB::bind_method(D_METHOD("get_transform_buffer"),
                       &MurmurServer::get_transform_buffer);
  ClassDB::bind_method(D_METHOD("get_visible_count"),
                       &MurmurServer::get_visible_count);
}

void MurmurServer::_ready() {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  init_ecs();
}

void MurmurServer::init_ecs() {
  UtilityFunctions::print("[Murmur] Initializing ECS...");

  murmur::register_flock_components(ecs);
  murmur::register_flock_systems(ecs);

  // A rejected file is already logged; defaults stay in place.
  murmur::load_flock_config(ecs);

  UtilityFunctions::print("[Murmur] ECS ready, flock systems registered.");
}

void MurmurServer::spawn_flock(int count) {
  FlockConfig cfg = ecs.get<FlockConfig>();
  if (count <= 0)
    count = cfg.spawn_count;

  // validate_flock_config keeps the span within [1, RAND_MAX].
  int lo = cfg.spawn_min;
  int span = (int)((int64_t)cfg.spawn_max - (int64_t)cfg.spawn_min + 1);

  int scouts = 0;
  for (int i = 0; i < count; i++) {
    float x = (float)(lo + std::rand() % span);
    float y = (float)(lo + std::rand() % span);
    BoidRole role = murmur::role_from_roll(std::rand() % 101);
    if (role.kind == ROLE_SCOUT)
      scouts++;
    murmur::spawn_boid(ecs, x, y, role);
  }

  UtilityFunctions::print("[Murmur] Spawned ", count, " boids (", scouts,
                          " scouts) in [", lo, ", ", cfg.spawn_max,
                          "] square.");
}

void MurmurServer::spawn_boid(float x, float y, int role_kind, int group) {
  BoidRole role;
  if (!murmur::role_from_request(role_kind, group, role)) {
    UtilityFunctions::printerr("[Murmur] spawn_boid rejected: role_kind ",
                               role_kind, ", group ", group);
    return;
  }
  murmur::spawn_boid(ecs, x, y, role);
}

bool MurmurServer::reload_config() { return murmur::load_flock_config(ecs); }

int MurmurServer::get_boid_count() const {
  flecs::world &w = const_cast<flecs::world &>(ecs);
  return w.count<Boid>();
}

int64_t MurmurServer::get_tick_count() const {
  flecs::world &w = const_cast<flecs::world &>(ecs);
  return (int64_t)w.get<FlockDriver>().tick_count;
}

bool MurmurServer::is_stepping() const {
  flecs::world &w = const_cast<flecs::world &>(ecs);
  return w.get<FlockDriver>().state == DRIVER_STEPPING;
}

PackedFloat32Array MurmurServer::get_transform_buffer() const {
  return transform_buffer;
}

int MurmurServer::get_visible_count() const { return visible_count; }

void MurmurServer::_process(double delta) {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }

  // Arena bounds come from the viewport; until it has a size the
  // driver stays Idle.
  ArenaBounds arena = {0.0f, 0.0f};
  bool ready = false;
  Viewport *vp = get_viewport();
  if (vp != nullptr) {
    Rect2 rect = vp->get_visible_rect();
    arena = {(float)rect.size.x, (float)rect.size.y};
    ready = arena.width > 0.0f && arena.height > 0.0f;
  }

  murmur::step_flock(ecs, ready ? &arena : nullptr);

  bool stepping = is_stepping();
  if (stepping != was_stepping) {
    if (stepping) {
      UtilityFunctions::print("[Murmur] Arena ", arena.width, "x",
                              arena.height, ", stepping.");
    } else {
      UtilityFunctions::print("[Murmur] Arena unavailable, idle.");
    }
    was_stepping = stepping;
  }

  murmur::sync_transforms(ecs, transform_buffer, visible_count);
}

} // namespace godot
