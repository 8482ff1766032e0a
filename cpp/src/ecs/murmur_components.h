#ifndef MURMUR_COMPONENTS_H
#define MURMUR_COMPONENTS_H

#include <cstdint>
#include <vector>

/**
 * Murmur: ECS Component Definitions
 *
 * POD structs for per-boid data, plus the world singletons the flock
 * tick reads (config, arena bounds, snapshot, driver state).
 */

// ─── Spatial ───────────────────────────────────────────────
struct Position {
  float x, y;
}; // 8 bytes, arena-relative, origin at arena center
struct Velocity {
  float vx, vy;
}; // 8 bytes, units per tick

// ─── Role ─────────────────────────────────────────────────
enum RoleKind : uint8_t {
  ROLE_COMMON = 0, // Follows the flock
  ROLE_SCOUT = 1   // Drifts horizontally, group picks the side
};

// Fixed at spawn. group is only read for ROLE_SCOUT:
// 1 = drifts right (+x), 2 = drifts left (-x).
struct BoidRole {
  RoleKind kind;
  uint8_t group;
}; // 2 bytes

struct Boid {}; // Tag

// ─── Flock Parameters (Singleton) ─────────────────────────
struct FlockConfig {
  float visual_range = 50.0f;     // Neighbor box half-size + cohesion radius
  float protected_range = 10.0f;  // Separation radius
  float centering_factor = 0.0005f;
  float matching_factor = 0.15f;
  float avoidance_factor = 0.1f;
  float turn_factor = 1.0f;       // Velocity nudge near an edge
  float edge_margin = 200.0f;
  float min_speed = 5.5f;
  float max_speed = 6.0f;
  float bias = 0.05f;             // Scout drift blend

  // Host spawn settings (not read by the tick)
  int spawn_min = -500;
  int spawn_max = 300;
  int spawn_count = 200;
};

// ─── Arena (Singleton) ────────────────────────────────────
// Present only while the host knows the viewport size.
struct ArenaBounds {
  float width, height;
}; // 8 bytes

// ─── Snapshot (Singleton) ─────────────────────────────────
// Pre-tick copy of every boid. Rebuilt before each step so every
// boid reacts to the same frame of the flock.
struct BoidSample {
  uint64_t id; // flecs::entity_t of the source boid
  Position pos;
  Velocity vel;
  BoidRole role;
}; // 32 bytes

// std::vector is fine here: one instance per world, not per boid.
struct FlockSnapshot {
  std::vector<BoidSample> samples;
};

// ─── Neighborhood (per boid, per tick) ────────────────────
struct NeighborSummary {
  float avg_x = 0.0f, avg_y = 0.0f;   // Sums until finalized
  float avg_vx = 0.0f, avg_vy = 0.0f; // Sums until finalized
  float close_dx = 0.0f, close_dy = 0.0f; // Raw, never averaged
  uint32_t count = 0;                     // Visual band only
};

// ─── Tick Driver (Singleton) ──────────────────────────────
enum DriverState : uint8_t {
  DRIVER_IDLE = 0,    // No arena bounds yet, tick is a no-op
  DRIVER_STEPPING = 1
};

struct FlockDriver {
  DriverState state = DRIVER_IDLE;
  uint64_t tick_count = 0; // Completed steps
};

#endif // MURMUR_COMPONENTS_H
