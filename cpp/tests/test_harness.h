// ═════════════════════════════════════════════════════════════
// MURMUR: HEADLESS TEST HARNESS
// ═════════════════════════════════════════════════════════════
// RAII fixture for doctest. Each TEST_CASE_FIXTURE gets a
// pristine flecs::world with the flock components and systems
// registered and a default FlockConfig. No Godot dependency.
// ═════════════════════════════════════════════════════════════
#pragma once
#include <doctest/doctest.h>
#include <cmath>

// ── Small helpers for pure-rule tests ───────────────────────
static BoidSample make_sample(uint64_t id, float x, float y, float vx = 0.0f,
                              float vy = 0.0f) {
  return {id, {x, y}, {vx, vy}, {ROLE_COMMON, 0}};
}

static float speed_of(const Velocity &v) {
  return std::sqrt(v.vx * v.vx + v.vy * v.vy);
}

// ── RAII Test Fixture ───────────────────────────────────────
struct FlockTestHarness {
  flecs::world ecs;
  ArenaBounds arena = {1920.0f, 1080.0f};

  FlockTestHarness() {
    murmur::register_flock_components(ecs);
    murmur::register_flock_systems(ecs);
  }

  FlockConfig &config() { return ecs.ensure<FlockConfig>(); }

  // Deterministic frame stepping against the fixture arena
  void step(int frames = 1) {
    for (int i = 0; i < frames; i++)
      murmur::step_flock(ecs, &arena);
  }

  // Frames with no arena (viewport not ready)
  void step_idle(int frames = 1) {
    for (int i = 0; i < frames; i++)
      murmur::step_flock(ecs, nullptr);
  }

  flecs::entity spawn(float x, float y, float vx = 0.0f, float vy = 0.0f,
                      BoidRole role = {ROLE_COMMON, 0}) {
    auto e = murmur::spawn_boid(ecs, x, y, role);
    e.set<Velocity>({vx, vy});
    return e;
  }

  static Position pos(flecs::entity e) { return e.get<Position>(); }
  static Velocity vel(flecs::entity e) { return e.get<Velocity>(); }
};
