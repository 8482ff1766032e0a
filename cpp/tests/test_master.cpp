// ═════════════════════════════════════════════════════════════
// MURMUR: TEST UNITY BUILD
// ═════════════════════════════════════════════════════════════
// Headless test binary. No Godot dependency.
// Build: cmake --build build --target murmur_tests
// Run:   ctest --test-dir build
// ═════════════════════════════════════════════════════════════

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

// ── Flecs ───────────────────────────────────────────────────
#include <flecs.h>

// ── Pure C++ flock code (Godot-free) ────────────────────────
#include "../src/ecs/murmur_components.h"
#include "../src/ecs/murmur_systems.h"
#include "../src/ecs/murmur_systems.cpp"
#include "../src/ecs/flock_config.h"
#include "../src/ecs/flock_config.cpp"

// ── Test Infrastructure ─────────────────────────────────────
#include "test_harness.h"

// ── Test Suites (domain-based) ──────────────────────────────
#include "test_neighbors.cpp"
#include "test_steering.cpp"
#include "test_motion.cpp"
#include "test_driver.cpp"
#include "test_scenarios.cpp"
#include "test_config.cpp"
#include "test_perf.cpp"
