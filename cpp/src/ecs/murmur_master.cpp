// ═════════════════════════════════════════════════════════════════════════════
// MURMUR: UNITY BUILD
// ═════════════════════════════════════════════════════════════════════════════
// Build ONLY this file into the GDExtension. Flecs caches component ids in
// static inline template variables (flecs::type_id<T>::id); MSVC gives each
// translation unit of a DLL its own copy. One TU means one set of ids, so
// w.get<T>() and query_builder<T>() agree everywhere.
//
// ORDER MATTERS: pure flock code first, then the Godot-facing pieces.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Core (components, rules, steering system, tick driver)
#include "murmur_systems.cpp"

// 2. Data (JSON flock config)
#include "flock_config.cpp"
#include "config_loader.cpp"

// 3. Rendering Bridge (MultiMesh2D transform packing)
#include "rendering_bridge.cpp"

// 4. Host node + GDExtension entry point
#include "world_manager.cpp"
#include "../register_types.cpp"
