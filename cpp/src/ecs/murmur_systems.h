#ifndef MURMUR_SYSTEMS_H
#define MURMUR_SYSTEMS_H

#include "murmur_components.h"
#include <flecs.h>

namespace murmur {

// ── Neighbor evaluation ─────────────────────────────────────
// Scans the snapshot for one boid. Sums are left un-averaged.
NeighborSummary evaluate_neighbors(flecs::entity_t self, const Position &pos,
                                   const FlockSnapshot &snapshot,
                                   const FlockConfig &cfg);

// Divides the running sums by count. Returns false (and leaves the
// summary untouched) when there were no visual-range neighbors.
bool finalize_summary(NeighborSummary &summary);

// ── Steering rules (in application order) ───────────────────
void apply_cohesion(const Position &pos, Velocity &v,
                    const NeighborSummary &summary, const FlockConfig &cfg);
void apply_alignment(Velocity &v, const NeighborSummary &summary,
                     const FlockConfig &cfg);
void apply_avoidance(Velocity &v, const NeighborSummary &summary,
                     const FlockConfig &cfg);
void turn_if_edge(const Position &pos, Velocity &v, const ArenaBounds &arena,
                  const FlockConfig &cfg);
void apply_role_bias(Velocity &v, const BoidRole &role, const FlockConfig &cfg);

// ── Speed + integration ──────────────────────────────────────
void normalize_speed(Velocity &v, const FlockConfig &cfg);
void integrate_position(Position &pos, const Velocity &v,
                        const ArenaBounds &arena);

// ── World plumbing ───────────────────────────────────────────
void register_flock_components(flecs::world &ecs);
void register_flock_systems(flecs::world &ecs);
void capture_flock_snapshot(flecs::world &ecs);

// One simulation step. A null or empty arena leaves the world Idle.
void step_flock(flecs::world &ecs, const ArenaBounds *arena);

flecs::entity spawn_boid(flecs::world &ecs, float x, float y, BoidRole role);

// Role for a spawn roll in [0, 100].
BoidRole role_from_roll(int roll);

// Role for an explicit spawn request. Common boids carry group 0.
// False if kind is not a RoleKind or group does not fit in a byte.
bool role_from_request(int kind, int group, BoidRole &role);

} // namespace murmur

#endif // MURMUR_SYSTEMS_H
