#include "murmur_systems.h"
#include "murmur_components.h"
#include <cmath>

namespace murmur {

// ═════════════════════════════════════════════════════════════
// NEIGHBOR EVALUATOR
//
// Full pairwise scan against the pre-tick snapshot. The box test
// on |dx|, |dy| gates BOTH bands: a boid inside the visual circle
// but outside the box is ignored.
//
//   sq_dist <  protected²  → close_dx/dy += (dx, dy)
//   sq_dist <  visual²     → position/velocity sums, count++
// ═════════════════════════════════════════════════════════════
NeighborSummary evaluate_neighbors(flecs::entity_t self, const Position &pos,
                                   const FlockSnapshot &snapshot,
                                   const FlockConfig &cfg) {
  NeighborSummary s;
  const float visual = cfg.visual_range;
  const float protect = cfg.protected_range;

  for (const BoidSample &other : snapshot.samples) {
    if (other.id == self)
      continue;

    float dx = pos.x - other.pos.x;
    float dy = pos.y - other.pos.y;

    if (!(std::fabs(dx) < visual && std::fabs(dy) < visual))
      continue;

    float sq_dist = dx * dx + dy * dy;
    if (sq_dist < protect * protect) {
      s.close_dx += dx;
      s.close_dy += dy;
    } else if (sq_dist < visual * visual) {
      s.avg_x += other.pos.x;
      s.avg_y += other.pos.y;
      s.avg_vx += other.vel.vx;
      s.avg_vy += other.vel.vy;
      s.count++;
    }
  }
  return s;
}

bool finalize_summary(NeighborSummary &summary) {
  if (summary.count == 0)
    return false;

  float n = (float)summary.count;
  summary.avg_x /= n;
  summary.avg_y /= n;
  summary.avg_vx /= n;
  summary.avg_vy /= n;
  return true;
}

// ═════════════════════════════════════════════════════════════
// STEERING RULES
//
// Cohesion carries its own velocity-matching term and alignment
// applies it again. Both run whenever count > 0; the flock's look
// is tuned around the doubled matching pull.
// ═════════════════════════════════════════════════════════════
void apply_cohesion(const Position &pos, Velocity &v,
                    const NeighborSummary &summary, const FlockConfig &cfg) {
  v.vx += (summary.avg_x - pos.x) * cfg.centering_factor +
          (summary.avg_vx - v.vx) * cfg.matching_factor;
  v.vy += (summary.avg_y - pos.y) * cfg.centering_factor +
          (summary.avg_vy - v.vy) * cfg.matching_factor;
}

void apply_alignment(Velocity &v, const NeighborSummary &summary,
                     const FlockConfig &cfg) {
  v.vx += (summary.avg_vx - v.vx) * cfg.matching_factor;
  v.vy += (summary.avg_vy - v.vy) * cfg.matching_factor;
}

void apply_avoidance(Velocity &v, const NeighborSummary &summary,
                     const FlockConfig &cfg) {
  v.vx += summary.close_dx * cfg.avoidance_factor;
  v.vy += summary.close_dy * cfg.avoidance_factor;
}

// Per-axis. The low edge wins if an arena is narrower than two margins.
void turn_if_edge(const Position &pos, Velocity &v, const ArenaBounds &arena,
                  const FlockConfig &cfg) {
  const float half_w = arena.width / 2.0f;
  const float half_h = arena.height / 2.0f;

  if (pos.x <= -half_w + cfg.edge_margin) {
    v.vx += cfg.turn_factor;
  } else if (pos.x >= half_w - cfg.edge_margin) {
    v.vx -= cfg.turn_factor;
  }

  if (pos.y <= -half_h + cfg.edge_margin) {
    v.vy += cfg.turn_factor;
  } else if (pos.y >= half_h - cfg.edge_margin) {
    v.vy -= cfg.turn_factor;
  }
}

void apply_role_bias(Velocity &v, const BoidRole &role,
                     const FlockConfig &cfg) {
  switch (role.kind) {
  case ROLE_SCOUT:
    if (role.group == 1) {
      v.vx = (1.0f - cfg.bias) * v.vx + cfg.bias;
    } else if (role.group == 2) {
      v.vx = (1.0f - cfg.bias) * v.vx - cfg.bias;
    }
    break;
  case ROLE_COMMON:
    break;
  }
}

// ═════════════════════════════════════════════════════════════
// SPEED NORMALIZER + INTEGRATOR
// ═════════════════════════════════════════════════════════════
void normalize_speed(Velocity &v, const FlockConfig &cfg) {
  float speed = std::sqrt(v.vx * v.vx + v.vy * v.vy);

  // Zero velocity has no heading to preserve
  if (!(speed > 0.0f))
    return;

  if (speed < cfg.min_speed) {
    v.vx = (v.vx / speed) * cfg.min_speed;
    v.vy = (v.vy / speed) * cfg.min_speed;
  }
  if (speed > cfg.max_speed) {
    v.vx = (v.vx / speed) * cfg.max_speed;
    v.vy = (v.vy / speed) * cfg.max_speed;
  }
}

// One full velocity per tick. Clamp is '>' on the high side and
// '<=' on the low side.
void integrate_position(Position &pos, const Velocity &v,
                        const ArenaBounds &arena) {
  pos.x += v.vx;
  pos.y += v.vy;

  const float half_w = arena.width / 2.0f;
  const float half_h = arena.height / 2.0f;

  if (pos.x > half_w) {
    pos.x = half_w;
  } else if (pos.x <= -half_w) {
    pos.x = -half_w;
  }

  if (pos.y > half_h) {
    pos.y = half_h;
  } else if (pos.y <= -half_h) {
    pos.y = -half_h;
  }
}

// ═════════════════════════════════════════════════════════════
// WORLD REGISTRATION
// ═════════════════════════════════════════════════════════════
void register_flock_components(flecs::world &ecs) {
  ecs.component<Position>("Position");
  ecs.component<Velocity>("Velocity");
  ecs.component<BoidRole>("BoidRole");
  ecs.component<Boid>("Boid");
  ecs.component<FlockConfig>("FlockConfig");
  ecs.component<ArenaBounds>("ArenaBounds");
  ecs.component<FlockSnapshot>("FlockSnapshot");
  ecs.component<FlockDriver>("FlockDriver");
}

void register_flock_systems(flecs::world &ecs) {
  // Singletons the steering system reads. Keep a config that was set
  // before registration.
  if (!ecs.has<FlockConfig>())
    ecs.set<FlockConfig>({});
  ecs.set<FlockSnapshot>({});
  ecs.set<FlockDriver>({});

  // ═════════════════════════════════════════════════════════════
  // SYSTEM: Flock Steering
  //
  // Reads neighbors from FlockSnapshot only. Writes go to the live
  // Position/Velocity of the boid being visited, so a boid visited
  // late still sees every other boid's pre-tick state.
  // ═════════════════════════════════════════════════════════════
  ecs.system<Position, Velocity, const BoidRole>("FlockSteering")
      .with<Boid>()
      .each([](flecs::entity e, Position &p, Velocity &v,
               const BoidRole &role) {
        flecs::world w = e.world();
        const ArenaBounds *arena = w.try_get<ArenaBounds>();
        if (arena == nullptr)
          return;

        const FlockConfig &cfg = w.get<FlockConfig>();
        const FlockSnapshot &snapshot = w.get<FlockSnapshot>();

        NeighborSummary summary = evaluate_neighbors(e.id(), p, snapshot, cfg);
        if (finalize_summary(summary)) {
          apply_cohesion(p, v, summary, cfg);
          apply_alignment(v, summary, cfg);
          apply_avoidance(v, summary, cfg);
        }

        turn_if_edge(p, v, *arena, cfg);
        apply_role_bias(v, role, cfg);
        normalize_speed(v, cfg);
        integrate_position(p, v, *arena);
      });
}

void capture_flock_snapshot(flecs::world &ecs) {
  FlockSnapshot &snapshot = ecs.ensure<FlockSnapshot>();
  snapshot.samples.clear();

  auto q = ecs.query_builder<const Position, const Velocity, const BoidRole>()
               .with<Boid>()
               .build();

  q.each([&snapshot](flecs::entity e, const Position &p, const Velocity &v,
                     const BoidRole &role) {
    snapshot.samples.push_back({e.id(), p, v, role});
  });
}

// ═════════════════════════════════════════════════════════════
// TICK DRIVER
//
//   IDLE      : arena unknown, nothing is touched
//   STEPPING  : snapshot → FlockSteering over every boid
//
// No terminal state; the host calls this once per frame for the
// lifetime of the simulation.
// ═════════════════════════════════════════════════════════════
void step_flock(flecs::world &ecs, const ArenaBounds *arena) {
  bool ready = arena != nullptr && arena->width > 0.0f && arena->height > 0.0f;

  if (!ready) {
    if (ecs.has<ArenaBounds>())
      ecs.remove<ArenaBounds>();
    ecs.ensure<FlockDriver>().state = DRIVER_IDLE;
    return;
  }

  ecs.set<ArenaBounds>(*arena);
  capture_flock_snapshot(ecs);
  ecs.progress();

  FlockDriver &driver = ecs.ensure<FlockDriver>();
  driver.state = DRIVER_STEPPING;
  driver.tick_count++;
}

flecs::entity spawn_boid(flecs::world &ecs, float x, float y, BoidRole role) {
  return ecs.entity()
      .set<Position>({x, y})
      .set<Velocity>({0.0f, 0.0f})
      .set<BoidRole>(role)
      .add<Boid>();
}

BoidRole role_from_roll(int roll) {
  if (roll >= 95)
    return {ROLE_SCOUT, 2};
  if (roll >= 90)
    return {ROLE_SCOUT, 1};
  return {ROLE_COMMON, 0};
}

bool role_from_request(int kind, int group, BoidRole &role) {
  if (group < 0 || group > 255)
    return false;

  switch (kind) {
  case ROLE_COMMON:
    role = {ROLE_COMMON, 0};
    return true;
  case ROLE_SCOUT:
    role = {ROLE_SCOUT, (uint8_t)group};
    return true;
  }
  return false;
}

} // namespace murmur
