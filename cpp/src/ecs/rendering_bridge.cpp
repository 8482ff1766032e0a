#include "rendering_bridge.h"
#include "murmur_components.h"
#include <cmath>

namespace murmur {

// ═══════════════════════════════════════════════════════════════
// BUFFER FORMAT CONTRACT
//
// 12 floats per instance, MultiMesh TRANSFORM_2D + custom data:
//
//   [0]  x.x   [1]  y.x   [2]  pad   [3]  origin.x
//   [4]  x.y   [5]  y.y   [6]  pad   [7]  origin.y
//   [8]  custom.r=speed   [9]  custom.g=role kind
//   [10] custom.b=group   [11] custom.a=0
//
// Arena space is y-up with the origin at the center; Godot 2D is
// y-down, so y is mirrored here. The host parents the MultiMesh at
// the viewport center.
// ═══════════════════════════════════════════════════════════════
static void write_transform(float *dest, int offset, const Position &p,
                            const Velocity &v, const BoidRole &role) {
  float speed_sq = (v.vx * v.vx) + (v.vy * v.vy);

  // Heading in screen space; resting boids face +x
  float fwd_x = 1.0f;
  float fwd_y = 0.0f;
  float speed = 0.0f;

  if (speed_sq > 0.0001f) {
    speed = std::sqrt(speed_sq);
    float inv_speed = 1.0f / speed;
    fwd_x = v.vx * inv_speed;
    fwd_y = -v.vy * inv_speed;
  }

  // Row 0: basis_x.x, basis_y.x, pad, origin.x
  dest[offset + 0] = fwd_x;
  dest[offset + 1] = -fwd_y;
  dest[offset + 2] = 0.0f;
  dest[offset + 3] = p.x;

  // Row 1: basis_x.y, basis_y.y, pad, origin.y
  dest[offset + 4] = fwd_y;
  dest[offset + 5] = fwd_x;
  dest[offset + 6] = 0.0f;
  dest[offset + 7] = -p.y;

  dest[offset + 8] = speed;
  dest[offset + 9] = (float)role.kind;
  dest[offset + 10] = (float)role.group;
  dest[offset + 11] = 0.0f;
}

void sync_transforms(flecs::world &ecs, godot::PackedFloat32Array &buffer_out,
                     int &visible_count_out) {
  auto q = ecs.query_builder<const Position, const Velocity, const BoidRole>()
               .with<Boid>()
               .build();

  int active_count = q.count();
  visible_count_out = active_count;

  if (active_count == 0) {
    if (buffer_out.size() != 0) {
      buffer_out.resize(0);
    }
    return;
  }

  int required_size = active_count * FLOATS_PER_INSTANCE;
  if (buffer_out.size() != required_size) {
    buffer_out.resize(required_size);
  }

  float *dest = buffer_out.ptrw();
  int idx = 0;

  q.each([&](const Position &p, const Velocity &v, const BoidRole &role) {
    write_transform(dest, idx * FLOATS_PER_INSTANCE, p, v, role);
    idx++;
  });
}

} // namespace murmur
