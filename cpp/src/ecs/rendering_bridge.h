#ifndef MURMUR_RENDERING_BRIDGE_H
#define MURMUR_RENDERING_BRIDGE_H

#include <flecs.h>
#include <godot_cpp/variant/packed_float32_array.hpp>

namespace murmur {

// 8 floats Transform2D + 4 custom per boid (MultiMesh2D layout).
constexpr int FLOATS_PER_INSTANCE = 12;

// Sequential repack of every boid, in store order.
void sync_transforms(flecs::world &ecs, godot::PackedFloat32Array &buffer_out,
                     int &visible_count_out);

} // namespace murmur

#endif // MURMUR_RENDERING_BRIDGE_H
