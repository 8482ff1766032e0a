#ifndef MURMUR_WORLD_MANAGER_H
#define MURMUR_WORLD_MANAGER_H

#include <flecs.h>
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/variant/packed_float32_array.hpp>

namespace godot {

class MurmurServer : public Node {
  GDCLASS(MurmurServer, Node)

private:
  flecs::world ecs;

  // MultiMesh2D feed, repacked after every tick
  PackedFloat32Array transform_buffer;
  int visible_count = 0;

  // Last logged driver state, so transitions print once
  bool was_stepping = false;

protected:
  static void _bind_methods();

public:
  MurmurServer();
  ~MurmurServer();

  void _ready() override;
  void _process(double delta) override;

  void init_ecs();

  // --- GDScript API ---
  void spawn_flock(int count);
  void spawn_boid(float x, float y, int role_kind, int group);
  bool reload_config();

  int get_boid_count() const;
  int64_t get_tick_count() const;
  bool is_stepping() const;

  PackedFloat32Array get_transform_buffer() const;
  int get_visible_count() const;
};

} // namespace godot

#endif // MURMUR_WORLD_MANAGER_H
