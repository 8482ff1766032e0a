#ifndef MURMUR_CONFIG_LOADER_H
#define MURMUR_CONFIG_LOADER_H

#include <flecs.h>

namespace murmur {
// Reads res://res/data/flock.json into the FlockConfig singleton.
// Returns false if the file was present but rejected.
bool load_flock_config(flecs::world &ecs);
} // namespace murmur

#endif // MURMUR_CONFIG_LOADER_H
