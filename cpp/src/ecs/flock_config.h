#ifndef MURMUR_FLOCK_CONFIG_H
#define MURMUR_FLOCK_CONFIG_H

#include "murmur_components.h"
#include <string>

namespace murmur {

// Overlays the keys present in a JSON document onto cfg. On any
// failure cfg is left as it was and error holds the reason.
bool parse_flock_config(const std::string &text, FlockConfig &cfg,
                        std::string &error);

bool validate_flock_config(const FlockConfig &cfg, std::string &error);

} // namespace murmur

#endif // MURMUR_FLOCK_CONFIG_H
