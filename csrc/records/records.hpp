#pragma once

#include "../archive/registry.hpp"
#include "audio.hpp"
#include "coordinates.hpp"

namespace farstore {

// Adds Signal, TimeData, FrequencyData, Coordinates and Orientations.
void register_records(Registry& registry);

Registry make_default_registry();

} // namespace farstore
