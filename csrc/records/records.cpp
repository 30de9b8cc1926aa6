#include "records.hpp"

namespace farstore {

void register_records(Registry& registry) {
  registry.add(signal_kind());
  registry.add(time_data_kind());
  registry.add(frequency_data_kind());
  registry.add(coordinates_kind());
  registry.add(orientations_kind());
}

Registry make_default_registry() {
  Registry r;
  register_records(r);
  return r;
}

} // namespace farstore
