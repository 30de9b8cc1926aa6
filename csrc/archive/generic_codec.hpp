#pragma once

#include "../runtime/json.hpp"
#include "value.hpp"

namespace farstore::generic {

// Envelope key marking kinds JSON cannot express natively.
constexpr const char* kKindKey = "$kind";

// bool, int, float, str and list map to native JSON. bytes, complex, set,
// frozenset and tuple are wrapped as {"$kind": ..., ...}.
json::Value encode(const Generic& g);

// Inverse of encode. Throws Error(UnknownTypeTag) for an unrecognised $kind
// and Error(MalformedArchive) for null, plain objects or broken envelopes.
Generic decode(const json::Value& v);

} // namespace farstore::generic
