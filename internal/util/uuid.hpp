#pragma once

#include <string>
#include <string_view>

namespace ctxsync::util {

// Random RFC4122 v4 identifier in canonical 8-4-4-4-12 form.
std::string GenerateUuid();

// prefix followed by 8 random hex digits, e.g. "merged_3f09a1c2". Used for
// contexts the engine creates itself.
std::string GenerateShortId(std::string_view prefix);

} // namespace ctxsync::util
