#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace acedaw::common {

/// Source of epoch-millisecond timestamps. Injected so tests can pin time.
using Clock = std::function<int64_t()>;

int64_t currentEpochMillis();

/// Random RFC 4122 version 4 identifier, lower-case hex with dashes.
std::string generateUuid();

}  // namespace acedaw::common
