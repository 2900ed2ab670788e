#pragma once

#include <cstdlib>
#include <string>

namespace clpsim {

// TRACE=1 turns on diagnostic lines on stdout. Read on every call, nothing cached.
inline bool trace_enabled() {
    const char* v = std::getenv("TRACE");
    return v && std::string(v) == "1";
}

} // namespace clpsim
