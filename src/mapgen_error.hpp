#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace procmaps {

enum class MapGenErrorKind : uint8_t {
    None = 0,
    // Bad dimensions, zero charges, seed count < 1, bad walk arguments.
    InvalidConfiguration,
};

struct MapGenError {
    MapGenErrorKind kind = MapGenErrorKind::None;
    std::string message;
};

inline const char* errorKindName(MapGenErrorKind k) {
    switch (k) {
        case MapGenErrorKind::None: return "None";
        case MapGenErrorKind::InvalidConfiguration: return "InvalidConfiguration";
    }
    return "Unknown";
}

// Fills *err (if non-null). Always returns false so validators can
// `return fail(err, ...)`.
inline bool fail(MapGenError* err, MapGenErrorKind kind, std::string msg) {
    if (err) {
        err->kind = kind;
        err->message = std::move(msg);
    }
    return false;
}

} // namespace procmaps
