#pragma once

#include <cstddef>

// Capability switches. Each one only adds or removes API surface; none of them
// changes how bytes are laid out on the wire.

#ifndef CBORKIT_ENABLE_ALLOC
#define CBORKIT_ENABLE_ALLOC 1
#endif

#ifndef CBORKIT_ENABLE_STD
#define CBORKIT_ENABLE_STD 1
#endif

#ifndef CBORKIT_ENABLE_HALF
#define CBORKIT_ENABLE_HALF 1
#endif

#ifndef CBORKIT_ENABLE_SKIP
#define CBORKIT_ENABLE_SKIP 1
#endif

#ifndef CBORKIT_ENABLE_DERIVE
#define CBORKIT_ENABLE_DERIVE 1
#endif

#if CBORKIT_ENABLE_STD && !CBORKIT_ENABLE_ALLOC
#error "[[[ CborKit ]]] CBORKIT_ENABLE_STD requires CBORKIT_ENABLE_ALLOC"
#endif

#if CBORKIT_ENABLE_DERIVE && !CBORKIT_ENABLE_SKIP
#error "[[[ CborKit ]]] CBORKIT_ENABLE_DERIVE requires CBORKIT_ENABLE_SKIP (unknown fields are skipped)"
#endif

#ifndef CBORKIT_ERROR_PATH_CAPACITY
#define CBORKIT_ERROR_PATH_CAPACITY 16
#endif

namespace CborKit {

namespace config {

constexpr bool alloc_enabled()  { return CBORKIT_ENABLE_ALLOC != 0; }
constexpr bool std_enabled()    { return CBORKIT_ENABLE_STD != 0; }
constexpr bool half_enabled()   { return CBORKIT_ENABLE_HALF != 0; }
constexpr bool skip_enabled()   { return CBORKIT_ENABLE_SKIP != 0; }
constexpr bool derive_enabled() { return CBORKIT_ENABLE_DERIVE != 0; }

constexpr std::size_t default_max_depth = 64;

} // namespace config

struct DecoderConfig {
    // Levels of container and tag nesting, the top-level item included.
    std::size_t max_depth = config::default_max_depth;
    // Reject non-minimal argument widths and floats that fit a narrower width.
    bool strict = false;
};

struct EncoderConfig {
    // Built-in float codecs emit the shortest width that preserves the value.
    bool preferred_floats = false;
};

} // namespace CborKit
