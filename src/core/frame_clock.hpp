#pragma once
#include <cstdint>

namespace corridor {

// Per-tick timing. The host writes delta before calling App::tick(); the
// end-of-tick bookkeeping advances frame and elapsed.
struct FrameClock {
    float         delta   = 0.0f;
    double        elapsed = 0.0;
    std::uint64_t frame   = 0;
};

} // namespace corridor
