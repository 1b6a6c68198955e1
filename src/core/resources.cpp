#include "resources.hpp"
#include <cstdio>
#include <cstdlib>

namespace corridor::detail {

void fatal(const char* what, const char* detail) {
    std::fprintf(stderr, "corridor: fatal: %s (%s)\n", what, detail ? detail : "-");
    std::fflush(stderr);
    std::abort();
}

} // namespace corridor::detail
