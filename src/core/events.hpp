#pragma once
#include <cstddef>
#include <utility>
#include <vector>

namespace corridor {

// ---------------------------------------------------------------------------
// Events<T>: typed, tick-scoped event channel
//
// Stored as a World resource by AppBuilder::add_event<T>(), which also
// registers a single clearing system at Stage::EventReset. A value is
// readable from the moment it is sent until that clear runs, so every system
// scheduled after the emitter in the same tick sees it and no system in the
// next tick does. read() is non-destructive; any number of readers may
// observe the same values.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    std::size_t           size()   const  { return buffer_.size(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

} // namespace corridor
