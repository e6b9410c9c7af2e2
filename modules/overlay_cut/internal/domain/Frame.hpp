#pragma once

#include <shared/types/Common.hpp>

namespace OverlayCut::Domain {

// A decoded picture plus its presentation timestamp. Pixels belong to the frame source.
struct Frame {
    Types::Image image;
    Types::Seconds timestamp = 0.0;
    long index = 0;

    bool empty() const { return image.empty(); }
    Types::Size size() const { return image.size(); }
};

}  // namespace OverlayCut::Domain
