#pragma once

#include <overlay_cut/internal/domain/Frame.hpp>
#include <shared/types/Common.hpp>
#include <string>

namespace OverlayCut::Interface {

// Pull-based iterator over decoded frames in presentation order.
class IFrameSource {
  public:
    virtual ~IFrameSource() = default;

    // Fills frame with the next picture; false at end of stream. The image is only valid
    // until the next call.
    virtual bool next(Domain::Frame& frame) = 0;

    // Total media duration in seconds, or 0 when unknown.
    virtual Types::Seconds getDurationSeconds() const = 0;

    virtual std::string getName() const = 0;
};

}  // namespace OverlayCut::Interface
