#pragma once

#include <overlay_cut/interface/IFrameSource.hpp>
#include <shared/types/Common.hpp>
#include <string>
#include <utility>
#include <vector>

namespace OverlayCut::Internal::IO {

// Serves frames already held in memory, in insertion order.
class MemoryFrameSource : public Interface::IFrameSource {
  public:
    explicit MemoryFrameSource(Types::Seconds duration = 0.0, std::string name = "memory")
        : duration_(duration), name_(std::move(name)) {}

    void addFrame(const Types::Image& image, Types::Seconds timestamp) {
        Domain::Frame frame;
        frame.image = image;
        frame.timestamp = timestamp;
        frame.index = static_cast<long>(frames_.size());
        frames_.push_back(frame);
    }

    bool next(Domain::Frame& frame) override {
        if (position_ >= frames_.size()) return false;
        frame = frames_[position_++];
        return true;
    }

    Types::Seconds getDurationSeconds() const override { return duration_; }
    std::string getName() const override { return name_; }

    size_t size() const { return frames_.size(); }
    void rewind() { position_ = 0; }

  private:
    std::vector<Domain::Frame> frames_;
    size_t position_ = 0;
    Types::Seconds duration_;
    std::string name_;
};

}  // namespace OverlayCut::Internal::IO
