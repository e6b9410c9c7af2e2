#pragma once

#include "ColorRange.hpp"
#include "SpatialTemplate.hpp"
#include <string>

namespace OverlayCut::Domain {

class VisionProfile {
  public:
    VisionProfile(const ColorRange& background, const ColorRange& accent, const ColorRange& text,
                  const SpatialTemplate& spatial)
        : background_(background), accent_(accent), text_(text), spatial_(spatial) {}

    const ColorRange& getBackground() const { return background_; }
    const ColorRange& getAccent() const { return accent_; }
    const ColorRange& getText() const { return text_; }
    const SpatialTemplate& getSpatial() const { return spatial_; }

    bool isValid() const {
        return background_.isValid() && accent_.isValid() && text_.isValid() && spatial_.isValid();
    }

    std::string describe() const {
        return "background " + background_.toString() + ", accent " + accent_.toString() +
               ", text " + text_.toString() + ", box {" + spatial_.toString() + "}";
    }

  private:
    const ColorRange background_;
    const ColorRange accent_;
    const ColorRange text_;
    const SpatialTemplate spatial_;
};

}  // namespace OverlayCut::Domain
