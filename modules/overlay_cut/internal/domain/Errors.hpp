#pragma once

#include <stdexcept>
#include <string>

namespace OverlayCut::Domain {

// No qualifying overlay region in the reference image. Fatal to the session.
class CalibrationError : public std::runtime_error {
  public:
    explicit CalibrationError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed frame or unexpected channel layout. Recovered per frame by the scanner.
class FrameScanError : public std::runtime_error {
  public:
    explicit FrameScanError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace OverlayCut::Domain
