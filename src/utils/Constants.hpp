#pragma once

namespace constants
{

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;
constexpr double kDegToRad = kPi / 180.0;
constexpr double kRadToDeg = 180.0 / kPi;

// Angular step used when flattening arcs into polylines.
constexpr double kArcStepRadians = kPi / 32.0;

}  // namespace constants
