#pragma once
#include "models/CoreTypes.hpp"
#include "models/SegmentModel.hpp"
#include <optional>
#include <vector>

// Centre and spread of a set of located samples.
struct Footprint {
  Coordinate centre;
  double radius_m = 0.0; // mean distance + 1 stddev from the centre
  int located = 0;       // number of samples that carried a coordinate
};

class SegmentUtils {
public:
  // haversine formulas
  static double haversine(double x1, double x2, double y1, double y2);
  static double haversine(const Coordinate &p1, const Coordinate &p2);

  // Sum of haversine distances between consecutive located samples.
  static double pathDistance(const std::vector<LocomotionSample> &samples);

  // Mean centre and radius of the located samples, nullopt when none have a
  // coordinate.
  static std::optional<Footprint>
  footprint(const std::vector<LocomotionSample> &samples);

  // Time between the end of `earlier` and the start of `later` (>= 0).
  static double timeGap(const Segment &earlier, const Segment &later);

  static double clamp(double v, double lo, double hi);
};
