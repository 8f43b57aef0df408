#include "core/SegmentUtils.hpp"
#include <algorithm>
#include <cmath>
#include <math.h>

double SegmentUtils::haversine(double x1, double x2, double y1, double y2) {
  double phi1 = y1 * (M_PI / 180);
  double phi2 = y2 * (M_PI / 180);
  double delta_phi = (y2 - y1) * (M_PI / 180);
  double delta_gamma = (x2 - x1) * (M_PI / 180);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_gamma / 2), 2);
  return 2 * 6371000 * asin(sqrt(h));
}

double SegmentUtils::haversine(const Coordinate &p1, const Coordinate &p2) {
  return haversine(p1.lon, p2.lon, p1.lat, p2.lat);
}

double
SegmentUtils::pathDistance(const std::vector<LocomotionSample> &samples) {
  double total = 0.0;
  const Coordinate *last = nullptr;
  for (const auto &s : samples) {
    if (!s.coord)
      continue;
    if (last)
      total += haversine(*last, *s.coord);
    last = &*s.coord;
  }
  return total;
}

std::optional<Footprint>
SegmentUtils::footprint(const std::vector<LocomotionSample> &samples) {
  Footprint fp;
  double lat_sum = 0.0, lon_sum = 0.0;
  for (const auto &s : samples) {
    if (!s.coord)
      continue;
    lat_sum += s.coord->lat;
    lon_sum += s.coord->lon;
    ++fp.located;
  }
  if (fp.located == 0)
    return std::nullopt;

  fp.centre.lat = lat_sum / fp.located;
  fp.centre.lon = lon_sum / fp.located;

  // mean and standard deviation of distances from the centre
  std::vector<double> dists;
  dists.reserve(fp.located);
  for (const auto &s : samples) {
    if (s.coord)
      dists.push_back(haversine(fp.centre, *s.coord));
  }
  double mean = 0.0;
  for (double d : dists)
    mean += d;
  mean /= dists.size();
  double var = 0.0;
  for (double d : dists)
    var += (d - mean) * (d - mean);
  const double sd = dists.size() > 1 ? std::sqrt(var / (dists.size() - 1)) : 0;

  fp.radius_m = mean + sd;
  return fp;
}

double SegmentUtils::timeGap(const Segment &earlier, const Segment &later) {
  if (earlier.samples.empty() || later.samples.empty())
    return 0.0;
  const double gap =
      later.samples.front().timestamp - earlier.samples.back().timestamp;
  return std::max(0.0, gap);
}

double SegmentUtils::clamp(double v, double lo, double hi) {
  return std::min(std::max(v, lo), hi);
}
