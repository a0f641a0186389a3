#pragma once
#include <cmath>

namespace haul::math {

struct Vec2d {
  double x{0}, y{0};

  constexpr Vec2d() = default;
  constexpr Vec2d(double x_, double y_) : x(x_), y(y_) {}
};

// Positions in the location catalog are kilometres in a system-wide frame.
struct Vec3d {
  double x{0}, y{0}, z{0};

  constexpr Vec3d() = default;
  constexpr Vec3d(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

  Vec3d operator+(const Vec3d& o) const { return {x + o.x, y + o.y, z + o.z}; }
  Vec3d operator-(const Vec3d& o) const { return {x - o.x, y - o.y, z - o.z}; }
  Vec3d operator*(double s) const { return {x * s, y * s, z * s}; }

  double lengthSq() const { return x*x + y*y + z*z; }
  double length() const { return std::sqrt(lengthSq()); }

  bool isFinite() const { return std::isfinite(x) && std::isfinite(y) && std::isfinite(z); }
};

inline double distance(const Vec3d& a, const Vec3d& b) { return (a - b).length(); }

} // namespace haul::math
