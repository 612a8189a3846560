#pragma once

/// @file math_types.hpp
/// @brief Vector3 and the distance helpers used for perception and leashing.

#include <cmath>
#include <cstdint>

namespace msim::game {

/// World-space position or displacement. Y is the vertical axis.
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Unit vector, or zero when the length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }

    constexpr bool operator==(const Vector3&) const = default;
};

/// Euclidean distance in 3D.
inline float Distance(const Vector3& a, const Vector3& b) noexcept {
    return (a - b).Length();
}

/// Distance on the ground plane (X/Z), ignoring height.
inline float PlanarDistance(const Vector3& a, const Vector3& b) noexcept {
    const float dx = a.x - b.x;
    const float dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

/// True when every component is a finite number.
inline bool IsFinite(const Vector3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Move @p from toward @p to by at most @p maxStep, never overshooting.
inline Vector3 MoveTowards(const Vector3& from, const Vector3& to, float maxStep) noexcept {
    const Vector3 delta = to - from;
    const float dist = delta.Length();
    if (dist <= maxStep || dist < 1e-6f) {
        return to;
    }
    return from + delta * (maxStep / dist);
}

}  // namespace msim::game
