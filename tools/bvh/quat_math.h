// Scalar quaternion and vector helpers on ozz math types

#ifndef QUAT_MATH_H_
#define QUAT_MATH_H_

#include <cmath>

#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/vec_float.h"

namespace bvh {
namespace quat {

constexpr float kDegToRad = 3.14159265358979323846f / 180.0f;
constexpr float kRadToDeg = 180.0f / 3.14159265358979323846f;

// Conjugate (inverse for unit quaternion)
inline ozz::math::Quaternion Conjugate(const ozz::math::Quaternion& q) {
    return ozz::math::Quaternion(-q.x, -q.y, -q.z, q.w);
}

// a * b
inline ozz::math::Quaternion Multiply(const ozz::math::Quaternion& a,
                                      const ozz::math::Quaternion& b) {
    return ozz::math::Quaternion(
        a.w * b.x + a.x * b.w + a.y * b.z - a.z * b.y,
        a.w * b.y - a.x * b.z + a.y * b.w + a.z * b.x,
        a.w * b.z + a.x * b.y - a.y * b.x + a.z * b.w,
        a.w * b.w - a.x * b.x - a.y * b.y - a.z * b.z);
}

inline float Dot(const ozz::math::Quaternion& a, const ozz::math::Quaternion& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z + a.w * b.w;
}

inline ozz::math::Quaternion Normalize(const ozz::math::Quaternion& q) {
    const float len_sq = Dot(q, q);
    if (len_sq < 1e-10f) {
        return ozz::math::Quaternion::identity();
    }
    const float inv_len = 1.0f / std::sqrt(len_sq);
    return ozz::math::Quaternion(q.x * inv_len, q.y * inv_len, q.z * inv_len, q.w * inv_len);
}

// Rotation of `degrees` around a unit axis
inline ozz::math::Quaternion AngleAxis(float degrees, const ozz::math::Float3& axis) {
    const float half = degrees * kDegToRad * 0.5f;
    const float s = std::sin(half);
    return ozz::math::Quaternion(axis.x * s, axis.y * s, axis.z * s, std::cos(half));
}

// q * v * q^-1
inline ozz::math::Float3 Rotate(const ozz::math::Quaternion& q, const ozz::math::Float3& v) {
    const ozz::math::Quaternion qv(v.x, v.y, v.z, 0.0f);
    const ozz::math::Quaternion r = Multiply(Multiply(q, qv), Conjugate(q));
    return ozz::math::Float3(r.x, r.y, r.z);
}

// q and -q are the same rotation
inline bool SameRotation(const ozz::math::Quaternion& a, const ozz::math::Quaternion& b,
                         float epsilon = 1e-4f) {
    return std::abs(std::abs(Dot(a, b)) - 1.0f) < epsilon;
}

}  // namespace quat

// Component-wise vector helpers
inline ozz::math::Float3 Mul(const ozz::math::Float3& a, const ozz::math::Float3& b) {
    return ozz::math::Float3(a.x * b.x, a.y * b.y, a.z * b.z);
}

inline ozz::math::Float3 Add(const ozz::math::Float3& a, const ozz::math::Float3& b) {
    return ozz::math::Float3(a.x + b.x, a.y + b.y, a.z + b.z);
}

inline ozz::math::Float3 Sub(const ozz::math::Float3& a, const ozz::math::Float3& b) {
    return ozz::math::Float3(a.x - b.x, a.y - b.y, a.z - b.z);
}

}  // namespace bvh

#endif  // QUAT_MATH_H_
