// Coordinate convention conversion between engine space and BVH files
// Engine: Y up, quaternion rotations
// BVH standard: X mirrored, Y up, Z forward, Euler angles applied Z then X then Y
// BVH Blender: X mirrored, Z up, Y forward

#ifndef COORDINATE_CONVERT_H_
#define COORDINATE_CONVERT_H_

#include <algorithm>
#include <cmath>

#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/vec_float.h"

#include "quat_math.h"

namespace bvh {
namespace coord_convert {

enum class Convention {
    kStandard,
    kBlender,
};

// Wrap into (-180, 180]. Single step; inputs are expected within one turn.
inline float WrapAngle(float a) {
    if (a > 180.0f) {
        return a - 360.0f;
    }
    if (a < -180.0f) {
        return a + 360.0f;
    }
    return a;
}

// Remap an engine quaternion into BVH space
// Standard: (x, y, z, w) -> (x, -y, -z, w)
// Blender:  (x, y, z, w) -> (x, z, -y, w)
inline ozz::math::Quaternion RotationToBvh(const ozz::math::Quaternion& q,
                                           Convention convention) {
    if (convention == Convention::kBlender) {
        return quat::Normalize(ozz::math::Quaternion(q.x, q.z, -q.y, q.w));
    }
    return quat::Normalize(ozz::math::Quaternion(q.x, -q.y, -q.z, q.w));
}

// Inverse of RotationToBvh
inline ozz::math::Quaternion RotationFromBvh(const ozz::math::Quaternion& q,
                                             Convention convention) {
    if (convention == Convention::kBlender) {
        return ozz::math::Quaternion(q.x, -q.z, q.y, q.w);
    }
    return ozz::math::Quaternion(q.x, -q.y, -q.z, q.w);
}

// Standard: (x, y, z) -> (-x, y, z)
// Blender:  (x, y, z) -> (-x, -z, y)
inline ozz::math::Float3 PositionToBvh(const ozz::math::Float3& p, Convention convention) {
    if (convention == Convention::kBlender) {
        return ozz::math::Float3(-p.x, -p.z, p.y);
    }
    return ozz::math::Float3(-p.x, p.y, p.z);
}

// Inverse of PositionToBvh
inline ozz::math::Float3 PositionFromBvh(const ozz::math::Float3& p, Convention convention) {
    if (convention == Convention::kBlender) {
        return ozz::math::Float3(-p.x, p.z, -p.y);
    }
    return ozz::math::Float3(-p.x, p.y, p.z);
}

// Element-wise reciprocal of the rig scale. Offsets are authored in the
// rig's (possibly non-uniformly scaled) space.
inline ozz::math::Float3 ScaleCompensation(const ozz::math::Float3& rig_scale) {
    return ozz::math::Float3(1.0f / rig_scale.x, 1.0f / rig_scale.y, 1.0f / rig_scale.z);
}

// Offset written to a file: scale compensation, then remap
inline ozz::math::Float3 OffsetToBvh(const ozz::math::Float3& offset,
                                     const ozz::math::Float3& rig_scale,
                                     Convention convention) {
    return PositionToBvh(Mul(offset, ScaleCompensation(rig_scale)), convention);
}

// Unit quaternion to Euler angles in degrees for the rotation order
// Z, then X, then Y. Returned as (x, y, z).
inline ozz::math::Float3 EulerZXYFromQuaternion(const ozz::math::Quaternion& q) {
    const float z = std::atan2(-2.0f * (q.x * q.y - q.w * q.z),
                               q.w * q.w - q.x * q.x + q.y * q.y - q.z * q.z);
    const float x = std::asin(std::min(1.0f, std::max(-1.0f, 2.0f * (q.y * q.z + q.w * q.x))));
    const float y = std::atan2(-2.0f * (q.x * q.z - q.w * q.y),
                               q.w * q.w - q.x * q.x - q.y * q.y + q.z * q.z);
    return ozz::math::Float3(x * quat::kRadToDeg, y * quat::kRadToDeg, z * quat::kRadToDeg);
}

// AngleAxis(z, +Z) * AngleAxis(x, +X) * AngleAxis(y, +Y), degrees
inline ozz::math::Quaternion QuaternionFromEulerZXY(const ozz::math::Float3& euler) {
    return quat::Multiply(
        quat::Multiply(quat::AngleAxis(euler.z, ozz::math::Float3(0.0f, 0.0f, 1.0f)),
                       quat::AngleAxis(euler.x, ozz::math::Float3(1.0f, 0.0f, 0.0f))),
        quat::AngleAxis(euler.y, ozz::math::Float3(0.0f, 1.0f, 0.0f)));
}

// Engine rotation to wrapped BVH Euler angles (x, y, z)
inline ozz::math::Float3 EncodeRotation(const ozz::math::Quaternion& q, Convention convention) {
    const ozz::math::Float3 euler = EulerZXYFromQuaternion(RotationToBvh(q, convention));
    return ozz::math::Float3(WrapAngle(euler.x), WrapAngle(euler.y), WrapAngle(euler.z));
}

// BVH Euler angles (x, y, z) back to an engine rotation
inline ozz::math::Quaternion DecodeRotation(const ozz::math::Float3& euler,
                                            Convention convention) {
    const ozz::math::Float3 wrapped(WrapAngle(euler.x), WrapAngle(euler.y), WrapAngle(euler.z));
    return RotationFromBvh(QuaternionFromEulerZXY(wrapped), convention);
}

}  // namespace coord_convert
}  // namespace bvh

#endif  // COORDINATE_CONVERT_H_
