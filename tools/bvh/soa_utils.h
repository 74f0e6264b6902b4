// SoA (Structure of Arrays) utilities for extracting individual transforms
// from ozz-animation's SIMD-packed SoaTransform structures.

#ifndef SOA_UTILS_H_
#define SOA_UTILS_H_

#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/simd_math.h"
#include "ozz/base/maths/soa_transform.h"
#include "ozz/base/maths/transform.h"
#include "ozz/base/maths/vec_float.h"
#include "ozz/base/span.h"

namespace bvh {
namespace soa_utils {

// Single lane (0-3) of a SIMD register
inline float GetLane(const ozz::math::SimdFloat4& soa, int lane) {
    float values[4];
    ozz::math::StorePtrU(soa, values);
    return values[lane];
}

// Extract a single joint's transform from SoA transforms.
// SoaTransform packs 4 transforms together for SIMD efficiency.
// joint_index determines which of the 4 lanes to extract.
inline ozz::math::Transform ExtractJointTransform(
    ozz::span<const ozz::math::SoaTransform> transforms,
    int joint_index) {

    const int lane = joint_index % 4;
    const auto& soa = transforms[joint_index / 4];

    ozz::math::Transform t;
    t.translation = ozz::math::Float3(GetLane(soa.translation.x, lane),
                                      GetLane(soa.translation.y, lane),
                                      GetLane(soa.translation.z, lane));
    t.rotation = ozz::math::Quaternion(GetLane(soa.rotation.x, lane),
                                       GetLane(soa.rotation.y, lane),
                                       GetLane(soa.rotation.z, lane),
                                       GetLane(soa.rotation.w, lane));
    t.scale = ozz::math::Float3(GetLane(soa.scale.x, lane),
                                GetLane(soa.scale.y, lane),
                                GetLane(soa.scale.z, lane));
    return t;
}

}  // namespace soa_utils
}  // namespace bvh

#endif  // SOA_UTILS_H_
