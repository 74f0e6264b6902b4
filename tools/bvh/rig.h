// Rig: flat joint hierarchy with rest poses, extracted from an ozz skeleton
// Everything the BVH writer and curve decoder need from the engine side

#ifndef RIG_H_
#define RIG_H_

#include <string>
#include <vector>

#include "ozz/animation/runtime/skeleton.h"
#include "ozz/base/maths/soa_transform.h"
#include "ozz/base/maths/transform.h"
#include "ozz/base/span.h"

namespace bvh {

// Transform with all components set to neutral values
ozz::math::Transform IdentityTransform();

// parent * local, ignoring shear from non-uniform scale
ozz::math::Transform Combine(const ozz::math::Transform& parent,
                             const ozz::math::Transform& local);

// Inverse of parent applied to a point: parent^-1 * point
ozz::math::Float3 InverseTransformPoint(const ozz::math::Transform& parent,
                                        const ozz::math::Float3& point);

struct Rig {
    std::vector<std::string> names;
    std::vector<int> parents;                      // -1 for roots
    std::vector<ozz::math::Transform> rest_poses;  // Parent-relative

    // Placement of the whole character in the world
    ozz::math::Transform placement = IdentityTransform();

    int num_joints() const { return static_cast<int>(names.size()); }

    // Index of the joint with exactly this name, -1 if none
    int FindJoint(const std::string& name) const;

    // Direct children in index order
    std::vector<int> Children(int joint) const;

    // True when joint is ancestor or joint itself
    bool IsChildOf(int joint, int ancestor) const;

    // Model-space transforms for the given locals (one per joint).
    // Parents always precede children in ozz skeletons.
    std::vector<ozz::math::Transform> ComputeModel(
        const std::vector<ozz::math::Transform>& locals) const;

    // World-space transforms: placement * model
    std::vector<ozz::math::Transform> ComputeWorld(
        const std::vector<ozz::math::Transform>& locals) const;
};

// Snapshot of a runtime skeleton's hierarchy and rest poses
Rig RigFromSkeleton(const ozz::animation::Skeleton& skeleton);

// Parent-relative transforms for every joint from SoA locals
std::vector<ozz::math::Transform> ExtractLocals(
    ozz::span<const ozz::math::SoaTransform> locals, int num_joints);

}  // namespace bvh

#endif  // RIG_H_
