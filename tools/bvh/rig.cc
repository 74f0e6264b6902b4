// Rig implementation

#include "rig.h"

#include "quat_math.h"
#include "soa_utils.h"

namespace bvh {

ozz::math::Transform IdentityTransform() {
    ozz::math::Transform t;
    t.translation = ozz::math::Float3::zero();
    t.rotation = ozz::math::Quaternion::identity();
    t.scale = ozz::math::Float3::one();
    return t;
}

ozz::math::Transform Combine(const ozz::math::Transform& parent,
                             const ozz::math::Transform& local) {
    ozz::math::Transform result;
    result.translation = Add(parent.translation,
                             quat::Rotate(parent.rotation, Mul(parent.scale, local.translation)));
    result.rotation = quat::Normalize(quat::Multiply(parent.rotation, local.rotation));
    result.scale = Mul(parent.scale, local.scale);
    return result;
}

ozz::math::Float3 InverseTransformPoint(const ozz::math::Transform& parent,
                                        const ozz::math::Float3& point) {
    const ozz::math::Float3 local = quat::Rotate(quat::Conjugate(parent.rotation),
                                                 Sub(point, parent.translation));
    return ozz::math::Float3(local.x / parent.scale.x,
                             local.y / parent.scale.y,
                             local.z / parent.scale.z);
}

int Rig::FindJoint(const std::string& name) const {
    for (int i = 0; i < num_joints(); ++i) {
        if (names[i] == name) {
            return i;
        }
    }
    return -1;
}

std::vector<int> Rig::Children(int joint) const {
    std::vector<int> children;
    for (int i = 0; i < num_joints(); ++i) {
        if (parents[i] == joint) {
            children.push_back(i);
        }
    }
    return children;
}

bool Rig::IsChildOf(int joint, int ancestor) const {
    for (int current = joint; current >= 0; current = parents[current]) {
        if (current == ancestor) {
            return true;
        }
    }
    return false;
}

std::vector<ozz::math::Transform> Rig::ComputeModel(
    const std::vector<ozz::math::Transform>& locals) const {
    std::vector<ozz::math::Transform> models(locals.size());
    for (size_t i = 0; i < locals.size(); ++i) {
        const int parent = parents[i];
        models[i] = parent < 0 ? locals[i] : Combine(models[parent], locals[i]);
    }
    return models;
}

std::vector<ozz::math::Transform> Rig::ComputeWorld(
    const std::vector<ozz::math::Transform>& locals) const {
    std::vector<ozz::math::Transform> world = ComputeModel(locals);
    for (auto& t : world) {
        t = Combine(placement, t);
    }
    return world;
}

Rig RigFromSkeleton(const ozz::animation::Skeleton& skeleton) {
    const int num_joints = skeleton.num_joints();

    Rig rig;
    rig.names.reserve(num_joints);
    rig.parents.reserve(num_joints);
    for (int i = 0; i < num_joints; ++i) {
        rig.names.push_back(skeleton.joint_names()[i]);
        const int parent = skeleton.joint_parents()[i];
        rig.parents.push_back(parent == ozz::animation::Skeleton::kNoParent ? -1 : parent);
    }
    rig.rest_poses = ExtractLocals(skeleton.joint_rest_poses(), num_joints);
    return rig;
}

std::vector<ozz::math::Transform> ExtractLocals(
    ozz::span<const ozz::math::SoaTransform> locals, int num_joints) {
    std::vector<ozz::math::Transform> result;
    result.reserve(num_joints);
    for (int i = 0; i < num_joints; ++i) {
        result.push_back(soa_utils::ExtractJointTransform(locals, i));
    }
    return result;
}

}  // namespace bvh
