// Skeleton tree implementation

#include "skel_tree.h"

#include <deque>
#include <set>
#include <sstream>

#include "ozz/base/log.h"

#include "quat_math.h"

namespace bvh {

namespace {

// True if `joint` is one of the remaining bones (which is then removed from
// the set) or if any remaining bone lies below it
bool HasBone(const Rig& rig, std::set<int>* bone_set, int joint) {
    if (bone_set->erase(joint) > 0) {
        return true;
    }
    for (int other : *bone_set) {
        if (rig.IsChildOf(other, joint)) {
            return true;
        }
    }
    return false;
}

std::string NodeName(const Rig& rig, const RenameTable& renames, int joint) {
    const std::string& name = rig.names[joint];
    for (const auto& rename : renames) {
        if (rename.target_name == name) {
            return rename.bvh_name;
        }
    }
    for (const auto& rename : renames) {
        if (rename.bvh_name == name) {
            return name + "_";
        }
    }
    return name;
}

}  // anonymous namespace

int FindRootBone(const Rig& rig, const std::vector<int>& bones) {
    int root = -1;
    for (int bone : bones) {
        if (root < 0) {
            root = bone;
        }
        if (bone != root && rig.IsChildOf(root, bone)) {
            root = bone;
        }
    }
    return root;
}

bool BuildSkelTree(const Rig& rig, const std::vector<int>& bones, int root,
                   const RenameTable& renames, SkelTree* tree, Error* error) {
    if (bones.empty()) {
        return Fail(error, ErrorCode::kPrecondition,
                    "the bones list has to be set before building the skeleton");
    }
    for (int bone : bones) {
        if (bone < 0 || bone >= rig.num_joints()) {
            std::ostringstream oss;
            oss << "bone index " << bone << " is outside the rig ("
                << rig.num_joints() << " joints)";
            return Fail(error, ErrorCode::kPrecondition, oss.str());
        }
    }

    if (root < 0) {
        root = FindRootBone(rig, bones);
    }
    if (root < 0 || root >= rig.num_joints()) {
        return Fail(error, ErrorCode::kPrecondition, "no root bone found");
    }

    // World scales at rest. Rotations do not affect them.
    const std::vector<ozz::math::Transform> world = rig.ComputeWorld(rig.rest_poses);

    SkelTree result;
    result.base_position = rig.placement.translation;
    result.rig_scale = rig.placement.scale;
    result.root.name = NodeName(rig, renames, root);
    result.root.joint = root;

    std::set<int> bone_set(bones.begin(), bones.end());
    bone_set.erase(root);

    std::deque<SkelNode*> queue;
    queue.push_back(&result.root);
    while (!queue.empty()) {
        SkelNode* node = queue.front();
        queue.pop_front();

        std::vector<int> child_joints;
        for (int child : rig.Children(node->joint)) {
            if (HasBone(rig, &bone_set, child)) {
                child_joints.push_back(child);
            }
        }

        // Filled in one go so the queued pointers stay valid
        node->children.resize(child_joints.size());
        for (size_t i = 0; i < child_joints.size(); ++i) {
            SkelNode& child = node->children[i];
            child.joint = child_joints[i];
            child.name = NodeName(rig, renames, child.joint);
            child.rest_offset = Mul(world[node->joint].scale,
                                    rig.rest_poses[child.joint].translation);
            queue.push_back(&child);
        }
    }

    if (!bone_set.empty()) {
        ozz::log::LogV() << bone_set.size() << " bone(s) are not below root \""
                         << rig.names[root] << "\" and were left out." << std::endl;
    }

    *tree = std::move(result);
    return true;
}

bool CapturePose(const Rig& rig, const std::vector<ozz::math::Transform>& locals,
                 int root_joint, PoseSnapshot* pose, Error* error) {
    if (static_cast<int>(locals.size()) != rig.num_joints()) {
        return Fail(error, ErrorCode::kPrecondition,
                    "pose does not have one transform per rig joint");
    }
    if (root_joint < 0 || root_joint >= rig.num_joints()) {
        return Fail(error, ErrorCode::kPrecondition, "invalid root joint");
    }

    const std::vector<ozz::math::Transform> world = rig.ComputeWorld(locals);
    pose->root_position = world[root_joint].translation;
    pose->root_rotation = world[root_joint].rotation;
    pose->local_rotations.resize(locals.size());
    for (size_t i = 0; i < locals.size(); ++i) {
        pose->local_rotations[i] = locals[i].rotation;
    }
    return true;
}

}  // namespace bvh
