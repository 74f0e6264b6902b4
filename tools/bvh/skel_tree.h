// Skeleton tree used to write the HIERARCHY section of a BVH file
// A minimal tree spanning a set of rig joints, with rest offsets
// recorded once at build time

#ifndef SKEL_TREE_H_
#define SKEL_TREE_H_

#include <string>
#include <vector>

#include "ozz/base/maths/quaternion.h"
#include "ozz/base/maths/vec_float.h"

#include "bone_resolver.h"
#include "bvh_error.h"
#include "rig.h"

namespace bvh {

struct SkelNode {
    std::string name;  // Name written to the file
    int joint = -1;    // Rig joint index

    // World displacement from the parent node with every tree joint at
    // identity rotation. Zero for the root.
    ozz::math::Float3 rest_offset = ozz::math::Float3::zero();

    std::vector<SkelNode> children;
};

struct SkelTree {
    SkelNode root;

    // Character position when the tree was built. Root translation in
    // captured frames is relative to it.
    ozz::math::Float3 base_position = ozz::math::Float3::zero();

    // Character scale, compensated for when writing offsets
    ozz::math::Float3 rig_scale = ozz::math::Float3::one();
};

// Pose of the rig for one captured frame
struct PoseSnapshot {
    ozz::math::Float3 root_position = ozz::math::Float3::zero();   // World
    ozz::math::Quaternion root_rotation = ozz::math::Quaternion::identity();  // World
    std::vector<ozz::math::Quaternion> local_rotations;  // Indexed by rig joint
};

// Top-most joint of the set: the one every other bone was found under.
// Returns -1 for an empty set.
int FindRootBone(const Rig& rig, const std::vector<int>& bones);

// Build the minimal tree covering `bones`, starting at `root` (or at
// FindRootBone when root is -1). Rig joints between two bones become
// nodes too. Names come from the rig unless the rename table maps them;
// unmapped joints whose name is already taken by a mapping get a '_' suffix.
bool BuildSkelTree(const Rig& rig, const std::vector<int>& bones, int root,
                   const RenameTable& renames, SkelTree* tree, Error* error);

// Capture root world transform and local rotations from parent-relative
// joint transforms
bool CapturePose(const Rig& rig, const std::vector<ozz::math::Transform>& locals,
                 int root_joint, PoseSnapshot* pose, Error* error);

}  // namespace bvh

#endif  // SKEL_TREE_H_
