// BVH joint tree to RawSkeleton

#include "bvh_skeleton.h"

#include "ozz/base/log.h"

namespace bvh {

namespace {

void BuildJointRecursive(const Joint& node, coord_convert::Convention convention,
                         ozz::animation::offline::RawSkeleton::Joint* joint) {
    joint->name = node.name.c_str();
    joint->transform.translation = coord_convert::PositionFromBvh(node.offset, convention);
    joint->transform.rotation = ozz::math::Quaternion::identity();
    joint->transform.scale = ozz::math::Float3::one();

    joint->children.resize(node.children.size());
    for (size_t i = 0; i < node.children.size(); ++i) {
        BuildJointRecursive(node.children[i], convention, &joint->children[i]);
    }
}

}  // anonymous namespace

bool BuildRawSkeleton(const Document& document, coord_convert::Convention convention,
                      ozz::animation::offline::RawSkeleton* skeleton, Error* error) {
    if (document.root.name.empty()) {
        return Fail(error, ErrorCode::kPrecondition, "no BVH document has been parsed");
    }

    skeleton->roots.clear();
    skeleton->roots.resize(1);
    BuildJointRecursive(document.root, convention, &skeleton->roots[0]);

    if (!skeleton->Validate()) {
        return Fail(error, ErrorCode::kPrecondition, "skeleton validation failed");
    }

    ozz::log::LogV() << "Built skeleton with " << skeleton->num_joints()
                     << " joints from BVH hierarchy." << std::endl;
    return true;
}

}  // namespace bvh
