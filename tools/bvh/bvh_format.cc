// BVH document helpers

#include "bvh_format.h"

namespace bvh {

const char* const kChannelNames[kNumChannelKinds] = {
    "Xposition", "Yposition", "Zposition",
    "Xrotation", "Yrotation", "Zrotation",
};

bool Joint::HasPosition() const {
    return channels[kXPosition].enabled && channels[kYPosition].enabled &&
           channels[kZPosition].enabled;
}

bool Joint::HasRotation() const {
    return channels[kXRotation].enabled && channels[kYRotation].enabled &&
           channels[kZRotation].enabled;
}

namespace {

template <typename JointPtr>
void FlattenRecursive(JointPtr joint, std::vector<JointPtr>* out) {
    out->push_back(joint);
    for (auto& child : joint->children) {
        FlattenRecursive(&child, out);
    }
}

}  // anonymous namespace

std::vector<const Joint*> FlattenJoints(const Joint& root) {
    std::vector<const Joint*> joints;
    FlattenRecursive(&root, &joints);
    return joints;
}

std::vector<Joint*> FlattenJoints(Joint* root) {
    std::vector<Joint*> joints;
    FlattenRecursive(root, &joints);
    return joints;
}

int CountChannels(const Joint& root) {
    int total = 0;
    for (const Joint* joint : FlattenJoints(root)) {
        total += joint->channel_count;
    }
    return total;
}

}  // namespace bvh
