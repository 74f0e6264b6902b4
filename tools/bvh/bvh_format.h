// BVH (Biovision Hierarchy) document structures
// A document is a joint tree plus one dense value array per enabled channel

#ifndef BVH_FORMAT_H_
#define BVH_FORMAT_H_

#include <string>
#include <vector>

#include "ozz/base/maths/vec_float.h"

namespace bvh {

// Channel kinds, indexed the way the parser stores them:
// position kinds 0-2, rotation kinds 3-5 (axis + 3)
enum ChannelKind {
    kXPosition = 0,
    kYPosition = 1,
    kZPosition = 2,
    kXRotation = 3,
    kYRotation = 4,
    kZRotation = 5,
};

constexpr int kNumChannelKinds = 6;

// Token text for each channel kind, as written to files
extern const char* const kChannelNames[kNumChannelKinds];

struct Channel {
    bool enabled = false;
    std::vector<float> values;  // One value per frame, empty when disabled
};

struct Joint {
    std::string name;
    ozz::math::Float3 offset = ozz::math::Float3::zero();

    // Number of declared channels (1-6) and their declaration order
    int channel_count = 0;
    ChannelKind channel_order[kNumChannelKinds] = {
        kXPosition, kYPosition, kZPosition, kZRotation, kXRotation, kYRotation};

    // Indexed by ChannelKind
    Channel channels[kNumChannelKinds];

    std::vector<Joint> children;

    bool HasChannel(ChannelKind kind) const { return channels[kind].enabled; }

    // All three position (or rotation) channels are enabled
    bool HasPosition() const;
    bool HasRotation() const;
};

struct Document {
    Joint root;
    int frames = 0;
    float frame_time = 1.0f / 60.0f;  // Seconds per frame
};

// Pre-order list of every joint under (and including) root.
// This is the column order of the MOTION section.
std::vector<const Joint*> FlattenJoints(const Joint& root);
std::vector<Joint*> FlattenJoints(Joint* root);

// Sum of declared channels over all joints
int CountChannels(const Joint& root);

}  // namespace bvh

#endif  // BVH_FORMAT_H_
