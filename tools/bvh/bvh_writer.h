// BVH text writer
// Generates the HIERARCHY section from a skeleton tree once, then captures
// one MOTION line per pose snapshot

#ifndef BVH_WRITER_H_
#define BVH_WRITER_H_

#include <string>
#include <vector>

#include "bvh_error.h"
#include "coordinate_convert.h"
#include "skel_tree.h"

namespace bvh {

enum class Precision {
    kHigh,  // 6 decimals
    kLow,   // 2 decimals
};

struct WriterSettings {
    coord_convert::Convention convention = coord_convert::Convention::kBlender;
    Precision precision = Precision::kHigh;
    float frame_rate = 60.0f;  // Frames per second written as Frame Time
};

class BvhWriter {
 public:
    BvhWriter() = default;
    explicit BvhWriter(const WriterSettings& settings) : m_settings(settings) {}

    const WriterSettings& settings() const { return m_settings; }

    // Generate the hierarchy text and record the bone order used for every
    // captured frame. Discards previously captured frames.
    bool GenHierarchy(const SkelTree& tree, Error* error);

    // Append one motion line. Requires GenHierarchy.
    bool CaptureFrame(const PoseSnapshot& pose, Error* error);

    void ClearCapture() { m_frames.clear(); }

    // Hierarchy followed by the motion section. Requires GenHierarchy.
    bool GenBvh(std::string* output, Error* error) const;

    int frame_count() const { return static_cast<int>(m_frames.size()); }
    const std::string& hierarchy() const { return m_hierarchy; }

 private:
    std::string FormatValue(float value) const;
    std::string FormatTriple(const ozz::math::Float3& v) const;
    std::string FormatRotation(const ozz::math::Quaternion& q) const;
    std::string GenJoint(int level, const SkelNode& node);

    WriterSettings m_settings;

    std::string m_hierarchy;
    std::vector<int> m_bone_order;  // Pre-order rig joints, root first
    int m_root_joint = -1;
    ozz::math::Float3 m_base_position = ozz::math::Float3::zero();
    ozz::math::Float3 m_rig_scale = ozz::math::Float3::one();

    std::vector<std::string> m_frames;
};

}  // namespace bvh

#endif  // BVH_WRITER_H_
