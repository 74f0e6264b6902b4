// BVH writer implementation

#include "bvh_writer.h"

#include <cstdio>
#include <sstream>

#include "quat_math.h"

namespace bvh {

namespace {

std::string Tabs(int level) {
    return std::string(static_cast<size_t>(level), '\t');
}

}  // anonymous namespace

// Fixed point with a leading space for non-negative values so columns line up
std::string BvhWriter::FormatValue(float value) const {
    char buffer[64];
    const char* format = m_settings.precision == Precision::kLow ? "%.2f" : "%.6f";
    std::snprintf(buffer, sizeof(buffer), format, static_cast<double>(value));
    if (buffer[0] != '-') {
        return std::string(" ") + buffer;
    }
    // Negative values that round to zero are written as zero
    for (const char* c = buffer + 1; *c; ++c) {
        if (*c != '0' && *c != '.') {
            return buffer;
        }
    }
    return std::string(" ") + (buffer + 1);
}

std::string BvhWriter::FormatTriple(const ozz::math::Float3& v) const {
    return FormatValue(v.x) + "\t" + FormatValue(v.y) + "\t" + FormatValue(v.z);
}

// Columns in Zrotation Xrotation Yrotation order
std::string BvhWriter::FormatRotation(const ozz::math::Quaternion& q) const {
    const ozz::math::Float3 euler = coord_convert::EncodeRotation(q, m_settings.convention);
    return FormatValue(euler.z) + "\t" + FormatValue(euler.x) + "\t" + FormatValue(euler.y);
}

std::string BvhWriter::GenJoint(int level, const SkelNode& node) {
    const ozz::math::Float3 offset = coord_convert::OffsetToBvh(
        node.rest_offset, m_rig_scale, m_settings.convention);

    std::string result = Tabs(level) + "JOINT " + node.name + "\n" +
                         Tabs(level) + "{\n" +
                         Tabs(level) + "\tOFFSET\t" + FormatTriple(offset) + "\n" +
                         Tabs(level) + "\tCHANNELS 3 Zrotation Xrotation Yrotation\n";
    m_bone_order.push_back(node.joint);

    if (!node.children.empty()) {
        for (const SkelNode& child : node.children) {
            result += GenJoint(level + 1, child);
        }
    } else {
        // Leaf: the end site repeats the bone's own offset to give it a length
        ozz::math::Float3 tail = offset;
        if (tail.x == 0.0f && tail.y == 0.0f && tail.z == 0.0f) {
            tail = ozz::math::Float3(1.0f, 0.0f, 0.0f);
        }
        result += Tabs(level + 1) + "End Site\n" +
                  Tabs(level + 1) + "{\n" +
                  Tabs(level + 1) + "\tOFFSET\t" + FormatTriple(tail) + "\n" +
                  Tabs(level + 1) + "}\n";
    }

    result += Tabs(level) + "}\n";
    return result;
}

bool BvhWriter::GenHierarchy(const SkelTree& tree, Error* error) {
    if (tree.root.joint < 0) {
        return Fail(error, ErrorCode::kPrecondition,
                    "skeleton not initialized, build the skeleton tree first");
    }
    if (tree.rig_scale.x == 0.0f || tree.rig_scale.y == 0.0f || tree.rig_scale.z == 0.0f) {
        return Fail(error, ErrorCode::kPrecondition, "rig scale has a zero component");
    }

    m_root_joint = tree.root.joint;
    m_base_position = tree.base_position;
    m_rig_scale = tree.rig_scale;
    m_bone_order.assign(1, tree.root.joint);

    std::string hierarchy = "HIERARCHY\nROOT " + tree.root.name +
                            "\n{\n\tOFFSET\t0.00\t0.00\t0.00\n"
                            "\tCHANNELS 6 Xposition Yposition Zposition "
                            "Zrotation Xrotation Yrotation\n";

    if (!tree.root.children.empty()) {
        for (const SkelNode& child : tree.root.children) {
            hierarchy += GenJoint(1, child);
        }
    } else {
        hierarchy += "\tEnd Site\n\t{\n\t\tOFFSET\t1.0\t0.0\t0.0\n\t}\n";
    }
    hierarchy += "}\n";

    m_hierarchy = hierarchy;
    m_frames.clear();
    return true;
}

bool BvhWriter::CaptureFrame(const PoseSnapshot& pose, Error* error) {
    if (m_hierarchy.empty()) {
        return Fail(error, ErrorCode::kPrecondition,
                    "hierarchy not initialized, call GenHierarchy first");
    }
    for (int joint : m_bone_order) {
        if (joint != m_root_joint &&
            joint >= static_cast<int>(pose.local_rotations.size())) {
            return Fail(error, ErrorCode::kPrecondition,
                        "pose snapshot does not cover every bone of the hierarchy");
        }
    }

    const ozz::math::Float3 position = coord_convert::OffsetToBvh(
        Sub(pose.root_position, m_base_position), m_rig_scale, m_settings.convention);

    std::string line = FormatTriple(position);
    for (int joint : m_bone_order) {
        line += "\t";
        if (joint == m_root_joint) {
            line += FormatRotation(pose.root_rotation);
        } else {
            line += FormatRotation(pose.local_rotations[joint]);
        }
    }
    line += "\n";
    m_frames.push_back(line);
    return true;
}

bool BvhWriter::GenBvh(std::string* output, Error* error) const {
    if (m_hierarchy.empty()) {
        return Fail(error, ErrorCode::kPrecondition,
                    "hierarchy not initialized, call GenHierarchy first");
    }
    if (!(m_settings.frame_rate > 0.0f)) {
        return Fail(error, ErrorCode::kPrecondition, "frame rate must be positive");
    }

    char frame_time[32];
    std::snprintf(frame_time, sizeof(frame_time), "%.8g",
                  static_cast<double>(1.0f / m_settings.frame_rate));

    std::ostringstream bvh;
    bvh << m_hierarchy;
    bvh << "MOTION\nFrames:    " << m_frames.size() << "\nFrame Time: " << frame_time << "\n";
    for (const std::string& frame : m_frames) {
        bvh << frame;
    }
    *output = bvh.str();
    return true;
}

}  // namespace bvh
