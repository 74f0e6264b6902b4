// Curve decoder implementation

#include "curve_decoder.h"

#include "ozz/base/log.h"

#include "quat_math.h"

namespace bvh {

const char* CurvePropertyName(CurveProperty property) {
    switch (property) {
        case CurveProperty::kPositionX: return "position.x";
        case CurveProperty::kPositionY: return "position.y";
        case CurveProperty::kPositionZ: return "position.z";
        case CurveProperty::kRotationX: return "rotation.x";
        case CurveProperty::kRotationY: return "rotation.y";
        case CurveProperty::kRotationZ: return "rotation.z";
        case CurveProperty::kRotationW: return "rotation.w";
    }
    return "unknown";
}

CurveDecoder::CurveDecoder(const Rig& rig, const BoneResolver& resolver,
                           const DecodeSettings& settings)
    : m_rig(rig), m_resolver(resolver), m_settings(settings) {}

int CurveDecoder::ResolveRoot(const std::string& bvh_name) const {
    const int root = m_resolver.FindRoot(m_rig, bvh_name);
    if (root >= 0) {
        ozz::log::LogV() << "Root bone \"" << bvh_name << "\" matched rig joint \""
                         << m_rig.names[root] << "\"." << std::endl;
        return root;
    }
    for (int i = 0; i < m_rig.num_joints(); ++i) {
        if (m_rig.parents[i] < 0) {
            ozz::log::Log() << "Warning: no root bone \"" << bvh_name << "\" found. Using \""
                            << m_rig.names[i] << "\" as the root bone." << std::endl;
            return i;
        }
    }
    return -1;
}

ozz::math::Transform CurveDecoder::RootParentRest(int joint) const {
    // The character is decoded at the origin with no rotation, keeping its scale
    ozz::math::Transform placement = IdentityTransform();
    placement.scale = m_rig.placement.scale;

    const int parent = m_rig.parents[joint];
    if (parent < 0) {
        return placement;
    }
    const std::vector<ozz::math::Transform> model = m_rig.ComputeModel(m_rig.rest_poses);
    return Combine(placement, model[parent]);
}

bool CurveDecoder::Decode(const Document& document, CurveConsumer* consumer, Error* error) {
    if (consumer == nullptr) {
        return Fail(error, ErrorCode::kPrecondition, "no curve consumer given");
    }
    if (m_rig.num_joints() == 0) {
        return Fail(error, ErrorCode::kPrecondition, "rig has no joints");
    }
    if (!(document.frame_time > 0.0f)) {
        return Fail(error, ErrorCode::kPrecondition, "frame time must be positive");
    }
    if (document.root.name.empty()) {
        return Fail(error, ErrorCode::kPrecondition, "no BVH document has been parsed");
    }

    const int root = ResolveRoot(document.root.name);
    if (root < 0) {
        return Fail(error, ErrorCode::kNameResolution,
                    "no root bone \"" + document.root.name + "\" found");
    }

    if (!DecodeJoint(document, document.root, root, true, consumer, error)) {
        return false;
    }
    m_root_joint = root;
    return true;
}

bool CurveDecoder::DecodeJoint(const Document& document, const Joint& node, int bone,
                               bool first, CurveConsumer* consumer, Error* error) const {
    const int joint = m_resolver.FindChild(m_rig, node.name, bone, first);
    if (joint < 0) {
        return Fail(error, ErrorCode::kNameResolution,
                    "Could not find bone \"" + node.name + "\" under bone \"" +
                        m_rig.names[bone] + "\".");
    }

    const size_t frames = static_cast<size_t>(document.frames);
    for (int kind = 0; kind < kNumChannelKinds; ++kind) {
        if (node.channels[kind].enabled && node.channels[kind].values.size() != frames) {
            return Fail(error, ErrorCode::kPrecondition,
                        "channel data of joint \"" + node.name +
                            "\" does not match the frame count");
        }
    }

    const coord_convert::Convention convention = m_settings.convention;
    const ozz::math::Transform parent_rest = first ? RootParentRest(joint) : IdentityTransform();

    if (node.HasPosition()) {
        if (first) {
            const ozz::math::Float3 offset = coord_convert::PositionFromBvh(node.offset, convention);
            std::vector<Keyframe> x(frames), y(frames), z(frames);
            for (size_t i = 0; i < frames; ++i) {
                const float time = static_cast<float>(i) * document.frame_time;
                const ozz::math::Float3 value(node.channels[kXPosition].values[i],
                                              node.channels[kYPosition].values[i],
                                              node.channels[kZPosition].values[i]);
                const ozz::math::Float3 world =
                    Add(coord_convert::PositionFromBvh(value, convention), offset);
                const ozz::math::Float3 local =
                    Mul(InverseTransformPoint(parent_rest, world), m_rig.placement.scale);
                x[i] = {time, local.x};
                y[i] = {time, local.y};
                z[i] = {time, local.z};
            }
            consumer->SetCurve(joint, CurveProperty::kPositionX, x);
            consumer->SetCurve(joint, CurveProperty::kPositionY, y);
            consumer->SetCurve(joint, CurveProperty::kPositionZ, z);
        } else {
            ozz::log::Log() << "Warning: position channels on bone \"" << node.name
                            << "\" ignored. Only the root bone may carry positions."
                            << std::endl;
        }
    } else if (node.HasChannel(kXPosition) || node.HasChannel(kYPosition) ||
               node.HasChannel(kZPosition)) {
        ozz::log::LogV() << "Skipping incomplete position channels of \"" << node.name
                         << "\"." << std::endl;
    }

    if (node.HasRotation()) {
        const ozz::math::Quaternion parent_inv = quat::Conjugate(parent_rest.rotation);
        std::vector<Keyframe> x(frames), y(frames), z(frames), w(frames);
        for (size_t i = 0; i < frames; ++i) {
            const float time = static_cast<float>(i) * document.frame_time;
            const ozz::math::Float3 euler(node.channels[kXRotation].values[i],
                                          node.channels[kYRotation].values[i],
                                          node.channels[kZRotation].values[i]);
            ozz::math::Quaternion rotation = coord_convert::DecodeRotation(euler, convention);
            if (first) {
                rotation = quat::Multiply(parent_inv, rotation);
            }
            x[i] = {time, rotation.x};
            y[i] = {time, rotation.y};
            z[i] = {time, rotation.z};
            w[i] = {time, rotation.w};
        }
        consumer->SetCurve(joint, CurveProperty::kRotationX, x);
        consumer->SetCurve(joint, CurveProperty::kRotationY, y);
        consumer->SetCurve(joint, CurveProperty::kRotationZ, z);
        consumer->SetCurve(joint, CurveProperty::kRotationW, w);
    } else if (node.HasChannel(kXRotation) || node.HasChannel(kYRotation) ||
               node.HasChannel(kZRotation)) {
        ozz::log::LogV() << "Skipping incomplete rotation channels of \"" << node.name
                         << "\"." << std::endl;
    }

    for (const Joint& child : node.children) {
        if (!DecodeJoint(document, child, joint, false, consumer, error)) {
            return false;
        }
    }
    return true;
}

}  // namespace bvh
