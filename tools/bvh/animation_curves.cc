// RawAnimation assembly from decoded curves

#include "animation_curves.h"

#include "ozz/base/log.h"

#include "quat_math.h"

namespace bvh {

namespace {

const std::vector<Keyframe> kEmptyCurve;

int Index(CurveProperty property) {
    return static_cast<int>(property);
}

}  // anonymous namespace

RawAnimationCurves::RawAnimationCurves(int num_joints)
    : m_joints(static_cast<size_t>(num_joints > 0 ? num_joints : 0)) {}

void RawAnimationCurves::SetCurve(int joint, CurveProperty property,
                                  const std::vector<Keyframe>& keys) {
    if (joint < 0 || joint >= static_cast<int>(m_joints.size())) {
        ozz::log::Err() << "Curve " << CurvePropertyName(property)
                        << " targets unknown joint " << joint << "." << std::endl;
        return;
    }
    m_joints[joint].set[Index(property)] = true;
    m_joints[joint].keys[Index(property)] = keys;
}

bool RawAnimationCurves::HasCurve(int joint, CurveProperty property) const {
    if (joint < 0 || joint >= static_cast<int>(m_joints.size())) {
        return false;
    }
    return m_joints[joint].set[Index(property)];
}

const std::vector<Keyframe>& RawAnimationCurves::GetCurve(int joint,
                                                          CurveProperty property) const {
    if (!HasCurve(joint, property)) {
        return kEmptyCurve;
    }
    return m_joints[joint].keys[Index(property)];
}

bool RawAnimationCurves::Build(const Rig& rig, float duration, const char* name,
                               ozz::animation::offline::RawAnimation* animation,
                               Error* error) const {
    using ozz::animation::offline::RawAnimation;

    if (static_cast<int>(m_joints.size()) != rig.num_joints()) {
        return Fail(error, ErrorCode::kPrecondition,
                    "curve set and rig have a different joint count");
    }
    if (!(duration > 0.0f)) {
        return Fail(error, ErrorCode::kPrecondition, "animation duration must be positive");
    }

    animation->name = name ? name : "";
    animation->duration = duration;
    animation->tracks.clear();
    animation->tracks.resize(m_joints.size());

    for (size_t j = 0; j < m_joints.size(); ++j) {
        const JointCurves& curves = m_joints[j];
        const ozz::math::Transform& rest = rig.rest_poses[j];
        RawAnimation::JointTrack& track = animation->tracks[j];

        const int px = Index(CurveProperty::kPositionX);
        const int py = Index(CurveProperty::kPositionY);
        const int pz = Index(CurveProperty::kPositionZ);
        if (curves.set[px] && curves.set[py] && curves.set[pz]) {
            const size_t count = curves.keys[px].size();
            if (curves.keys[py].size() != count || curves.keys[pz].size() != count) {
                return Fail(error, ErrorCode::kPrecondition,
                            "position curves of joint " + rig.names[j] +
                                " have different key counts");
            }
            for (size_t i = 0; i < count; ++i) {
                if (curves.keys[px][i].time > duration) {
                    break;
                }
                RawAnimation::TranslationKey key;
                key.time = curves.keys[px][i].time;
                key.value = ozz::math::Float3(curves.keys[px][i].value,
                                              curves.keys[py][i].value,
                                              curves.keys[pz][i].value);
                track.translations.push_back(key);
            }
        }
        if (track.translations.empty()) {
            RawAnimation::TranslationKey key;
            key.time = 0.0f;
            key.value = rest.translation;
            track.translations.push_back(key);
        }

        const int rx = Index(CurveProperty::kRotationX);
        const int ry = Index(CurveProperty::kRotationY);
        const int rz = Index(CurveProperty::kRotationZ);
        const int rw = Index(CurveProperty::kRotationW);
        if (curves.set[rx] && curves.set[ry] && curves.set[rz] && curves.set[rw]) {
            const size_t count = curves.keys[rx].size();
            if (curves.keys[ry].size() != count || curves.keys[rz].size() != count ||
                curves.keys[rw].size() != count) {
                return Fail(error, ErrorCode::kPrecondition,
                            "rotation curves of joint " + rig.names[j] +
                                " have different key counts");
            }
            for (size_t i = 0; i < count; ++i) {
                if (curves.keys[rx][i].time > duration) {
                    break;
                }
                ozz::math::Quaternion value = quat::Normalize(ozz::math::Quaternion(
                    curves.keys[rx][i].value, curves.keys[ry][i].value,
                    curves.keys[rz][i].value, curves.keys[rw][i].value));

                // Keep consecutive keys in the same hemisphere
                if (!track.rotations.empty() &&
                    quat::Dot(track.rotations.back().value, value) < 0.0f) {
                    value = ozz::math::Quaternion(-value.x, -value.y, -value.z, -value.w);
                }

                RawAnimation::RotationKey key;
                key.time = curves.keys[rx][i].time;
                key.value = value;
                track.rotations.push_back(key);
            }
        }
        if (track.rotations.empty()) {
            RawAnimation::RotationKey key;
            key.time = 0.0f;
            key.value = rest.rotation;
            track.rotations.push_back(key);
        }

        RawAnimation::ScaleKey scale;
        scale.time = 0.0f;
        scale.value = rest.scale;
        track.scales.push_back(scale);
    }

    if (!animation->Validate()) {
        return Fail(error, ErrorCode::kPrecondition,
                    "animation validation failed, key times must be ascending and "
                    "within the duration");
    }
    return true;
}

}  // namespace bvh
