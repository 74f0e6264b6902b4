// Collects decoded curves and assembles an ozz RawAnimation from them

#ifndef ANIMATION_CURVES_H_
#define ANIMATION_CURVES_H_

#include <vector>

#include "ozz/animation/offline/raw_animation.h"

#include "bvh_error.h"
#include "curve_decoder.h"
#include "rig.h"

namespace bvh {

class RawAnimationCurves : public CurveConsumer {
 public:
    explicit RawAnimationCurves(int num_joints);

    void SetCurve(int joint, CurveProperty property,
                  const std::vector<Keyframe>& keys) override;

    bool HasCurve(int joint, CurveProperty property) const;
    const std::vector<Keyframe>& GetCurve(int joint, CurveProperty property) const;

    // Build one track per rig joint. Translations come from complete x/y/z
    // curves, rotations from complete x/y/z/w curves (normalized, with sign
    // flips removed between consecutive keys). Everything else is held at
    // the rest pose.
    bool Build(const Rig& rig, float duration, const char* name,
               ozz::animation::offline::RawAnimation* animation, Error* error) const;

 private:
    struct JointCurves {
        bool set[kNumCurveProperties] = {};
        std::vector<Keyframe> keys[kNumCurveProperties];
    };

    std::vector<JointCurves> m_joints;
};

}  // namespace bvh

#endif  // ANIMATION_CURVES_H_
