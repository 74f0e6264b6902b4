// Curve decoder
// Turns a parsed BVH document into per-joint keyframe curves on a rig

#ifndef CURVE_DECODER_H_
#define CURVE_DECODER_H_

#include <vector>

#include "bone_resolver.h"
#include "bvh_error.h"
#include "bvh_format.h"
#include "coordinate_convert.h"
#include "rig.h"

namespace bvh {

enum class CurveProperty {
    kPositionX,
    kPositionY,
    kPositionZ,
    kRotationX,
    kRotationY,
    kRotationZ,
    kRotationW,
};

constexpr int kNumCurveProperties = 7;

// "position.x" ... "rotation.w"
const char* CurvePropertyName(CurveProperty property);

struct Keyframe {
    float time;
    float value;
};

// Receives decoded curves. Implementations own quaternion sign continuity.
class CurveConsumer {
 public:
    virtual ~CurveConsumer() {}

    virtual void SetCurve(int joint, CurveProperty property,
                          const std::vector<Keyframe>& keys) = 0;
};

struct DecodeSettings {
    coord_convert::Convention convention = coord_convert::Convention::kBlender;
};

class CurveDecoder {
 public:
    CurveDecoder(const Rig& rig, const BoneResolver& resolver,
                 const DecodeSettings& settings);

    // Walk the document in pre-order and emit the curves of every joint.
    // Fails on the first BVH joint without a rig counterpart.
    bool Decode(const Document& document, CurveConsumer* consumer, Error* error);

    // Rig joint the BVH root was matched to by the last successful Decode
    int root_joint() const { return m_root_joint; }

 private:
    bool DecodeJoint(const Document& document, const Joint& node, int joint, bool first,
                     CurveConsumer* consumer, Error* error) const;

    // Rig joint of the BVH root: name match, else the top-most rig joint
    int ResolveRoot(const std::string& bvh_name) const;

    // World rest transform of the root's parent, with the placement reduced
    // to its scale
    ozz::math::Transform RootParentRest(int joint) const;

    const Rig& m_rig;
    const BoneResolver& m_resolver;
    DecodeSettings m_settings;
    int m_root_joint = -1;
};

}  // namespace bvh

#endif  // CURVE_DECODER_H_
