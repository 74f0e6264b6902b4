// Conversion of a BVH joint tree into an ozz RawSkeleton

#ifndef BVH_SKELETON_H_
#define BVH_SKELETON_H_

#include "ozz/animation/offline/raw_skeleton.h"

#include "bvh_error.h"
#include "bvh_format.h"
#include "coordinate_convert.h"

namespace bvh {

// One ozz joint per BVH joint, in the same order. Offsets are remapped into
// engine space; rest rotations are identity and scales are one.
bool BuildRawSkeleton(const Document& document, coord_convert::Convention convention,
                      ozz::animation::offline::RawSkeleton* skeleton, Error* error);

}  // namespace bvh

#endif  // BVH_SKELETON_H_
