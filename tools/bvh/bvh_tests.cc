// Unit tests for the BVH library
// Tests the scanner, parser, coordinate conventions, writer and curve decoding

#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "ozz/animation/offline/raw_animation.h"
#include "ozz/animation/offline/raw_skeleton.h"

#include "animation_curves.h"
#include "bone_resolver.h"
#include "bvh_error.h"
#include "bvh_format.h"
#include "bvh_parser.h"
#include "bvh_scanner.h"
#include "bvh_skeleton.h"
#include "bvh_writer.h"
#include "coordinate_convert.h"
#include "curve_decoder.h"
#include "quat_math.h"
#include "rig.h"
#include "skel_tree.h"

using bvh::coord_convert::Convention;

// Test helpers
bool float_eq(float a, float b, float epsilon = 0.001f) {
    return std::abs(a - b) < epsilon;
}

bool vec_eq(const ozz::math::Float3& a, const ozz::math::Float3& b, float epsilon = 0.001f) {
    return float_eq(a.x, b.x, epsilon) && float_eq(a.y, b.y, epsilon) &&
           float_eq(a.z, b.z, epsilon);
}

bool quat_eq(const ozz::math::Quaternion& a, const ozz::math::Quaternion& b,
             float epsilon = 0.001f) {
    // Quaternions q and -q represent the same rotation
    bool same = float_eq(a.x, b.x, epsilon) && float_eq(a.y, b.y, epsilon) &&
                float_eq(a.z, b.z, epsilon) && float_eq(a.w, b.w, epsilon);
    bool neg = float_eq(a.x, -b.x, epsilon) && float_eq(a.y, -b.y, epsilon) &&
               float_eq(a.z, -b.z, epsilon) && float_eq(a.w, -b.w, epsilon);
    return same || neg;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

ozz::math::Transform make_transform(const ozz::math::Float3& translation,
                                    const ozz::math::Quaternion& rotation =
                                        ozz::math::Quaternion::identity()) {
    ozz::math::Transform t = bvh::IdentityTransform();
    t.translation = translation;
    t.rotation = rotation;
    return t;
}

// hips -> spine -> {head, arm}
bvh::Rig make_rig() {
    bvh::Rig rig;
    rig.names = {"hips", "spine", "head", "arm"};
    rig.parents = {-1, 0, 1, 1};
    rig.rest_poses = {
        make_transform(ozz::math::Float3(0.0f, 1.0f, 0.0f)),
        make_transform(ozz::math::Float3(0.0f, 0.5f, 0.0f)),
        make_transform(ozz::math::Float3(0.0f, 0.3f, 0.0f)),
        make_transform(ozz::math::Float3(0.2f, 0.2f, 0.0f)),
    };
    return rig;
}

ozz::math::Quaternion make_rotation(float degrees, float x, float y, float z) {
    const float len = std::sqrt(x * x + y * y + z * z);
    return bvh::quat::AngleAxis(degrees, ozz::math::Float3(x / len, y / len, z / len));
}

const char* kSimpleBvh =
    "HIERARCHY\n"
    "ROOT Hips\n"
    "{\n"
    "\tOFFSET 0.0 0.0 0.0\n"
    "\tCHANNELS 6 Xposition Yposition Zposition Zrotation Xrotation Yrotation\n"
    "\tJOINT Spine\n"
    "\t{\n"
    "\t\tOFFSET 0.0 5.0 0.0\n"
    "\t\tCHANNELS 3 Zrotation Xrotation Yrotation\n"
    "\t\tEnd Site\n"
    "\t\t{\n"
    "\t\t\tOFFSET 0.0 3.0 0.0\n"
    "\t\t}\n"
    "\t}\n"
    "}\n"
    "MOTION\n"
    "Frames: 2\n"
    "Frame Time: 0.033333\n"
    "1.0 2.0 3.0 10.0 20.0 30.0 40.0 50.0 60.0\n"
    "4.0 5.0 6.0 11.0 21.0 31.0 41.0 51.0 61.0\n";

// Replace the first occurrence of `from`
std::string replace(std::string text, const std::string& from, const std::string& to) {
    const size_t pos = text.find(from);
    assert(pos != std::string::npos);
    return text.replace(pos, from.size(), to);
}

// ============================================================================
// Scanner Tests
// ============================================================================

void test_read_float() {
    printf("Test: Read float values... ");

    float value = 0.0f;
    std::string text = "-12.50";
    bvh::Scanner negative(text);
    assert(negative.ReadFloat(&value));
    assert(float_eq(value, -12.5f));
    assert(negative.AtEnd());

    std::string comma = "3,14";
    bvh::Scanner with_comma(comma);
    assert(with_comma.ReadFloat(&value));
    assert(float_eq(value, 3.14f));

    std::string letters = "abc";
    bvh::Scanner invalid(letters);
    assert(!invalid.ReadFloat(&value));
    assert(std::isnan(value));

    std::string sign_only = "+.e";
    bvh::Scanner sign(sign_only);
    assert(!sign.ReadFloat(&value));
    assert(sign.pos() == 0);

    std::string fraction_only = ".5";
    bvh::Scanner fraction(fraction_only);
    assert(fraction.ReadFloat(&value));
    assert(float_eq(value, 0.5f));

    printf("PASSED\n");
}

void test_read_float_long_fraction() {
    printf("Test: Read float with more than 128 fractional digits... ");

    std::string text = "1." + std::string(200, '1') + " 2";
    bvh::Scanner scanner(text);
    float value = 0.0f;
    assert(scanner.ReadFloat(&value));
    assert(float_eq(value, 1.1111111f));
    // All digits consumed
    assert(scanner.pos() == 202);

    printf("PASSED\n");
}

void test_read_int() {
    printf("Test: Read int values... ");

    int value = 0;
    std::string minus_one = "-1";
    bvh::Scanner valid(minus_one);
    assert(valid.ReadInt(&value));
    assert(value == -1);

    std::string empty;
    bvh::Scanner invalid(empty);
    assert(!invalid.ReadInt(&value));
    assert(value == -1);

    std::string plus = "+42x";
    bvh::Scanner with_plus(plus);
    assert(with_plus.ReadInt(&value));
    assert(value == 42);
    assert(with_plus.pos() == 3);

    // Too large for an int
    std::string large = "99999999999";
    bvh::Scanner overflow(large);
    assert(!overflow.ReadInt(&value));
    assert(value == -1);
    assert(overflow.pos() == 0);

    std::string largest = "2147483647";
    bvh::Scanner at_limit(largest);
    assert(at_limit.ReadInt(&value));
    assert(value == 2147483647);

    // A lone sign is not consumed
    std::string sign_only = "-x";
    bvh::Scanner sign(sign_only);
    assert(!sign.ReadInt(&value));
    assert(sign.pos() == 0);

    printf("PASSED\n");
}

void test_expect_literal_rewinds() {
    printf("Test: Literal mismatch leaves cursor in place... ");

    std::string text = "HIERARCHX";
    bvh::Scanner scanner(text);
    assert(!scanner.ExpectLiteral("HIERARCHY"));
    assert(scanner.pos() == 0);

    std::string lower = "frame\ttime: 1";
    bvh::Scanner folded(lower);
    assert(folded.ExpectLiteral("FRAME TIME:"));
    assert(folded.pos() == 11);

    printf("PASSED\n");
}

void test_read_channel() {
    printf("Test: Read channel tokens... ");

    std::string text = "Zrotation xposition YROTATION Xp";
    bvh::Scanner scanner(text);
    bvh::ChannelKind kind;
    assert(scanner.ReadChannel(&kind));
    assert(kind == bvh::kZRotation);
    scanner.SkipWhitespace();
    assert(scanner.ReadChannel(&kind));
    assert(kind == bvh::kXPosition);
    scanner.SkipWhitespace();
    assert(scanner.ReadChannel(&kind));
    assert(kind == bvh::kYRotation);
    scanner.SkipWhitespace();
    const size_t before = scanner.pos();
    assert(!scanner.ReadChannel(&kind));
    assert(scanner.pos() == before);

    printf("PASSED\n");
}

// ============================================================================
// Parser Tests
// ============================================================================

void test_parse_simple() {
    printf("Test: Parse hierarchy and motion... ");

    bvh::BvhParser parser;
    bvh::Document doc;
    assert(parser.Parse(kSimpleBvh, &doc));
    assert(parser.error().ok());

    assert(doc.frames == 2);
    assert(float_eq(doc.frame_time, 0.033333f, 1e-6f));
    assert(doc.root.name == "Hips");
    assert(doc.root.channel_count == 6);
    assert(doc.root.HasPosition());
    assert(doc.root.HasRotation());
    assert(doc.root.children.size() == 1);

    const bvh::Joint& spine = doc.root.children[0];
    assert(spine.name == "Spine");
    assert(vec_eq(spine.offset, ozz::math::Float3(0.0f, 5.0f, 0.0f)));
    assert(!spine.HasPosition());
    assert(spine.children.empty());  // End Site adds no joint

    assert(float_eq(doc.root.channels[bvh::kXPosition].values[1], 4.0f));
    assert(float_eq(doc.root.channels[bvh::kZRotation].values[0], 10.0f));
    assert(float_eq(doc.root.channels[bvh::kXRotation].values[1], 21.0f));
    assert(float_eq(spine.channels[bvh::kYRotation].values[0], 60.0f));

    assert(bvh::FlattenJoints(doc.root).size() == 2);
    assert(bvh::CountChannels(doc.root) == 9);

    printf("PASSED\n");
}

void test_parse_channel_order() {
    printf("Test: Motion columns follow declared channel order... ");

    std::string text = replace(kSimpleBvh, "\t\tCHANNELS 3 Zrotation Xrotation Yrotation",
                               "\t\tCHANNELS 3 Xrotation Yrotation Zrotation");
    bvh::BvhParser parser;
    bvh::Document doc;
    assert(parser.Parse(text, &doc));

    const bvh::Joint& spine = doc.root.children[0];
    assert(spine.HasRotation());
    assert(spine.channel_order[0] == bvh::kXRotation);
    assert(spine.channel_order[2] == bvh::kZRotation);
    assert(float_eq(spine.channels[bvh::kXRotation].values[0], 40.0f));
    assert(float_eq(spine.channels[bvh::kYRotation].values[0], 50.0f));
    assert(float_eq(spine.channels[bvh::kZRotation].values[0], 60.0f));

    printf("PASSED\n");
}

void test_parse_case_insensitive() {
    printf("Test: Keywords are case-insensitive... ");

    std::string text = kSimpleBvh;
    text = replace(text, "HIERARCHY", "hierarchy");
    text = replace(text, "ROOT", "Root");
    text = replace(text, "End Site", "end site");
    text = replace(text, "MOTION", "motion");
    text = replace(text, "Frame Time:", "FRAME TIME:");

    bvh::BvhParser parser;
    bvh::Document doc;
    assert(parser.Parse(text, &doc));
    assert(doc.root.name == "Hips");
    assert(doc.frames == 2);

    printf("PASSED\n");
}

void test_parse_frame_count_mismatch() {
    printf("Test: Frames value must match motion lines... ");

    bvh::Document doc;

    // Fewer lines than declared
    bvh::BvhParser short_parser;
    assert(!short_parser.Parse(replace(kSimpleBvh, "Frames: 2", "Frames: 3"), &doc));
    assert(!short_parser.error().ok());

    // More lines than declared
    bvh::BvhParser long_parser;
    assert(!long_parser.Parse(replace(kSimpleBvh, "Frames: 2", "Frames: 1"), &doc));
    assert(long_parser.error().code == bvh::ErrorCode::kStructural);
    assert(contains(long_parser.error().ToString(), "end of motion data"));

    printf("PASSED\n");
}

void test_parse_oversized_counts() {
    printf("Test: Oversized counts fail without allocating... ");

    bvh::Document doc;

    bvh::BvhParser huge_frames;
    assert(!huge_frames.Parse(replace(kSimpleBvh, "Frames: 2", "Frames: 2000000000"), &doc));
    assert(huge_frames.error().code == bvh::ErrorCode::kStructural);
    assert(huge_frames.error().expected == "frame number matching the motion data");

    bvh::BvhParser overflowing_frames;
    assert(!overflowing_frames.Parse(replace(kSimpleBvh, "Frames: 2", "Frames: 99999999999"),
                                     &doc));
    assert(overflowing_frames.error().code == bvh::ErrorCode::kNumeric);
    assert(overflowing_frames.error().expected == "frame number");

    bvh::BvhParser overflowing_channels;
    assert(!overflowing_channels.Parse(replace(kSimpleBvh, "CHANNELS 3", "CHANNELS 99999999999"),
                                       &doc));
    assert(overflowing_channels.error().code == bvh::ErrorCode::kNumeric);
    assert(overflowing_channels.error().expected == "channel number");

    printf("PASSED\n");
}

void test_parse_errors() {
    printf("Test: Grammar violations are reported with position... ");

    bvh::Document doc;

    bvh::BvhParser bad_count;
    assert(!bad_count.Parse(replace(kSimpleBvh, "CHANNELS 3", "CHANNELS 7"), &doc));
    assert(bad_count.error().code == bvh::ErrorCode::kStructural);
    assert(bad_count.error().expected == "valid channel number");

    bvh::BvhParser duplicate;
    assert(!duplicate.Parse(replace(kSimpleBvh, "Zrotation Xrotation Yrotation\n\t\tEnd",
                                    "Zrotation Zrotation Yrotation\n\t\tEnd"),
                            &doc));
    assert(duplicate.error().expected == "unique channel ID");

    bvh::BvhParser bad_number;
    assert(!bad_number.Parse(replace(kSimpleBvh, "OFFSET 0.0 5.0", "OFFSET 0.0 x5.0"), &doc));
    assert(bad_number.error().code == bvh::ErrorCode::kNumeric);
    const std::string message = bad_number.error().ToString();
    assert(contains(message, "Failed to parse BVH data at position"));
    assert(contains(message, ">>>"));
    assert(contains(message, "<<<"));

    bvh::BvhParser bad_child;
    assert(!bad_child.Parse(replace(kSimpleBvh, "\t\tEnd Site", "\t\tXnd Site"), &doc));
    assert(bad_child.error().expected == "child joint");

    // The document is left untouched on failure
    assert(doc.root.name.empty());

    printf("PASSED\n");
}

void test_parse_frame_time_override() {
    printf("Test: Frame time override... ");

    bvh::ParseOptions options;
    options.override_frame_time = true;
    options.frame_time = 0.01f;
    bvh::BvhParser parser(options);
    bvh::Document doc;
    assert(parser.Parse(kSimpleBvh, &doc));
    assert(float_eq(doc.frame_time, 0.01f, 1e-6f));

    printf("PASSED\n");
}

void test_load_missing_file() {
    printf("Test: Missing file is an I/O error... ");

    bvh::BvhParser parser;
    bvh::Document doc;
    assert(!parser.Load("/tmp/bvh_tests_does_not_exist.bvh", &doc));
    assert(parser.error().code == bvh::ErrorCode::kIo);

    printf("PASSED\n");
}

// ============================================================================
// Coordinate Convention Tests
// ============================================================================

void test_wrap_angle() {
    printf("Test: Angle wrapping... ");

    assert(float_eq(bvh::coord_convert::WrapAngle(181.0f), -179.0f));
    assert(float_eq(bvh::coord_convert::WrapAngle(-181.0f), 179.0f));
    assert(float_eq(bvh::coord_convert::WrapAngle(180.0f), 180.0f));
    assert(float_eq(bvh::coord_convert::WrapAngle(-45.0f), -45.0f));

    printf("PASSED\n");
}

void test_euler_decomposition() {
    printf("Test: ZXY Euler decomposition inverts composition... ");

    const ozz::math::Float3 euler(20.0f, -35.0f, 70.0f);
    const ozz::math::Quaternion q = bvh::coord_convert::QuaternionFromEulerZXY(euler);
    const ozz::math::Float3 back = bvh::coord_convert::EulerZXYFromQuaternion(q);
    assert(vec_eq(back, euler, 0.01f));

    // Single axis rotations land on their own angle
    const ozz::math::Float3 z_only = bvh::coord_convert::EulerZXYFromQuaternion(
        make_rotation(30.0f, 0.0f, 0.0f, 1.0f));
    assert(vec_eq(z_only, ozz::math::Float3(0.0f, 0.0f, 30.0f), 0.01f));

    printf("PASSED\n");
}

void test_convention_round_trip() {
    printf("Test: Encode/decode round trip for both conventions... ");

    const ozz::math::Quaternion rotations[] = {
        make_rotation(40.0f, 1.0f, 2.0f, 3.0f),
        make_rotation(-120.0f, 0.0f, 1.0f, 0.0f),
        make_rotation(170.0f, 1.0f, 0.0f, 1.0f),
        ozz::math::Quaternion::identity(),
    };
    const Convention conventions[] = {Convention::kStandard, Convention::kBlender};

    for (Convention convention : conventions) {
        for (const ozz::math::Quaternion& q : rotations) {
            const ozz::math::Float3 euler = bvh::coord_convert::EncodeRotation(q, convention);
            assert(euler.x > -180.0f && euler.x <= 180.0f);
            const ozz::math::Quaternion back =
                bvh::coord_convert::DecodeRotation(euler, convention);
            assert(quat_eq(back, q));
        }

        const ozz::math::Float3 p(1.0f, 2.0f, 3.0f);
        assert(vec_eq(bvh::coord_convert::PositionFromBvh(
                          bvh::coord_convert::PositionToBvh(p, convention), convention),
                      p));
    }

    assert(vec_eq(bvh::coord_convert::PositionToBvh(ozz::math::Float3(1.0f, 2.0f, 3.0f),
                                                    Convention::kBlender),
                  ozz::math::Float3(-1.0f, -3.0f, 2.0f)));

    printf("PASSED\n");
}

void test_offset_scale_compensation() {
    printf("Test: Offsets are divided by the rig scale... ");

    const ozz::math::Float3 offset = bvh::coord_convert::OffsetToBvh(
        ozz::math::Float3(2.0f, 4.0f, 6.0f), ozz::math::Float3(2.0f, 2.0f, 3.0f),
        Convention::kStandard);
    assert(vec_eq(offset, ozz::math::Float3(-1.0f, 2.0f, 2.0f)));

    printf("PASSED\n");
}

// ============================================================================
// Skeleton Tree Tests
// ============================================================================

void test_find_root_bone() {
    printf("Test: Root bone is the top-most bone of the set... ");

    const bvh::Rig rig = make_rig();
    assert(bvh::FindRootBone(rig, {2, 1}) == 1);
    assert(bvh::FindRootBone(rig, {3, 0, 2}) == 0);
    assert(bvh::FindRootBone(rig, {}) == -1);

    printf("PASSED\n");
}

void test_build_skel_tree() {
    printf("Test: Skeleton tree spans intermediate joints... ");

    bvh::Rig rig = make_rig();
    rig.placement.translation = ozz::math::Float3(5.0f, 0.0f, 0.0f);

    bvh::SkelTree tree;
    bvh::Error error;
    assert(bvh::BuildSkelTree(rig, {0, 2}, -1, bvh::RenameTable(), &tree, &error));

    assert(tree.root.joint == 0);
    assert(tree.root.name == "hips");
    assert(tree.root.children.size() == 1);
    const bvh::SkelNode& spine = tree.root.children[0];
    assert(spine.joint == 1);
    assert(vec_eq(spine.rest_offset, ozz::math::Float3(0.0f, 0.5f, 0.0f)));
    assert(spine.children.size() == 1);  // arm is not part of the set
    assert(spine.children[0].name == "head");
    assert(vec_eq(tree.base_position, ozz::math::Float3(5.0f, 0.0f, 0.0f)));

    assert(!bvh::BuildSkelTree(rig, {}, -1, bvh::RenameTable(), &tree, &error));
    assert(error.code == bvh::ErrorCode::kPrecondition);

    printf("PASSED\n");
}

void test_skel_tree_renames() {
    printf("Test: Renamed bones and name collisions... ");

    const bvh::Rig rig = make_rig();
    bvh::RenameTable renames = {{"spine", "hips"}};

    bvh::SkelTree tree;
    bvh::Error error;
    assert(bvh::BuildSkelTree(rig, {0, 1, 2, 3}, -1, renames, &tree, &error));
    assert(tree.root.name == "spine");
    assert(tree.root.children[0].name == "spine_");

    printf("PASSED\n");
}

// ============================================================================
// Writer Tests
// ============================================================================

void test_writer_requires_hierarchy() {
    printf("Test: Writer calls out of order fail... ");

    bvh::BvhWriter writer;
    bvh::Error error;
    std::string text;
    assert(!writer.GenBvh(&text, &error));
    assert(error.code == bvh::ErrorCode::kPrecondition);

    bvh::PoseSnapshot pose;
    error = bvh::Error();
    assert(!writer.CaptureFrame(pose, &error));
    assert(error.code == bvh::ErrorCode::kPrecondition);

    printf("PASSED\n");
}

void test_writer_childless_root() {
    printf("Test: Childless root gets an end site... ");

    const bvh::Rig rig = make_rig();
    bvh::SkelTree tree;
    bvh::Error error;
    assert(bvh::BuildSkelTree(rig, {3}, -1, bvh::RenameTable(), &tree, &error));

    bvh::WriterSettings settings;
    settings.convention = Convention::kStandard;
    bvh::BvhWriter writer(settings);
    assert(writer.GenHierarchy(tree, &error));

    bvh::PoseSnapshot pose;
    pose.local_rotations.assign(4, ozz::math::Quaternion::identity());
    assert(writer.CaptureFrame(pose, &error));

    std::string text;
    assert(writer.GenBvh(&text, &error));

    const std::string expected =
        "HIERARCHY\n"
        "ROOT arm\n"
        "{\n"
        "\tOFFSET\t0.00\t0.00\t0.00\n"
        "\tCHANNELS 6 Xposition Yposition Zposition Zrotation Xrotation Yrotation\n"
        "\tEnd Site\n"
        "\t{\n"
        "\t\tOFFSET\t1.0\t0.0\t0.0\n"
        "\t}\n"
        "}\n"
        "MOTION\n"
        "Frames:    1\n"
        "Frame Time: 0.016666668\n"
        " 0.000000\t 0.000000\t 0.000000\t 0.000000\t 0.000000\t 0.000000\n";
    assert(text == expected);

    // And it reads back
    bvh::BvhParser parser;
    bvh::Document doc;
    assert(parser.Parse(text, &doc));
    assert(doc.root.name == "arm");
    assert(doc.frames == 1);

    printf("PASSED\n");
}

void test_writer_joint_format() {
    printf("Test: Joint blocks and low precision values... ");

    bvh::Rig rig = make_rig();
    rig.placement.scale = ozz::math::Float3(2.0f, 2.0f, 2.0f);

    bvh::SkelTree tree;
    bvh::Error error;
    assert(bvh::BuildSkelTree(rig, {0, 2}, -1, bvh::RenameTable(), &tree, &error));

    bvh::WriterSettings settings;
    settings.convention = Convention::kStandard;
    settings.precision = bvh::Precision::kLow;
    settings.frame_rate = 30.0f;
    bvh::BvhWriter writer(settings);
    assert(writer.GenHierarchy(tree, &error));

    // Offsets are written in the unscaled rig space
    const std::string& hierarchy = writer.hierarchy();
    assert(contains(hierarchy,
                    "\tJOINT spine\n"
                    "\t{\n"
                    "\t\tOFFSET\t 0.00\t 0.50\t 0.00\n"
                    "\t\tCHANNELS 3 Zrotation Xrotation Yrotation\n"
                    "\t\tJOINT head\n"));
    // Leaf end site repeats the bone offset
    assert(contains(hierarchy,
                    "\t\t\tEnd Site\n"
                    "\t\t\t{\n"
                    "\t\t\t\tOFFSET\t 0.00\t 0.30\t 0.00\n"
                    "\t\t\t}\n"
                    "\t\t}\n"
                    "\t}\n"
                    "}\n"));

    bvh::PoseSnapshot pose;
    pose.root_position = ozz::math::Float3(1.0f, 0.0f, 0.0f);
    pose.local_rotations.assign(4, ozz::math::Quaternion::identity());
    pose.local_rotations[1] = make_rotation(90.0f, 0.0f, 0.0f, 1.0f);
    assert(writer.CaptureFrame(pose, &error));
    assert(writer.frame_count() == 1);

    std::string text;
    assert(writer.GenBvh(&text, &error));
    // Standard convention mirrors X, and z rotations flip sign
    assert(contains(text, "Frame Time: 0.033333335\n"));
    assert(contains(text,
                    "-0.50\t 0.00\t 0.00\t 0.00\t 0.00\t 0.00\t-90.00\t 0.00\t 0.00\t"
                    " 0.00\t 0.00\t 0.00\n"));

    writer.ClearCapture();
    assert(writer.frame_count() == 0);
    assert(writer.GenBvh(&text, &error));
    assert(contains(text, "Frames:    0\n"));

    printf("PASSED\n");
}

// Captures two poses of the test rig, writes them and checks the result
// parses and decodes back to the same rotations
void check_round_trip(Convention convention) {
    const bvh::Rig rig = make_rig();

    bvh::SkelTree tree;
    bvh::Error error;
    assert(bvh::BuildSkelTree(rig, {0, 1, 2, 3}, -1, bvh::RenameTable(), &tree, &error));

    bvh::WriterSettings settings;
    settings.convention = convention;
    bvh::BvhWriter writer(settings);
    assert(writer.GenHierarchy(tree, &error));

    std::vector<std::vector<ozz::math::Transform>> frames;
    for (int f = 0; f < 2; ++f) {
        std::vector<ozz::math::Transform> locals = rig.rest_poses;
        const float t = static_cast<float>(f + 1);
        locals[0].translation = ozz::math::Float3(0.1f * t, 1.0f, -0.2f * t);
        locals[0].rotation = make_rotation(15.0f * t, 0.0f, 1.0f, 0.0f);
        locals[1].rotation = make_rotation(20.0f * t, 1.0f, 0.0f, 0.0f);
        locals[2].rotation = make_rotation(-30.0f, 1.0f, 1.0f, 0.0f);
        locals[3].rotation = make_rotation(45.0f * t, 0.2f, 0.3f, 1.0f);
        frames.push_back(locals);

        bvh::PoseSnapshot pose;
        assert(bvh::CapturePose(rig, locals, tree.root.joint, &pose, &error));
        assert(writer.CaptureFrame(pose, &error));
    }

    std::string text;
    assert(writer.GenBvh(&text, &error));

    bvh::BvhParser parser;
    bvh::Document doc;
    assert(parser.Parse(text, &doc));
    assert(doc.frames == 2);
    assert(float_eq(doc.frame_time, 1.0f / 60.0f, 1e-6f));

    const std::vector<const bvh::Joint*> joints = bvh::FlattenJoints(doc.root);
    assert(joints.size() == 4);
    assert(joints[0]->name == "hips");
    assert(joints[1]->name == "spine");
    assert(joints[2]->name == "head");
    assert(joints[3]->name == "arm");
    assert(joints[0]->channel_count == 6);
    assert(joints[3]->channel_count == 3);
    assert(vec_eq(joints[3]->offset, bvh::coord_convert::OffsetToBvh(
                                         rig.rest_poses[3].translation,
                                         ozz::math::Float3::one(), convention)));

    bvh::BoneResolver resolver;
    bvh::DecodeSettings decode_settings;
    decode_settings.convention = convention;
    bvh::CurveDecoder decoder(rig, resolver, decode_settings);
    bvh::RawAnimationCurves curves(rig.num_joints());
    assert(decoder.Decode(doc, &curves, &error));
    assert(decoder.root_joint() == 0);

    for (int joint = 0; joint < rig.num_joints(); ++joint) {
        assert(curves.HasCurve(joint, bvh::CurveProperty::kRotationW));
        assert(curves.HasCurve(joint, bvh::CurveProperty::kPositionX) == (joint == 0));
        for (int f = 0; f < 2; ++f) {
            const ozz::math::Quaternion decoded(
                curves.GetCurve(joint, bvh::CurveProperty::kRotationX)[f].value,
                curves.GetCurve(joint, bvh::CurveProperty::kRotationY)[f].value,
                curves.GetCurve(joint, bvh::CurveProperty::kRotationZ)[f].value,
                curves.GetCurve(joint, bvh::CurveProperty::kRotationW)[f].value);
            assert(quat_eq(decoded, frames[f][joint].rotation));
        }
    }

    for (int f = 0; f < 2; ++f) {
        const ozz::math::Float3 position(
            curves.GetCurve(0, bvh::CurveProperty::kPositionX)[f].value,
            curves.GetCurve(0, bvh::CurveProperty::kPositionY)[f].value,
            curves.GetCurve(0, bvh::CurveProperty::kPositionZ)[f].value);
        assert(vec_eq(position, frames[f][0].translation));
        assert(float_eq(curves.GetCurve(0, bvh::CurveProperty::kPositionX)[f].time,
                        static_cast<float>(f) * doc.frame_time, 1e-6f));
    }
}

void test_round_trip_standard() {
    printf("Test: Write/parse/decode round trip (standard)... ");
    check_round_trip(Convention::kStandard);
    printf("PASSED\n");
}

void test_round_trip_blender() {
    printf("Test: Write/parse/decode round trip (Blender)... ");
    check_round_trip(Convention::kBlender);
    printf("PASSED\n");
}

// ============================================================================
// Curve Decoder Tests
// ============================================================================

// Same layout as kSimpleBvh, bound to a rig named after its joints
bvh::Rig make_simple_rig(const char* spine_name) {
    bvh::Rig rig;
    rig.names = {"Hips", spine_name};
    rig.parents = {-1, 0};
    rig.rest_poses = {
        make_transform(ozz::math::Float3::zero()),
        make_transform(ozz::math::Float3(0.0f, 5.0f, 0.0f)),
    };
    return rig;
}

void test_decode_name_resolution() {
    printf("Test: Unknown joint names fail to decode... ");

    bvh::BvhParser parser;
    bvh::Document doc;
    assert(parser.Parse(kSimpleBvh, &doc));

    const bvh::Rig rig = make_simple_rig("Chest");
    bvh::BoneResolver resolver;
    bvh::CurveDecoder decoder(rig, resolver, bvh::DecodeSettings());
    bvh::RawAnimationCurves curves(rig.num_joints());
    bvh::Error error;
    assert(!decoder.Decode(doc, &curves, &error));
    assert(error.code == bvh::ErrorCode::kNameResolution);
    assert(contains(error.ToString(), "Could not find bone \"Spine\" under bone \"Hips\""));

    // A rename table fixes it
    bvh::BoneResolver renaming;
    renaming.SetRenameTable({{"Spine", "Chest"}});
    bvh::CurveDecoder renamed(rig, renaming, bvh::DecodeSettings());
    bvh::RawAnimationCurves renamed_curves(rig.num_joints());
    assert(renamed.Decode(doc, &renamed_curves, &error));
    assert(renamed_curves.HasCurve(1, bvh::CurveProperty::kRotationX));

    printf("PASSED\n");
}

void test_decode_flexible_names() {
    printf("Test: Flexible name matching... ");

    bvh::BoneResolver resolver;
    assert(resolver.Normalize("Left_Up Leg") == "leftupleg");

    const bvh::Rig rig = make_simple_rig("spine");
    assert(resolver.FindChild(rig, "SPINE", 0, false) == 1);
    assert(resolver.FindChild(rig, "hips", 0, false) == -1);
    assert(resolver.FindChild(rig, "hips", 0, true) == 0);
    assert(resolver.FindRoot(rig, "Spine") == 1);

    resolver.SetFlexibleNames(false);
    assert(resolver.FindChild(rig, "SPINE", 0, false) == -1);
    assert(resolver.FindRoot(rig, "spine") == 1);

    printf("PASSED\n");
}

void test_decode_skips_partial_and_non_root_channels() {
    printf("Test: Partial and non-root position channels are skipped... ");

    std::string text = replace(kSimpleBvh, "\t\tCHANNELS 3 Zrotation Xrotation Yrotation",
                               "\t\tCHANNELS 5 Xposition Yposition Zposition "
                               "Zrotation Xrotation");
    text = replace(text, "40.0 50.0 60.0", "1.0 1.0 1.0 40.0 50.0");
    text = replace(text, "41.0 51.0 61.0", "1.0 1.0 1.0 41.0 51.0");

    bvh::BvhParser parser;
    bvh::Document doc;
    assert(parser.Parse(text, &doc));

    const bvh::Rig rig = make_simple_rig("Spine");
    bvh::BoneResolver resolver;
    bvh::CurveDecoder decoder(rig, resolver, bvh::DecodeSettings());
    bvh::RawAnimationCurves curves(rig.num_joints());
    bvh::Error error;
    assert(decoder.Decode(doc, &curves, &error));

    assert(curves.HasCurve(0, bvh::CurveProperty::kPositionX));
    assert(curves.HasCurve(0, bvh::CurveProperty::kRotationW));
    assert(!curves.HasCurve(1, bvh::CurveProperty::kPositionX));
    assert(!curves.HasCurve(1, bvh::CurveProperty::kRotationX));

    printf("PASSED\n");
}

void test_decode_root_fallback() {
    printf("Test: Unmatched root falls back to the top-most joint... ");

    std::string text = replace(kSimpleBvh, "ROOT Hips", "ROOT Pelvis");
    bvh::BvhParser parser;
    bvh::Document doc;
    assert(parser.Parse(text, &doc));

    // The fallback joint must still match by name
    const bvh::Rig rig = make_simple_rig("Spine");
    bvh::BoneResolver resolver;
    bvh::CurveDecoder decoder(rig, resolver, bvh::DecodeSettings());
    bvh::RawAnimationCurves curves(rig.num_joints());
    bvh::Error error;
    assert(!decoder.Decode(doc, &curves, &error));
    assert(error.code == bvh::ErrorCode::kNameResolution);

    bvh::BoneResolver renaming;
    renaming.SetRenameTable({{"Pelvis", "Hips"}});
    bvh::CurveDecoder renamed(rig, renaming, bvh::DecodeSettings());
    assert(renamed.Decode(doc, &curves, &error));
    assert(renamed.root_joint() == 0);

    printf("PASSED\n");
}

// ============================================================================
// Engine Binding Tests
// ============================================================================

void test_build_raw_skeleton() {
    printf("Test: BVH hierarchy to raw skeleton... ");

    bvh::BvhParser parser;
    bvh::Document doc;
    assert(parser.Parse(kSimpleBvh, &doc));

    ozz::animation::offline::RawSkeleton skeleton;
    bvh::Error error;
    assert(bvh::BuildRawSkeleton(doc, Convention::kBlender, &skeleton, &error));
    assert(skeleton.num_joints() == 2);
    assert(skeleton.roots.size() == 1);
    assert(std::string(skeleton.roots[0].name.c_str()) == "Hips");

    const ozz::math::Transform& spine = skeleton.roots[0].children[0].transform;
    // Blender files are Z up: BVH (0, 5, 0) is engine (0, 0, -5)
    assert(vec_eq(spine.translation, ozz::math::Float3(0.0f, 0.0f, -5.0f)));
    assert(quat_eq(spine.rotation, ozz::math::Quaternion::identity()));

    bvh::Document empty;
    assert(!bvh::BuildRawSkeleton(empty, Convention::kBlender, &skeleton, &error));
    assert(error.code == bvh::ErrorCode::kPrecondition);

    printf("PASSED\n");
}

void test_build_raw_animation() {
    printf("Test: Curves to raw animation... ");

    const bvh::Rig rig = make_simple_rig("Spine");
    bvh::RawAnimationCurves curves(rig.num_joints());

    // Second key is the first rotation with its sign flipped
    const ozz::math::Quaternion q = make_rotation(30.0f, 0.0f, 1.0f, 0.0f);
    curves.SetCurve(1, bvh::CurveProperty::kRotationX, {{0.0f, q.x}, {1.0f, -q.x}});
    curves.SetCurve(1, bvh::CurveProperty::kRotationY, {{0.0f, q.y}, {1.0f, -q.y}});
    curves.SetCurve(1, bvh::CurveProperty::kRotationZ, {{0.0f, q.z}, {1.0f, -q.z}});
    curves.SetCurve(1, bvh::CurveProperty::kRotationW, {{0.0f, q.w}, {1.0f, -q.w}});

    ozz::animation::offline::RawAnimation animation;
    bvh::Error error;
    assert(curves.Build(rig, 1.0f, "clip", &animation, &error));
    assert(animation.Validate());
    assert(animation.tracks.size() == 2);

    // Un-animated joint holds its rest pose
    assert(animation.tracks[0].translations.size() == 1);
    assert(animation.tracks[0].rotations.size() == 1);

    const auto& rotations = animation.tracks[1].rotations;
    assert(rotations.size() == 2);
    assert(bvh::quat::Dot(rotations[0].value, rotations[1].value) > 0.0f);
    assert(vec_eq(animation.tracks[1].translations[0].value,
                  ozz::math::Float3(0.0f, 5.0f, 0.0f)));

    assert(!curves.Build(rig, 0.0f, "clip", &animation, &error));
    assert(error.code == bvh::ErrorCode::kPrecondition);

    printf("PASSED\n");
}

void test_load_rename_table() {
    printf("Test: Load rename table from JSON... ");

    const char* config_content = R"({
        "renames": [
            {"bvh": "Hips", "target": "pelvis"},
            {"bvh": "Spine", "target": ""},
            {"bvh": "LeftArm", "target": "upperarm_l"}
        ]
    })";

    std::string config_path = "/tmp/test_bvh_renames.json";
    {
        std::ofstream file(config_path);
        file << config_content;
    }

    bvh::RenameTable table;
    bvh::Error error;
    assert(bvh::LoadRenameTable(config_path, &table, &error));
    assert(table.size() == 2);
    assert(table[0].bvh_name == "Hips");
    assert(table[0].target_name == "pelvis");
    assert(table[1].target_name == "upperarm_l");

    std::string bad_path = "/tmp/test_bvh_renames_bad.json";
    {
        std::ofstream file(bad_path);
        file << R"({"mappings": []})";
    }
    assert(!bvh::LoadRenameTable(bad_path, &table, &error));
    assert(error.code == bvh::ErrorCode::kIo);

    error = bvh::Error();
    assert(!bvh::LoadRenameTable("/tmp/test_bvh_renames_missing.json", &table, &error));
    assert(error.code == bvh::ErrorCode::kIo);

    printf("PASSED\n");
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    printf("=== BVH Unit Tests ===\n\n");

    printf("--- Scanner Tests ---\n");
    test_read_float();
    test_read_float_long_fraction();
    test_read_int();
    test_expect_literal_rewinds();
    test_read_channel();

    printf("\n--- Parser Tests ---\n");
    test_parse_simple();
    test_parse_channel_order();
    test_parse_case_insensitive();
    test_parse_frame_count_mismatch();
    test_parse_oversized_counts();
    test_parse_errors();
    test_parse_frame_time_override();
    test_load_missing_file();

    printf("\n--- Coordinate Convention Tests ---\n");
    test_wrap_angle();
    test_euler_decomposition();
    test_convention_round_trip();
    test_offset_scale_compensation();

    printf("\n--- Skeleton Tree Tests ---\n");
    test_find_root_bone();
    test_build_skel_tree();
    test_skel_tree_renames();

    printf("\n--- Writer Tests ---\n");
    test_writer_requires_hierarchy();
    test_writer_childless_root();
    test_writer_joint_format();
    test_round_trip_standard();
    test_round_trip_blender();

    printf("\n--- Curve Decoder Tests ---\n");
    test_decode_name_resolution();
    test_decode_flexible_names();
    test_decode_skips_partial_and_non_root_channels();
    test_decode_root_fallback();

    printf("\n--- Engine Binding Tests ---\n");
    test_build_raw_skeleton();
    test_build_raw_animation();
    test_load_rename_table();

    printf("\n=== All Tests Complete ===\n");
    return 0;
}
