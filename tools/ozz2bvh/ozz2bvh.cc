// ozz2bvh - Export ozz skeletons and animations as BVH motion capture files
// Samples the animation at a fixed rate and writes one motion line per sample

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ozz/animation/runtime/animation.h"
#include "ozz/animation/runtime/sampling_job.h"
#include "ozz/animation/runtime/skeleton.h"
#include "ozz/base/io/archive.h"
#include "ozz/base/io/stream.h"
#include "ozz/base/log.h"
#include "ozz/base/maths/soa_transform.h"
#include "ozz/base/span.h"

#include "bone_resolver.h"
#include "bvh_writer.h"
#include "rig.h"
#include "skel_tree.h"

namespace {

// Load a skeleton from ozz file
bool LoadSkeleton(const std::string& path, ozz::animation::Skeleton* skeleton) {
    ozz::io::File file(path.c_str(), "rb");
    if (!file.opened()) {
        ozz::log::Err() << "Failed to open skeleton file: " << path << std::endl;
        return false;
    }

    ozz::io::IArchive archive(&file);
    if (!archive.TestTag<ozz::animation::Skeleton>()) {
        ozz::log::Err() << "Invalid skeleton file: " << path << std::endl;
        return false;
    }

    archive >> *skeleton;
    return true;
}

// Load an animation from ozz file
bool LoadAnimation(const std::string& path, ozz::animation::Animation* animation) {
    ozz::io::File file(path.c_str(), "rb");
    if (!file.opened()) {
        ozz::log::Err() << "Failed to open animation file: " << path << std::endl;
        return false;
    }

    ozz::io::IArchive archive(&file);
    if (!archive.TestTag<ozz::animation::Animation>()) {
        ozz::log::Err() << "Invalid animation file: " << path << std::endl;
        return false;
    }

    archive >> *animation;
    return true;
}

bool SaveText(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ozz::log::Err() << "Failed to create output file: " << path << std::endl;
        return false;
    }
    file << text;
    if (!file.good()) {
        ozz::log::Err() << "Failed to write output file: " << path << std::endl;
        return false;
    }
    return true;
}

// Comma separated joint names to indices, all joints when empty
bool ResolveBones(const bvh::Rig& rig, const std::string& list, std::vector<int>* bones) {
    bones->clear();
    if (list.empty()) {
        for (int i = 0; i < rig.num_joints(); ++i) {
            bones->push_back(i);
        }
        return true;
    }

    std::stringstream stream(list);
    std::string name;
    while (std::getline(stream, name, ',')) {
        if (name.empty()) {
            continue;
        }
        const int joint = rig.FindJoint(name);
        if (joint < 0) {
            ozz::log::Err() << "Unknown bone: " << name << std::endl;
            return false;
        }
        bones->push_back(joint);
    }
    return !bones->empty();
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --skeleton=FILE     Skeleton file (.ozz)\n"
              << "  --animation=FILE    Animation file (.ozz), rest pose only when omitted\n"
              << "  --output=FILE       Output motion file (.bvh)\n"
              << "  --frame-rate=N      Samples per second (default: 60)\n"
              << "  --root=NAME         Root bone, defaults to the top-most exported bone\n"
              << "  --bones=A,B,...     Bones to export (default: all)\n"
              << "  --rename=FILE       JSON table of exported bone names (.json)\n"
              << "  --blender           Z up, Y forward output for Blender\n"
              << "  --low-precision     Two decimals instead of six\n"
              << "  --help              Show this help message\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string skeleton_path;
    std::string animation_path;
    std::string output_path;
    std::string root_name;
    std::string bones_list;
    std::string rename_path;
    bvh::WriterSettings settings;
    settings.convention = bvh::coord_convert::Convention::kStandard;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg.rfind("--skeleton=", 0) == 0) {
            skeleton_path = arg.substr(11);
        } else if (arg.rfind("--animation=", 0) == 0) {
            animation_path = arg.substr(12);
        } else if (arg.rfind("--output=", 0) == 0) {
            output_path = arg.substr(9);
        } else if (arg.rfind("--frame-rate=", 0) == 0) {
            char* end = nullptr;
            const std::string value = arg.substr(13);
            settings.frame_rate = std::strtof(value.c_str(), &end);
            if (end == value.c_str() || *end != '\0' || !(settings.frame_rate > 0.0f)) {
                ozz::log::Err() << "Invalid frame rate: " << value << std::endl;
                return 1;
            }
        } else if (arg.rfind("--root=", 0) == 0) {
            root_name = arg.substr(7);
        } else if (arg.rfind("--bones=", 0) == 0) {
            bones_list = arg.substr(8);
        } else if (arg.rfind("--rename=", 0) == 0) {
            rename_path = arg.substr(9);
        } else if (arg == "--blender") {
            settings.convention = bvh::coord_convert::Convention::kBlender;
        } else if (arg == "--low-precision") {
            settings.precision = bvh::Precision::kLow;
        } else {
            ozz::log::Err() << "Unknown option: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 1;
        }
    }

    // Validate required arguments
    if (skeleton_path.empty() || output_path.empty()) {
        ozz::log::Err() << "Missing required arguments." << std::endl;
        PrintUsage(argv[0]);
        return 1;
    }

    ozz::animation::Skeleton skeleton;
    if (!LoadSkeleton(skeleton_path, &skeleton)) {
        return 1;
    }
    ozz::log::Log() << "Loaded skeleton: " << skeleton.num_joints() << " joints" << std::endl;

    const bvh::Rig rig = bvh::RigFromSkeleton(skeleton);

    std::vector<int> bones;
    if (!ResolveBones(rig, bones_list, &bones)) {
        ozz::log::Err() << "No bones to export." << std::endl;
        return 1;
    }

    int root = -1;
    if (!root_name.empty()) {
        root = rig.FindJoint(root_name);
        if (root < 0) {
            ozz::log::Err() << "Root bone not found: " << root_name << std::endl;
            return 1;
        }
    }

    bvh::Error error;
    bvh::RenameTable renames;
    if (!rename_path.empty() && !bvh::LoadRenameTable(rename_path, &renames, &error)) {
        ozz::log::Err() << error.ToString() << std::endl;
        return 1;
    }

    bvh::SkelTree tree;
    if (!bvh::BuildSkelTree(rig, bones, root, renames, &tree, &error)) {
        ozz::log::Err() << error.ToString() << std::endl;
        return 1;
    }
    ozz::log::LogV() << "Root bone: " << rig.names[tree.root.joint] << std::endl;

    bvh::BvhWriter writer(settings);
    if (!writer.GenHierarchy(tree, &error)) {
        ozz::log::Err() << error.ToString() << std::endl;
        return 1;
    }

    bvh::PoseSnapshot pose;
    if (animation_path.empty()) {
        // Rest pose only
        if (!bvh::CapturePose(rig, rig.rest_poses, tree.root.joint, &pose, &error) ||
            !writer.CaptureFrame(pose, &error)) {
            ozz::log::Err() << error.ToString() << std::endl;
            return 1;
        }
    } else {
        ozz::animation::Animation animation;
        if (!LoadAnimation(animation_path, &animation)) {
            return 1;
        }
        if (animation.num_tracks() != skeleton.num_joints()) {
            ozz::log::Err() << "Animation has " << animation.num_tracks()
                            << " tracks, skeleton has " << skeleton.num_joints()
                            << " joints." << std::endl;
            return 1;
        }
        ozz::log::Log() << "Loaded animation: " << animation.duration() << "s, "
                        << animation.num_tracks() << " tracks" << std::endl;

        ozz::animation::SamplingJob::Context context;
        context.Resize(skeleton.num_joints());
        std::vector<ozz::math::SoaTransform> locals(skeleton.num_soa_joints());

        const float duration = animation.duration();
        const int num_frames = static_cast<int>(duration * settings.frame_rate) + 1;

        for (int frame = 0; frame < num_frames; ++frame) {
            const float time = std::min(duration, static_cast<float>(frame) / settings.frame_rate);

            ozz::animation::SamplingJob sampling_job;
            sampling_job.animation = &animation;
            sampling_job.context = &context;
            sampling_job.ratio = duration > 0.0f ? time / duration : 0.0f;
            sampling_job.output = ozz::make_span(locals);
            if (!sampling_job.Run()) {
                ozz::log::Err() << "Sampling failed at frame " << frame << std::endl;
                return 1;
            }

            const std::vector<ozz::math::Transform> pose_locals =
                bvh::ExtractLocals(
                    ozz::span<const ozz::math::SoaTransform>(locals.data(), locals.size()),
                    skeleton.num_joints());
            if (!bvh::CapturePose(rig, pose_locals, tree.root.joint, &pose, &error) ||
                !writer.CaptureFrame(pose, &error)) {
                ozz::log::Err() << error.ToString() << std::endl;
                return 1;
            }
        }
    }

    std::string text;
    if (!writer.GenBvh(&text, &error)) {
        ozz::log::Err() << error.ToString() << std::endl;
        return 1;
    }
    if (!SaveText(output_path, text)) {
        return 1;
    }

    ozz::log::Log() << "Wrote " << writer.frame_count() << " frames to " << output_path
                    << std::endl;
    return 0;
}
