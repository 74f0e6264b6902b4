// bvh2ozz - Convert BVH motion capture files to ozz-animation format
// Uses ozz's OzzImporter framework for integration with CLI and config system

#include <string>

#include "ozz/animation/offline/raw_animation.h"
#include "ozz/animation/offline/raw_skeleton.h"
#include "ozz/animation/offline/raw_track.h"
#include "ozz/animation/offline/tools/import2ozz.h"
#include "ozz/animation/runtime/skeleton.h"
#include "ozz/base/containers/string.h"
#include "ozz/base/log.h"
#include "ozz/options/options.h"

#include "animation_curves.h"
#include "bone_resolver.h"
#include "bvh_parser.h"
#include "bvh_skeleton.h"
#include "coordinate_convert.h"
#include "curve_decoder.h"
#include "rig.h"

OZZ_OPTIONS_DECLARE_BOOL(blender,
                         "File uses Z as up axis and Y as forward axis (Blender export)",
                         true, false);

OZZ_OPTIONS_DECLARE_BOOL(respect_bvh_time,
                         "Use the file's Frame Time instead of --frame_rate", true, false);

OZZ_OPTIONS_DECLARE_FLOAT(frame_rate,
                          "Frame rate used when --respect_bvh_time is disabled", 60.0f, false);

OZZ_OPTIONS_DECLARE_BOOL(flexible_names,
                         "Ignore case, spaces and underscores when matching bone names",
                         true, false);

OZZ_OPTIONS_DECLARE_STRING(rename, "JSON table mapping BVH joint names to skeleton joint names",
                           "", false);

OZZ_OPTIONS_DECLARE_STRING(clip_name, "Animation name, defaults to the file name", "", false);

namespace {

// File name without directory and extension
std::string ClipNameFromPath(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    const size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    return name.empty() ? "BVHClip" : name;
}

class BvhImporter : public ozz::animation::offline::OzzImporter {
 public:
    BvhImporter() {}

 private:
    bvh::coord_convert::Convention GetConvention() const {
        const bool blender = OPTIONS_blender;
        return blender ? bvh::coord_convert::Convention::kBlender
                       : bvh::coord_convert::Convention::kStandard;
    }

    // Parse the whole file up front; animation import only reads the document
    bool Load(const char* _filename) override {
        ozz::log::Log() << "Loading BVH file: " << _filename << std::endl;

        bvh::ParseOptions options;
        const bool respect_bvh_time = OPTIONS_respect_bvh_time;
        const float frame_rate = OPTIONS_frame_rate;
        if (!respect_bvh_time) {
            if (!(frame_rate > 0.0f)) {
                ozz::log::Err() << "Frame rate must be positive." << std::endl;
                return false;
            }
            options.override_frame_time = true;
            options.frame_time = 1.0f / frame_rate;
        }

        bvh::BvhParser parser(options);
        if (!parser.Load(_filename, &m_document)) {
            ozz::log::Err() << parser.error().ToString() << std::endl;
            return false;
        }

        const std::string rename_path = OPTIONS_rename.value();
        if (!rename_path.empty()) {
            bvh::Error error;
            if (!bvh::LoadRenameTable(rename_path, &m_renames, &error)) {
                ozz::log::Err() << error.ToString() << std::endl;
                return false;
            }
        }

        const std::string clip_name = OPTIONS_clip_name.value();
        m_clip_name = clip_name.empty() ? ClipNameFromPath(_filename) : clip_name;

        ozz::log::Log() << "Parsed " << bvh::FlattenJoints(m_document.root).size()
                        << " joints, " << m_document.frames << " frames at "
                        << m_document.frame_time << "s per frame." << std::endl;
        return true;
    }

    bool Import(ozz::animation::offline::RawSkeleton* _skeleton,
                const NodeType& _types) override {
        (void)_types;  // BVH has a single node type

        bvh::Error error;
        if (!bvh::BuildRawSkeleton(m_document, GetConvention(), _skeleton, &error)) {
            ozz::log::Err() << error.ToString() << std::endl;
            return false;
        }

        ozz::log::Log() << "Skeleton import complete: "
                        << _skeleton->num_joints() << " joints." << std::endl;
        return true;
    }

    // A BVH file holds exactly one clip
    AnimationNames GetAnimationNames() override {
        AnimationNames names;
        if (m_document.frames > 0) {
            names.push_back(ozz::string(m_clip_name.c_str()));
        }
        return names;
    }

    bool Import(const char* _animation_name,
                const ozz::animation::Skeleton& _skeleton,
                float _sampling_rate,
                ozz::animation::offline::RawAnimation* _animation) override {
        (void)_sampling_rate;  // Keys are taken at the file's frame times

        if (m_clip_name != _animation_name) {
            ozz::log::Err() << "Animation '" << _animation_name << "' not found." << std::endl;
            return false;
        }

        ozz::log::Log() << "Importing animation '" << _animation_name << "' ("
                        << m_document.frames << " frames @ "
                        << 1.0f / m_document.frame_time << " fps)..." << std::endl;

        const bvh::Rig rig = bvh::RigFromSkeleton(_skeleton);

        bvh::BoneResolver resolver;
        resolver.SetFlexibleNames(OPTIONS_flexible_names);
        resolver.SetRenameTable(m_renames);

        bvh::DecodeSettings settings;
        settings.convention = GetConvention();

        bvh::RawAnimationCurves curves(rig.num_joints());
        bvh::CurveDecoder decoder(rig, resolver, settings);
        bvh::Error error;
        if (!decoder.Decode(m_document, &curves, &error)) {
            ozz::log::Err() << error.ToString() << std::endl;
            return false;
        }

        // ozz requires duration > 0, so single-frame clips last one frame
        const float duration = m_document.frames > 1
                                   ? static_cast<float>(m_document.frames - 1) * m_document.frame_time
                                   : m_document.frame_time;

        if (!curves.Build(rig, duration, _animation_name, _animation, &error)) {
            ozz::log::Err() << error.ToString() << std::endl;
            return false;
        }

        ozz::log::Log() << "Animation import complete: " << _animation->duration
                        << " seconds, " << m_document.frames << " frames." << std::endl;
        return true;
    }

    // Track/property import - not supported for BVH
    NodeProperties GetNodeProperties(const char* _node_name) override {
        (void)_node_name;
        return NodeProperties();
    }

    bool Import(const char* _animation_name, const char* _node_name,
                const char* _track_name, NodeProperty::Type _track_type,
                float _sampling_rate,
                ozz::animation::offline::RawFloatTrack* _track) override {
        (void)_animation_name; (void)_node_name; (void)_track_name;
        (void)_track_type; (void)_sampling_rate; (void)_track;
        return false;
    }

    bool Import(const char* _animation_name, const char* _node_name,
                const char* _track_name, NodeProperty::Type _track_type,
                float _sampling_rate,
                ozz::animation::offline::RawFloat2Track* _track) override {
        (void)_animation_name; (void)_node_name; (void)_track_name;
        (void)_track_type; (void)_sampling_rate; (void)_track;
        return false;
    }

    bool Import(const char* _animation_name, const char* _node_name,
                const char* _track_name, NodeProperty::Type _track_type,
                float _sampling_rate,
                ozz::animation::offline::RawFloat3Track* _track) override {
        (void)_animation_name; (void)_node_name; (void)_track_name;
        (void)_track_type; (void)_sampling_rate; (void)_track;
        return false;
    }

    bool Import(const char* _animation_name, const char* _node_name,
                const char* _track_name, NodeProperty::Type _track_type,
                float _sampling_rate,
                ozz::animation::offline::RawFloat4Track* _track) override {
        (void)_animation_name; (void)_node_name; (void)_track_name;
        (void)_track_type; (void)_sampling_rate; (void)_track;
        return false;
    }

    bvh::Document m_document;
    bvh::RenameTable m_renames;
    std::string m_clip_name;
};

}  // namespace

int main(int _argc, const char** _argv) {
    BvhImporter importer;
    return importer(_argc, _argv);
}
