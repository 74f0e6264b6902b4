// bone_resolver.cc - Implementation of BVH joint name matching
#include "bone_resolver.h"

#include <cctype>
#include <deque>
#include <fstream>

#include <nlohmann/json.hpp>

#include "ozz/base/log.h"

using json = nlohmann::json;

namespace bvh {

bool LoadRenameTable(const std::string& path, RenameTable* table, Error* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Fail(error, ErrorCode::kIo, "failed to open rename table: " + path);
    }

    json config;
    try {
        file >> config;
    } catch (const json::parse_error& e) {
        return Fail(error, ErrorCode::kIo,
                    "JSON parse error in " + path + ": " + e.what());
    }

    if (!config.contains("renames") || !config["renames"].is_array()) {
        return Fail(error, ErrorCode::kIo, "rename table must contain a 'renames' array");
    }

    table->clear();
    for (const auto& entry : config["renames"]) {
        if (!entry.is_object()) {
            ozz::log::Err() << "Ignoring non-object entry in " << path << std::endl;
            continue;
        }
        BoneRename rename;
        if (entry.contains("bvh") && entry["bvh"].is_string()) {
            rename.bvh_name = entry["bvh"].get<std::string>();
        }
        if (entry.contains("target") && entry["target"].is_string()) {
            rename.target_name = entry["target"].get<std::string>();
        }
        if (rename.bvh_name.empty() || rename.target_name.empty()) {
            continue;
        }
        table->push_back(rename);
    }

    ozz::log::LogV() << "Loaded " << table->size() << " bone renames from "
                     << path << std::endl;
    return true;
}

std::string BoneResolver::Normalize(const std::string& name) const {
    if (!m_flexible) {
        return name;
    }
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (c == ' ' || c == '_') {
            continue;
        }
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string BoneResolver::TargetName(const std::string& bvh_name) const {
    const std::string name = Normalize(bvh_name);
    for (const auto& rename : m_renames) {
        if (Normalize(rename.bvh_name) == name) {
            return Normalize(rename.target_name);
        }
    }
    return name;
}

int BoneResolver::FindRoot(const Rig& rig, const std::string& bvh_name) const {
    const std::string target = TargetName(bvh_name);

    std::deque<int> queue;
    for (int i = 0; i < rig.num_joints(); ++i) {
        if (rig.parents[i] < 0) {
            queue.push_back(i);
        }
    }
    while (!queue.empty()) {
        const int joint = queue.front();
        queue.pop_front();
        if (Normalize(rig.names[joint]) == target) {
            return joint;
        }
        for (int child : rig.Children(joint)) {
            queue.push_back(child);
        }
    }
    return -1;
}

int BoneResolver::FindChild(const Rig& rig, const std::string& bvh_name, int parent,
                            bool include_self) const {
    const std::string target = TargetName(bvh_name);

    if (include_self && Normalize(rig.names[parent]) == target) {
        return parent;
    }
    for (int child : rig.Children(parent)) {
        if (Normalize(rig.names[child]) == target) {
            return child;
        }
    }
    return -1;
}

}  // namespace bvh
