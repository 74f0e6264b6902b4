// bone_resolver.h - Matching BVH joint names to rig joints
#pragma once

#include <string>
#include <vector>

#include "bvh_error.h"
#include "rig.h"

namespace bvh {

// Single entry of a rename table: name used in BVH files <-> rig joint name
struct BoneRename {
    std::string bvh_name;
    std::string target_name;
};

typedef std::vector<BoneRename> RenameTable;

// Load a rename table from JSON:
//   {"renames": [{"bvh": "Hips", "target": "pelvis"}, ...]}
// Entries with an empty or missing side are skipped.
bool LoadRenameTable(const std::string& path, RenameTable* table, Error* error);

class BoneResolver {
public:
    BoneResolver() = default;

    void SetRenameTable(const RenameTable& table) { m_renames = table; }
    const RenameTable& GetRenameTable() const { return m_renames; }

    // When enabled, spaces and underscores are ignored and case is folded
    void SetFlexibleNames(bool flexible) { m_flexible = flexible; }
    bool flexible_names() const { return m_flexible; }

    // Name as used for comparisons
    std::string Normalize(const std::string& name) const;

    // Breadth-first search over the whole rig for the BVH root joint.
    // Returns -1 if no joint matches.
    int FindRoot(const Rig& rig, const std::string& bvh_name) const;

    // Search the direct children of `parent`, and `parent` itself when
    // include_self is set. Returns -1 if no joint matches.
    int FindChild(const Rig& rig, const std::string& bvh_name, int parent,
                  bool include_self) const;

private:
    // Normalized target name for a BVH name after renaming
    std::string TargetName(const std::string& bvh_name) const;

    bool m_flexible = true;
    RenameTable m_renames;
};

}  // namespace bvh
