#include "lfs/hierarchy/entities.hpp"

#include <unordered_map>

namespace lfs::hierarchy {

std::vector<DriveEntity> latest_revisions(const std::vector<DriveEntity>& entities) {
    std::vector<DriveEntity> latest;
    std::unordered_map<std::string, std::size_t> position;

    for (const auto& entity : entities) {
        const auto it = position.find(entity.entity_id);
        if (it == position.end()) {
            position.emplace(entity.entity_id, latest.size());
            latest.push_back(entity);
        } else if (entity.unix_time > latest[it->second].unix_time) {
            latest[it->second] = entity;
        }
    }
    return latest;
}

std::vector<FolderNode> folder_nodes_of(const std::vector<DriveEntity>& entities) {
    std::vector<FolderNode> nodes;
    for (const auto& entity : entities) {
        if (entity.entity_type != EntityType::Folder) {
            continue;
        }
        FolderNode node;
        node.id = entity.entity_id;
        if (!entity.parent_folder_id.empty()) {
            node.parent_id = entity.parent_folder_id;
        }
        node.name = entity.name;
        nodes.push_back(std::move(node));
    }
    return nodes;
}

NameConflictInfo name_conflict_info(const std::vector<DriveEntity>& children) {
    NameConflictInfo info;
    for (const auto& child : children) {
        if (child.entity_type == EntityType::File) {
            info.files.push_back({child.entity_id, child.name, child.last_modified_date});
        } else {
            info.folders.push_back({child.entity_id, child.name});
        }
    }
    return info;
}

} // namespace lfs::hierarchy
