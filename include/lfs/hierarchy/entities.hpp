#pragma once

#include "lfs/hierarchy/folder_hierarchy.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lfs::hierarchy {

enum class EntityType {
    File,
    Folder
};

/**
 * @brief One revision of a file or folder as read back from the index
 *
 * Every rename or move of an entity is a new transaction carrying the same
 * entity_id; unix_time orders the revisions.
 */
struct DriveEntity {
    std::string entity_id;
    EntityType entity_type = EntityType::File;
    std::string parent_folder_id;  ///< Empty for a drive's root folder
    std::string name;
    std::int64_t unix_time = 0;
    std::string tx_id;
    std::int64_t last_modified_date = 0;  ///< Files only
};

/**
 * @brief The newest revision of every entity, in first-seen order
 *
 * On equal unix_time the revision seen first is kept.
 */
std::vector<DriveEntity> latest_revisions(const std::vector<DriveEntity>& entities);

/// Folder entities as hierarchy nodes; files are skipped
std::vector<FolderNode> folder_nodes_of(const std::vector<DriveEntity>& entities);

struct FileConflictInfo {
    std::string id;
    std::string name;
    std::int64_t last_modified_date = 0;
};

struct FolderConflictInfo {
    std::string id;
    std::string name;
};

/**
 * @brief Names already taken in a folder, to check an upload against
 */
struct NameConflictInfo {
    std::vector<FileConflictInfo> files;
    std::vector<FolderConflictInfo> folders;
};

NameConflictInfo name_conflict_info(const std::vector<DriveEntity>& children);

} // namespace lfs::hierarchy
