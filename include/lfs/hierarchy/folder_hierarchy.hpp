#pragma once

#include "lfs/core/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lfs::hierarchy {

struct FolderNode {
    std::string id;
    std::optional<std::string> parent_id;  ///< Absent for a drive's root folder
    std::string name;
};

/**
 * @brief Read-only parent/child index over the folders of one drive
 *
 * Built once per listing and never mutated afterwards, so it may be shared
 * between threads. Revision resolution is the caller's job (see
 * latest_revisions()); when an id appears more than once the last
 * occurrence wins.
 *
 * Traversals carry a visited set: a malformed index containing a cycle
 * still terminates.
 */
class FolderHierarchy {
public:
    static FolderHierarchy build_from_entities(const std::vector<FolderNode>& folders);

    /**
     * @brief Breadth-first ids below root_id, root first
     *
     * max_depth 0 yields only the root; max_depth K adds every folder at
     * most K parent->child edges away. An unknown root yields nothing.
     */
    std::vector<std::string> subtree_ids(const std::string& root_id, std::size_t max_depth) const;

    std::vector<std::string> children_of(const std::string& id) const;
    std::optional<std::string> parent_of(const std::string& id) const;

    /// First folder, in input order, whose parent is absent or not indexed
    std::optional<std::string> root_folder_id() const;

    /// "/Root/Sub/Leaf" for Leaf
    Result<std::string> path_of(const std::string& id) const;

    /// Ids from the root down to `id`, both included
    Result<std::vector<std::string>> id_path_of(const std::string& id) const;

    const FolderNode* find(const std::string& id) const;
    bool contains(const std::string& id) const { return nodes_.count(id) > 0; }
    std::size_t size() const { return nodes_.size(); }

private:
    std::unordered_map<std::string, FolderNode> nodes_;
    std::unordered_map<std::string, std::vector<std::string>> children_;
    std::vector<std::string> order_;
};

/**
 * @brief Which folders a listing of `folder_id` has to look into
 *
 * file_parent_ids: folders whose files are listed, subtree(max_depth - 1)
 * and never less than the folder itself.
 * subfolder_ids: folders listed as entries, subtree(max_depth) minus the
 * folder itself.
 */
struct ListingScope {
    std::vector<std::string> file_parent_ids;
    std::vector<std::string> subfolder_ids;
};

Result<ListingScope> listing_search_ids(const FolderHierarchy& hierarchy, const std::string& folder_id, int max_depth);

} // namespace lfs::hierarchy
