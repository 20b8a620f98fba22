#include "lfs/hierarchy/folder_hierarchy.hpp"

#include <deque>
#include <unordered_set>
#include <utility>

namespace lfs::hierarchy {

FolderHierarchy FolderHierarchy::build_from_entities(const std::vector<FolderNode>& folders) {
    std::unordered_map<std::string, std::size_t> last_index;
    for (std::size_t i = 0; i < folders.size(); ++i) {
        last_index[folders[i].id] = i;
    }

    FolderHierarchy hierarchy;
    for (std::size_t i = 0; i < folders.size(); ++i) {
        const auto& folder = folders[i];
        if (last_index[folder.id] != i) {
            continue;
        }
        hierarchy.order_.push_back(folder.id);
        hierarchy.nodes_.emplace(folder.id, folder);
        if (folder.parent_id) {
            hierarchy.children_[*folder.parent_id].push_back(folder.id);
        }
    }
    return hierarchy;
}

std::vector<std::string> FolderHierarchy::subtree_ids(const std::string& root_id, std::size_t max_depth) const {
    std::vector<std::string> result;
    if (!contains(root_id)) {
        return result;
    }

    std::unordered_set<std::string> visited{root_id};
    std::deque<std::pair<std::string, std::size_t>> queue{{root_id, 0}};

    while (!queue.empty()) {
        auto [id, depth] = queue.front();
        queue.pop_front();
        result.push_back(id);

        if (depth == max_depth) {
            continue;
        }
        const auto it = children_.find(id);
        if (it == children_.end()) {
            continue;
        }
        for (const auto& child : it->second) {
            if (visited.insert(child).second) {
                queue.emplace_back(child, depth + 1);
            }
        }
    }
    return result;
}

std::vector<std::string> FolderHierarchy::children_of(const std::string& id) const {
    const auto it = children_.find(id);
    return it != children_.end() ? it->second : std::vector<std::string>{};
}

std::optional<std::string> FolderHierarchy::parent_of(const std::string& id) const {
    const auto* node = find(id);
    if (!node) {
        return std::nullopt;
    }
    return node->parent_id;
}

std::optional<std::string> FolderHierarchy::root_folder_id() const {
    for (const auto& id : order_) {
        const auto& node = nodes_.at(id);
        if (!node.parent_id || !contains(*node.parent_id)) {
            return id;
        }
    }
    return std::nullopt;
}

Result<std::vector<std::string>> FolderHierarchy::id_path_of(const std::string& id) const {
    if (!contains(id)) {
        return Err<std::vector<std::string>>(ErrorKind::InvalidArgument, "Unknown folder " + id);
    }

    std::vector<std::string> path;
    std::unordered_set<std::string> seen;
    std::optional<std::string> current = id;
    while (current && contains(*current)) {
        if (!seen.insert(*current).second) {
            return Err<std::vector<std::string>>(ErrorKind::InvalidState,
                                                 "Folder " + id + " is part of a parent cycle");
        }
        path.push_back(*current);
        current = nodes_.at(*current).parent_id;
    }
    return Ok(std::vector<std::string>(path.rbegin(), path.rend()));
}

Result<std::string> FolderHierarchy::path_of(const std::string& id) const {
    auto ids = id_path_of(id);
    if (ids.is_error()) {
        return ids.propagate<std::string>();
    }

    std::string path;
    for (const auto& folder_id : ids.value()) {
        path += "/" + nodes_.at(folder_id).name;
    }
    return Ok(std::move(path));
}

const FolderNode* FolderHierarchy::find(const std::string& id) const {
    const auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

Result<ListingScope> listing_search_ids(const FolderHierarchy& hierarchy, const std::string& folder_id, int max_depth) {
    if (max_depth < 0) {
        return Err<ListingScope>(ErrorKind::InvalidArgument, "max_depth should be a non-negative integer");
    }
    if (!hierarchy.contains(folder_id)) {
        return Err<ListingScope>(ErrorKind::InvalidArgument, "Unknown folder " + folder_id);
    }

    const auto depth = static_cast<std::size_t>(max_depth);
    ListingScope scope;
    scope.file_parent_ids = hierarchy.subtree_ids(folder_id, depth == 0 ? 0 : depth - 1);

    auto folders = hierarchy.subtree_ids(folder_id, depth);
    scope.subfolder_ids.assign(folders.begin() + 1, folders.end());
    return Ok(std::move(scope));
}

} // namespace lfs::hierarchy
