#pragma once

#include "lfs/core/result.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace lfs::query {

struct GqlEdge {
    std::string cursor;
    nlohmann::json node;
};

struct GqlPage {
    std::vector<GqlEdge> edges;
    bool has_next_page = false;
};

/**
 * @brief Pull edges and pageInfo out of a transactions query response
 *
 * Expects {"data": {"transactions": {"pageInfo": {"hasNextPage": bool},
 * "edges": [{"cursor": "...", "node": {...}}, ...]}}}.
 */
Result<GqlPage> parse_gql_page(const nlohmann::json& response);

/// Runs the query for one page; the first call gets an empty cursor
using PageFetcher = std::function<Result<nlohmann::json>(const std::string& cursor)>;

/**
 * @brief Fetch every page of a query and return all edge nodes in order
 *
 * The cursor of the last edge of each page is handed to the next fetch
 * until a page reports hasNextPage == false.
 */
Result<std::vector<nlohmann::json>> fetch_all_pages(const PageFetcher& fetch);

} // namespace lfs::query
