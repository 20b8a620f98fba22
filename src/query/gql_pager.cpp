#include "lfs/query/gql_pager.hpp"

#include <spdlog/spdlog.h>

namespace lfs::query {

Result<GqlPage> parse_gql_page(const nlohmann::json& response) {
    nlohmann::json transactions;
    if (response.is_object() && response.contains("data") && response["data"].is_object()) {
        transactions = response["data"].value("transactions", nlohmann::json());
    }
    if (!transactions.is_object()) {
        return Err<GqlPage>(ErrorKind::MalformedResponse, "GraphQL response has no data.transactions object");
    }

    const auto page_info = transactions.find("pageInfo");
    if (page_info == transactions.end() || !page_info->is_object() ||
        !page_info->contains("hasNextPage") || !(*page_info)["hasNextPage"].is_boolean()) {
        return Err<GqlPage>(ErrorKind::MalformedResponse, "GraphQL response has no pageInfo.hasNextPage");
    }

    const auto edges = transactions.find("edges");
    if (edges == transactions.end() || !edges->is_array()) {
        return Err<GqlPage>(ErrorKind::MalformedResponse, "GraphQL response has no edges array");
    }

    GqlPage page;
    page.has_next_page = (*page_info)["hasNextPage"].get<bool>();
    for (const auto& edge : *edges) {
        if (!edge.is_object() || !edge.contains("cursor") || !edge["cursor"].is_string() || !edge.contains("node")) {
            return Err<GqlPage>(ErrorKind::MalformedResponse, "GraphQL edge without cursor or node");
        }
        page.edges.push_back({edge["cursor"].get<std::string>(), edge["node"]});
    }
    return Ok(std::move(page));
}

Result<std::vector<nlohmann::json>> fetch_all_pages(const PageFetcher& fetch) {
    std::vector<nlohmann::json> nodes;
    std::string cursor;
    bool has_next_page = true;
    std::size_t pages = 0;

    while (has_next_page) {
        auto response = fetch(cursor);
        if (response.is_error()) {
            return response.propagate<std::vector<nlohmann::json>>();
        }

        auto page = parse_gql_page(response.value());
        if (page.is_error()) {
            return page.propagate<std::vector<nlohmann::json>>();
        }
        ++pages;

        has_next_page = page.value().has_next_page;
        if (has_next_page && page.value().edges.empty()) {
            // Same cursor again would return the same page forever
            return Err<std::vector<nlohmann::json>>(ErrorKind::MalformedResponse,
                                                    "GraphQL page reports a next page but has no edges");
        }

        for (auto& edge : page.value().edges) {
            cursor = edge.cursor;
            nodes.push_back(std::move(edge.node));
        }
    }

    spdlog::debug("GraphQL query returned {} node(s) over {} page(s)", nodes.size(), pages);
    return Ok(std::move(nodes));
}

} // namespace lfs::query
