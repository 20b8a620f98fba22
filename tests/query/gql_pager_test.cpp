#include "lfs/query/gql_pager.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using lfs::ErrorKind;
using lfs::Result;
using lfs::query::fetch_all_pages;
using lfs::query::parse_gql_page;
using nlohmann::json;

namespace {

json page(const std::vector<std::string>& ids, bool has_next_page) {
    json edges = json::array();
    for (const auto& id : ids) {
        edges.push_back({{"cursor", "cursor-" + id}, {"node", {{"id", id}}}});
    }
    return {{"data", {{"transactions", {{"pageInfo", {{"hasNextPage", has_next_page}}}, {"edges", edges}}}}}};
}

} // namespace

TEST(GqlPagerTest, ParsesEdgesAndPageInfo) {
    auto parsed = parse_gql_page(page({"a", "b"}, true));
    ASSERT_TRUE(parsed.is_ok());

    ASSERT_EQ(parsed.value().edges.size(), 2u);
    EXPECT_EQ(parsed.value().edges[1].cursor, "cursor-b");
    EXPECT_EQ(parsed.value().edges[1].node["id"], "b");
    EXPECT_TRUE(parsed.value().has_next_page);
}

TEST(GqlPagerTest, RejectsMalformedResponses) {
    const json malformed[] = {
        json::array(),
        json{{"data", nullptr}},
        json{{"data", {{"transactions", {{"edges", json::array()}}}}}},
        json{{"data", {{"transactions", {{"pageInfo", {{"hasNextPage", "no"}}}, {"edges", json::array()}}}}}},
        json{{"data", {{"transactions", {{"pageInfo", {{"hasNextPage", false}}}, {"edges", json::array({json{{"node", 1}}})}}}}}},
    };

    for (const auto& response : malformed) {
        auto parsed = parse_gql_page(response);
        ASSERT_TRUE(parsed.is_error()) << response.dump();
        EXPECT_EQ(parsed.error().kind, ErrorKind::MalformedResponse);
    }
}

TEST(GqlPagerTest, ThreadsLastCursorUntilLastPage) {
    std::vector<std::string> cursors_seen;
    const std::vector<json> pages{
        page({"a", "b"}, true),
        page({"c"}, true),
        page({"d", "e"}, false),
    };

    auto nodes = fetch_all_pages([&](const std::string& cursor) -> Result<json> {
        cursors_seen.push_back(cursor);
        return lfs::Ok(pages.at(cursors_seen.size() - 1));
    });

    ASSERT_TRUE(nodes.is_ok());
    EXPECT_EQ(cursors_seen, (std::vector<std::string>{"", "cursor-b", "cursor-c"}));

    std::vector<std::string> ids;
    for (const auto& node : nodes.value()) {
        ids.push_back(node["id"].get<std::string>());
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST(GqlPagerTest, StopsOnFetchFailure) {
    int calls = 0;
    auto nodes = fetch_all_pages([&](const std::string&) -> Result<json> {
        if (++calls == 2) {
            return lfs::Err<json>(ErrorKind::Network, "gateway timeout");
        }
        return lfs::Ok(page({"a"}, true));
    });

    ASSERT_TRUE(nodes.is_error());
    EXPECT_EQ(nodes.error().kind, ErrorKind::Network);
    EXPECT_EQ(calls, 2);
}

TEST(GqlPagerTest, EmptyPageWithNextPageIsAnError) {
    auto nodes = fetch_all_pages([](const std::string&) -> Result<json> {
        return lfs::Ok(page({}, true));
    });

    ASSERT_TRUE(nodes.is_error());
    EXPECT_EQ(nodes.error().kind, ErrorKind::MalformedResponse);
}
