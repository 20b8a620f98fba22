#include "lfs/pack/bundle_packer.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <random>
#include <vector>

using lfs::ByteCount;
using lfs::ErrorKind;
using lfs::pack::BundleIndex;
using lfs::pack::BundlePacker;
using lfs::pack::DataItemPlan;

namespace {

DataItemPlan plan(const std::string& order, std::uint64_t bytes, std::uint32_t items = 1) {
    return DataItemPlan{order, ByteCount(bytes), items};
}

BundlePacker make_packer(std::uint64_t max_size, std::uint32_t max_items) {
    auto packer = BundlePacker::create(ByteCount(max_size), max_items);
    EXPECT_TRUE(packer.is_ok());
    return std::move(packer.value());
}

std::vector<DataItemPlan> random_plans(std::uint32_t seed, std::size_t count) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::uint64_t> bytes(1, 6000);
    std::uniform_int_distribution<std::uint32_t> items(1, 3);

    std::vector<DataItemPlan> plans;
    for (std::size_t i = 0; i < count; ++i) {
        plans.push_back(plan("order-" + std::to_string(i), bytes(rng), items(rng)));
    }
    return plans;
}

} // namespace

TEST(BundlePackerTest, FirstFitOpensBundleOnlyWhenNeeded) {
    auto packer = make_packer(10000, 5);

    EXPECT_EQ(packer.pack_into_bundle(plan("a", 4000)).value(), 0u);
    EXPECT_EQ(packer.pack_into_bundle(plan("b", 3000)).value(), 0u);
    // 3000 bytes left in bundle 0
    EXPECT_EQ(packer.pack_into_bundle(plan("c", 6000)).value(), 1u);

    ASSERT_EQ(packer.bundles().size(), 2u);
    EXPECT_EQ(packer.bundles()[0].total_size().value(), 7000u);
    EXPECT_EQ(packer.bundles()[0].upload_orders(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(packer.bundles()[1].upload_orders(), (std::vector<std::string>{"c"}));
}

TEST(BundlePackerTest, LaterSmallPlanBackfillsEarlierBundle) {
    auto packer = make_packer(10000, 5);

    ASSERT_TRUE(packer.pack_into_bundle(plan("a", 4000)).is_ok());
    ASSERT_TRUE(packer.pack_into_bundle(plan("b", 3000)).is_ok());
    ASSERT_TRUE(packer.pack_into_bundle(plan("c", 6000)).is_ok());

    EXPECT_EQ(packer.pack_into_bundle(plan("d", 2500)).value(), 0u);
    EXPECT_EQ(packer.bundles()[0].remaining_size().value(), 500u);
}

TEST(BundlePackerTest, ItemLimitOpensNewBundle) {
    auto packer = make_packer(1000000, 3);

    EXPECT_EQ(packer.pack_into_bundle(plan("file-with-metadata", 10, 2)).value(), 0u);
    EXPECT_EQ(packer.pack_into_bundle(plan("x", 10)).value(), 0u);
    EXPECT_EQ(packer.pack_into_bundle(plan("y", 10)).value(), 1u);
    EXPECT_EQ(packer.bundles()[0].remaining_data_items(), 0u);
}

TEST(BundlePackerTest, MetadataWithoutUploadOrderStillConsumesCapacity) {
    auto packer = make_packer(1000, 5);

    DataItemPlan metadata;
    metadata.byte_count_as_data_item = ByteCount(600);

    EXPECT_EQ(packer.pack_into_bundle(metadata).value(), 0u);
    EXPECT_TRUE(packer.bundles()[0].upload_orders().empty());
    EXPECT_EQ(packer.bundles()[0].total_data_items(), 1u);

    EXPECT_EQ(packer.pack_into_bundle(plan("next", 600)).value(), 1u);
}

TEST(BundlePackerTest, RejectsPlanLargerThanAnEmptyBundle) {
    auto packer = make_packer(1000, 5);

    auto too_big = packer.pack_into_bundle(plan("huge", 1001));
    ASSERT_TRUE(too_big.is_error());
    EXPECT_EQ(too_big.error().kind, ErrorKind::InvalidArgument);

    auto too_many = packer.pack_into_bundle(plan("many", 10, 6));
    ASSERT_TRUE(too_many.is_error());
    EXPECT_TRUE(packer.bundles().empty());
}

TEST(BundlePackerTest, CreateRejectsDegenerateLimits) {
    for (std::uint32_t limit : {0u, 1u}) {
        auto packer = BundlePacker::create(ByteCount(1000), limit);
        ASSERT_TRUE(packer.is_error());
        EXPECT_EQ(packer.error().kind, ErrorKind::InvalidArgument);
    }
    EXPECT_TRUE(BundlePacker::create(ByteCount(0), 10).is_error());
    EXPECT_TRUE(BundlePacker::create(ByteCount(1000), 2).is_ok());
}

TEST(BundlePackerTest, DefaultsMatchLedgerLimits) {
    auto packer = BundlePacker::create();
    ASSERT_TRUE(packer.is_ok());
    EXPECT_EQ(packer.value().max_bundle_size().value(), 500ull * 1024 * 1024);
    EXPECT_EQ(packer.value().max_data_item_limit(), 500u);
}

TEST(BundlePackerTest, CapacityInvariantHoldsAfterEveryPack) {
    auto packer = make_packer(10000, 5);

    for (const auto& item : random_plans(7, 200)) {
        ASSERT_TRUE(packer.pack_into_bundle(item).is_ok());
        for (const auto& bundle : packer.bundles()) {
            EXPECT_LE(bundle.total_size().value(), 10000u);
            EXPECT_LE(bundle.total_data_items(), 5u);
        }
    }
}

TEST(BundlePackerTest, PackingIsDeterministic) {
    const auto plans = random_plans(42, 100);

    auto first = make_packer(10000, 5);
    auto second = make_packer(10000, 5);

    std::vector<BundleIndex> first_indices;
    std::vector<BundleIndex> second_indices;
    for (const auto& item : plans) {
        first_indices.push_back(first.pack_into_bundle(item).value());
        second_indices.push_back(second.pack_into_bundle(item).value());
    }

    EXPECT_EQ(first_indices, second_indices);
}

TEST(BundlePackerTest, FeasibilityAgreesWithSingleBundlePacking) {
    auto packer = make_packer(10000, 3);

    const std::vector<ByteCount> fitting{ByteCount(4000), ByteCount(3000), ByteCount(3000)};
    ASSERT_TRUE(packer.can_pack_data_items_with_byte_counts(fitting));

    auto fresh = make_packer(10000, 3);
    for (const auto& bytes : fitting) {
        EXPECT_EQ(fresh.pack_into_bundle(DataItemPlan{std::nullopt, bytes, 1}).value(), 0u);
    }
    EXPECT_EQ(fresh.bundles().size(), 1u);

    EXPECT_FALSE(packer.can_pack_data_items_with_byte_counts({ByteCount(4000), ByteCount(6001)}));
    EXPECT_FALSE(packer.can_pack_data_items_with_byte_counts(
        {ByteCount(1), ByteCount(1), ByteCount(1), ByteCount(1)}));
    EXPECT_TRUE(packer.can_pack_data_items_with_byte_counts({}));
}

TEST(BundlePackerTest, FeasibilityCheckSurvivesOverflow) {
    auto packer = make_packer(std::numeric_limits<std::uint64_t>::max(), 10);

    EXPECT_FALSE(packer.can_pack_data_items_with_byte_counts(
        {ByteCount(std::numeric_limits<std::uint64_t>::max()), ByteCount(1)}));
}
