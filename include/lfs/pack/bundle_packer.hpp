#pragma once

#include "lfs/core/config.hpp"
#include "lfs/core/result.hpp"
#include "lfs/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lfs::pack {

using BundleIndex = std::size_t;

/// Caller-side handle of the upload order a data item belongs to
using UploadOrderRef = std::string;

/**
 * @brief One packing request
 *
 * upload_order is empty when the item is the metadata of an over-sized file:
 * the file data goes up as its own transaction, but its metadata still rides
 * in a bundle and consumes capacity there.
 */
struct DataItemPlan {
    std::optional<UploadOrderRef> upload_order;
    ByteCount byte_count_as_data_item;
    std::uint32_t number_of_data_items = 1;
};

/**
 * @brief A bundle being filled during one planning pass
 *
 * Invariant: total_size() <= max size and total_data_items() <= max items.
 * The packer only calls add() after checking remaining capacity.
 */
class PlannedBundle {
public:
    PlannedBundle(ByteCount max_bundle_size, std::uint32_t max_data_item_limit);

    void add(const DataItemPlan& plan);

    bool fits(const DataItemPlan& plan) const noexcept;

    [[nodiscard]] const std::vector<UploadOrderRef>& upload_orders() const noexcept { return upload_orders_; }
    [[nodiscard]] ByteCount total_size() const noexcept { return ByteCount(total_size_); }
    [[nodiscard]] std::uint64_t total_data_items() const noexcept { return total_data_items_; }
    [[nodiscard]] ByteCount remaining_size() const noexcept { return ByteCount(max_bundle_size_ - total_size_); }
    [[nodiscard]] std::uint64_t remaining_data_items() const noexcept { return max_data_item_limit_ - total_data_items_; }

private:
    std::uint64_t max_bundle_size_;
    std::uint64_t max_data_item_limit_;
    std::uint64_t total_size_ = 0;
    std::uint64_t total_data_items_ = 0;
    std::vector<UploadOrderRef> upload_orders_;
};

/**
 * @brief Online first-fit bundle packer
 *
 * Each plan goes into the lowest-index bundle that still has room for both
 * its bytes and its data item count, or into a new bundle appended at the
 * end. Indices are never revisited, so a returned BundleIndex stays valid
 * for the whole planning pass; metadata of an over-sized file is routed to
 * its sibling's bundle with it.
 *
 * A plan that would not fit even an empty bundle is rejected with
 * ErrorKind::InvalidArgument rather than seeding an over-full bundle;
 * planners are expected to route such items to standalone transactions.
 *
 * Not thread-safe: one planning pass owns one packer.
 */
class BundlePacker {
public:
    /**
     * @brief Validate the limits and build an empty packer
     *
     * A bundle of fewer than two data items is no better than a plain
     * transaction, so max_data_item_limit < 2 is rejected, as is a zero
     * byte capacity.
     */
    static Result<BundlePacker> create(ByteCount max_bundle_size = ByteCount(kMaxBundleSize),
                                       std::uint32_t max_data_item_limit = kMaxDataItemLimit);

    static Result<BundlePacker> create(const PackerSettings& settings) {
        return create(settings.max_bundle_size, settings.max_data_item_limit);
    }

    Result<BundleIndex> pack_into_bundle(const DataItemPlan& plan);

    /**
     * @brief Whether all of these data items fit together in ONE bundle
     *
     * Pure check, no state is touched. A false answer is a normal planning
     * signal (send as separate transactions), not an error.
     */
    [[nodiscard]] bool can_pack_data_items_with_byte_counts(const std::vector<ByteCount>& byte_counts) const noexcept;

    [[nodiscard]] const std::vector<PlannedBundle>& bundles() const noexcept { return bundles_; }

    [[nodiscard]] ByteCount max_bundle_size() const noexcept { return max_bundle_size_; }
    [[nodiscard]] std::uint32_t max_data_item_limit() const noexcept { return max_data_item_limit_; }

private:
    BundlePacker(ByteCount max_bundle_size, std::uint32_t max_data_item_limit);

    ByteCount max_bundle_size_;
    std::uint32_t max_data_item_limit_;
    std::vector<PlannedBundle> bundles_;
};

} // namespace lfs::pack
