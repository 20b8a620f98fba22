#include "lfs/pack/bundle_packer.hpp"

#include <spdlog/spdlog.h>

namespace lfs::pack {

PlannedBundle::PlannedBundle(ByteCount max_bundle_size, std::uint32_t max_data_item_limit)
    : max_bundle_size_(max_bundle_size.value()),
      max_data_item_limit_(max_data_item_limit) {
}

bool PlannedBundle::fits(const DataItemPlan& plan) const noexcept {
    return plan.byte_count_as_data_item <= remaining_size() &&
           plan.number_of_data_items <= remaining_data_items();
}

void PlannedBundle::add(const DataItemPlan& plan) {
    total_size_ += plan.byte_count_as_data_item.value();
    total_data_items_ += plan.number_of_data_items;

    // Metadata of over-sized files only contributes capacity
    if (plan.upload_order) {
        upload_orders_.push_back(*plan.upload_order);
    }
}

BundlePacker::BundlePacker(ByteCount max_bundle_size, std::uint32_t max_data_item_limit)
    : max_bundle_size_(max_bundle_size),
      max_data_item_limit_(max_data_item_limit) {
}

Result<BundlePacker> BundlePacker::create(ByteCount max_bundle_size, std::uint32_t max_data_item_limit) {
    if (max_data_item_limit < 2) {
        return Err<BundlePacker>(ErrorKind::InvalidArgument,
                                 "Maximum data item limit must be an integer value of 2 or more, got " +
                                     std::to_string(max_data_item_limit));
    }
    if (max_bundle_size.value() == 0) {
        return Err<BundlePacker>(ErrorKind::InvalidArgument, "Maximum bundle size must be greater than 0");
    }
    return Ok(BundlePacker(max_bundle_size, max_data_item_limit));
}

Result<BundleIndex> BundlePacker::pack_into_bundle(const DataItemPlan& plan) {
    for (BundleIndex index = 0; index < bundles_.size(); ++index) {
        if (bundles_[index].fits(plan)) {
            bundles_[index].add(plan);
            return Ok(index);
        }
    }

    PlannedBundle bundle(max_bundle_size_, max_data_item_limit_);
    if (!bundle.fits(plan)) {
        return Err<BundleIndex>(ErrorKind::InvalidArgument,
                                "Data item plan of " + std::to_string(plan.byte_count_as_data_item.value()) +
                                    " bytes / " + std::to_string(plan.number_of_data_items) +
                                    " items exceeds bundle capacity");
    }

    bundle.add(plan);
    bundles_.push_back(std::move(bundle));
    spdlog::debug("Opened bundle {} for {} bytes", bundles_.size() - 1, plan.byte_count_as_data_item.value());
    return Ok(bundles_.size() - 1);
}

bool BundlePacker::can_pack_data_items_with_byte_counts(const std::vector<ByteCount>& byte_counts) const noexcept {
    if (byte_counts.size() > max_data_item_limit_) {
        return false;
    }

    ByteCount total;
    for (const auto& bytes : byte_counts) {
        const auto sum = total.checked_plus(bytes);
        if (!sum || *sum > max_bundle_size_) {
            return false;
        }
        total = *sum;
    }
    return true;
}

} // namespace lfs::pack
