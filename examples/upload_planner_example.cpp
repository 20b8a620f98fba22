/**
 * @file upload_planner_example.cpp
 * @brief Plan a batch of uploads into bundles and price each bundle
 *
 * USAGE:
 *   upload_planner_example [config.json] [--price]
 *
 * Without --price nothing touches the network: the example only shows how
 * BundlePacker groups data items. With --price every planned bundle is
 * priced through the configured gateway (GET /price/{bytes}).
 */

#include "lfs/core/config.hpp"
#include "lfs/network/http_client.hpp"
#include "lfs/network/url.hpp"
#include "lfs/pack/bundle_packer.hpp"
#include "lfs/pricing/chunk_price_cache.hpp"
#include "lfs/pricing/gateway_oracle.hpp"
#include "lfs/pricing/price_estimator.hpp"
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace lfs;

namespace {

// ════════════════════════════════════════════════════════════
// Sample upload batch
// ════════════════════════════════════════════════════════════

struct SampleFile {
    std::string name;
    std::uint64_t data_item_bytes;
    std::uint32_t data_items;  // file data + metadata
};

std::vector<SampleFile> sample_batch() {
    constexpr std::uint64_t MiB = 1024 * 1024;
    return {
        {"holiday.mov", 310 * MiB, 2},
        {"thesis.pdf", 12 * MiB, 2},
        {"raw-scan.tiff", 240 * MiB, 2},
        {"notes.md", 4096, 2},
        {"dataset.csv", 180 * MiB, 2},
    };
}

int plan_batch(const EngineConfig& config, bool with_prices) {
    auto packer = pack::BundlePacker::create(config.packer);
    if (packer.is_error()) {
        spdlog::error("Invalid packer settings: {}", packer.error().describe());
        return 1;
    }

    for (const auto& file : sample_batch()) {
        pack::DataItemPlan plan{file.name, ByteCount(file.data_item_bytes), file.data_items};
        auto index = packer.value().pack_into_bundle(plan);
        if (index.is_error()) {
            // Too large for any bundle; it would go up as its own transaction
            spdlog::warn("{}: {}", file.name, index.error().message);
            continue;
        }
        spdlog::info("{} -> bundle #{}", file.name, index.value());
    }

    std::unique_ptr<network::HttpClient> client;
    std::unique_ptr<pricing::GatewayOracle> oracle;
    pricing::ChunkPriceCache cache;
    std::unique_ptr<pricing::ArDataPriceEstimator> estimator;
    if (with_prices) {
        auto gateway = network::Url::parse(config.gateway_url);
        if (gateway.is_error()) {
            spdlog::error("Invalid gateway URL: {}", gateway.error().describe());
            return 1;
        }
        client = std::make_unique<network::HttpClient>();
        oracle = std::make_unique<pricing::GatewayOracle>(*client, gateway.value());
        estimator = std::make_unique<pricing::ArDataPriceEstimator>(*oracle, cache);
    }

    const auto& bundles = packer.value().bundles();
    for (std::size_t i = 0; i < bundles.size(); ++i) {
        const auto& bundle = bundles[i];
        spdlog::info("Bundle #{}: {} item(s), {} bytes, {} bytes free",
                     i, bundle.total_data_items(), bundle.total_size().value(),
                     bundle.remaining_size().value());

        if (!estimator) {
            continue;
        }
        auto price = estimator->get_base_price(bundle.total_size());
        if (price.is_error()) {
            spdlog::error("Could not price bundle #{}: {}", i, price.error().describe());
            return 1;
        }
        spdlog::info("  base price {} Winston ({} AR)", price.value().to_string(), price.value().to_ar_string());
    }

    if (estimator) {
        spdlog::info("{} distinct chunk count(s) priced", cache.size());
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    bool with_prices = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--price") == 0) {
            with_prices = true;
        } else {
            config_path = argv[i];
        }
    }

    EngineConfig config;
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return 1;
        }
        config = loaded.value();
    }
    configure_logging(config.logging);

    spdlog::info("Planning with bundles of at most {} bytes / {} data items",
                 config.packer.max_bundle_size.value(), config.packer.max_data_item_limit);
    return plan_batch(config, with_prices);
}
