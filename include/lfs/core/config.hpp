#pragma once

#include "lfs/core/result.hpp"
#include "lfs/core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lfs {

/// Original ledger client defaults: 500 MiB bundles holding at most 500 data items
inline constexpr std::uint64_t kMaxBundleSize = 500ULL * 1024 * 1024;
inline constexpr std::uint32_t kMaxDataItemLimit = 500;

struct PackerSettings {
    ByteCount max_bundle_size{kMaxBundleSize};
    std::uint32_t max_data_item_limit = kMaxDataItemLimit;
};

struct RetrySettings {
    std::size_t max_concurrent_chunks = 32;
    std::size_t max_errors = 100;
    std::chrono::milliseconds retry_delay{20'000};
    double jitter_fraction = 0.3;  ///< Delay is reduced by up to this fraction
};

struct LoggingSettings {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

struct EngineConfig {
    std::string gateway_url = "https://arweave.net/";
    PackerSettings packer;
    RetrySettings uploader;
    LoggingSettings logging;
};

/**
 * @brief Overlay a JSON document on top of the defaults
 *
 * Keys that are absent keep their default. Keys with the wrong type or an
 * out-of-range value produce ErrorKind::Config.
 */
Result<EngineConfig> config_from_json(const nlohmann::json& document);

Result<EngineConfig> load_config(const std::filesystem::path& path);

void configure_logging(const LoggingSettings& settings);

} // namespace lfs
