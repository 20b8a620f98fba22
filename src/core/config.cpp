#include "lfs/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <type_traits>

namespace lfs {
namespace {

using json = nlohmann::json;

Result<void> invalid_value(const char* key, const std::string& reason) {
    return Err<void>(ErrorKind::Config, std::string("Invalid value for '") + key + "': " + reason);
}

// nlohmann's get<T>() wraps negative and fractional numbers into unsigned
// targets, so integers are range-checked here before converting.
template<typename T>
Result<void> read_integer(const json& value, const char* key, T& out) {
    if (!value.is_number_integer()) {
        return invalid_value(key, "expected an integer, got " + value.dump());
    }
    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            return invalid_value(key, std::to_string(number) + " is out of range");
        }
        out = static_cast<T>(number);
        return Ok();
    }

    const auto number = value.get<std::int64_t>();
    if constexpr (std::is_unsigned_v<T>) {
        if (number < 0 || static_cast<std::uint64_t>(number) > std::numeric_limits<T>::max()) {
            return invalid_value(key, std::to_string(number) + " is out of range");
        }
    } else {
        if (number < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
            number > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
            return invalid_value(key, std::to_string(number) + " is out of range");
        }
    }
    out = static_cast<T>(number);
    return Ok();
}

template<typename T>
Result<void> read_key(const json& object, const char* key, T& out) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        return read_integer(*it, key, out);
    } else {
        try {
            out = it->get<T>();
        } catch (const json::exception& e) {
            return invalid_value(key, e.what());
        }
        return Ok();
    }
}

Result<void> read_section(const json& document, const char* name, json& section) {
    const auto it = document.find(name);
    if (it == document.end()) {
        section = json::object();
        return Ok();
    }
    if (!it->is_object()) {
        return Err<void>(ErrorKind::Config, std::string("Section '") + name + "' must be an object");
    }
    section = *it;
    return Ok();
}

} // namespace

Result<EngineConfig> config_from_json(const json& document) {
    if (!document.is_object()) {
        return Err<EngineConfig>(ErrorKind::Config, "Configuration root must be a JSON object");
    }

    EngineConfig config;
    if (auto res = read_key(document, "gateway_url", config.gateway_url); res.is_error()) {
        return Err<EngineConfig>(res.error());
    }

    json packer;
    json uploader;
    json logging;
    for (auto res : {read_section(document, "packer", packer),
                     read_section(document, "uploader", uploader),
                     read_section(document, "logging", logging)}) {
        if (res.is_error()) {
            return Err<EngineConfig>(res.error());
        }
    }

    std::uint64_t max_bundle_size = config.packer.max_bundle_size.value();
    std::int64_t retry_delay_ms = config.uploader.retry_delay.count();

    const Result<void> reads[] = {
        read_key(packer, "max_bundle_size", max_bundle_size),
        read_key(packer, "max_data_item_limit", config.packer.max_data_item_limit),
        read_key(uploader, "max_concurrent_chunks", config.uploader.max_concurrent_chunks),
        read_key(uploader, "max_errors", config.uploader.max_errors),
        read_key(uploader, "retry_delay_ms", retry_delay_ms),
        read_key(uploader, "jitter_fraction", config.uploader.jitter_fraction),
        read_key(logging, "level", config.logging.level),
        read_key(logging, "pattern", config.logging.pattern),
    };
    for (const auto& res : reads) {
        if (res.is_error()) {
            return Err<EngineConfig>(res.error());
        }
    }

    config.packer.max_bundle_size = ByteCount(max_bundle_size);
    config.uploader.retry_delay = std::chrono::milliseconds(retry_delay_ms);

    if (config.uploader.max_concurrent_chunks == 0) {
        return Err<EngineConfig>(ErrorKind::Config, "uploader.max_concurrent_chunks must be > 0");
    }
    if (config.uploader.max_errors == 0) {
        return Err<EngineConfig>(ErrorKind::Config, "uploader.max_errors must be > 0");
    }
    if (retry_delay_ms < 0) {
        return Err<EngineConfig>(ErrorKind::Config, "uploader.retry_delay_ms must be >= 0");
    }
    if (config.uploader.jitter_fraction < 0.0 || config.uploader.jitter_fraction > 1.0) {
        return Err<EngineConfig>(ErrorKind::Config, "uploader.jitter_fraction must be within [0, 1]");
    }
    if (spdlog::level::from_str(config.logging.level) == spdlog::level::off && config.logging.level != "off") {
        return Err<EngineConfig>(ErrorKind::Config, "Unknown logging.level '" + config.logging.level + "'");
    }

    return Ok(config);
}

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<EngineConfig>(ErrorKind::Io, "Failed to open config file: " + path.string());
    }

    json document;
    try {
        input >> document;
    } catch (const json::parse_error& e) {
        return Err<EngineConfig>(ErrorKind::Config, "Failed to parse " + path.string() + ": " + e.what());
    }

    auto result = config_from_json(document);
    if (result.is_ok()) {
        spdlog::debug("Loaded configuration from {}", path.string());
    }
    return result;
}

void configure_logging(const LoggingSettings& settings) {
    spdlog::set_level(spdlog::level::from_str(settings.level));
    spdlog::set_pattern(settings.pattern);
}

} // namespace lfs
