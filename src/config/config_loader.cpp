#include "config/config_loader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include "config/config_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <unordered_map>

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

#define TRY_ASSIGN_REQUIRED(target, json_obj, key, type)                            \
    try {                                                                           \
        if (!json_obj.contains(key)) {                                              \
            spdlog::error("Missing required JSON key: '{}'", key);                  \
            return std::unexpected(LoadError::ValidationError);                     \
        }                                                                           \
        target = json_obj.at(key).get<type>();                                      \
    } catch (const nlohmann::json::exception &e) {                                  \
        spdlog::error("JSON parse error for required key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                          \
    }

namespace TierFS::Config
{

namespace
{

// Accepts a plain number of bytes or a unit string.
std::expected<void, LoadError> AssignSize(
    const nlohmann::json &obj, const char *key, std::uint64_t &target
)
{
    if (!obj.contains(key)) {
        return {};
    }
    const auto &value = obj.at(key);
    if (value.is_number_unsigned()) {
        target = value.get<std::uint64_t>();
        return {};
    }
    if (value.is_string()) {
        auto parsed = ParseSizeStringToBytes(value.get<std::string>());
        if (!parsed) {
            spdlog::error("Invalid size for '{}': '{}'", key, value.get<std::string>());
            return std::unexpected(LoadError::ValidationError);
        }
        target = *parsed;
        return {};
    }
    spdlog::error("'{}' must be a string or a non-negative number.", key);
    return std::unexpected(LoadError::ValidationError);
}

std::expected<void, LoadError> RequireObject(const nlohmann::json &j, const char *key)
{
    if (j.contains(key) && !j.at(key).is_object()) {
        spdlog::error("'{}' must be an object.", key);
        return std::unexpected(LoadError::ValidationError);
    }
    return {};
}

std::expected<SourceDefinition, LoadError> ParseSource(const nlohmann::json &item)
{
    if (!item.is_object()) {
        spdlog::error("Item in 'sources' array is not an object.");
        return std::unexpected(LoadError::ValidationError);
    }

    SourceDefinition source;
    std::string type_str;
    std::string path_str;
    TRY_ASSIGN_REQUIRED(source.id, item, "id", std::string);
    TRY_ASSIGN_REQUIRED(type_str, item, "type", std::string);
    TRY_ASSIGN_REQUIRED(path_str, item, "path", std::string);
    source.path = path_str;
    source.name = source.id;
    TRY_ASSIGN(source.name, item, "name", std::string);

    auto type_opt = Storage::StringToStorageSourceType(type_str);
    if (!type_opt) {
        spdlog::error("Invalid 'type' value for source '{}': {}", source.id, type_str);
        return std::unexpected(LoadError::ValidationError);
    }
    source.type = *type_opt;

    if (item.contains("protocol")) {
        std::string protocol_str;
        TRY_ASSIGN(protocol_str, item, "protocol", std::string);
        auto protocol_opt = Storage::StringToNetworkProtocol(protocol_str);
        if (!protocol_opt) {
            spdlog::error("Invalid 'protocol' value for source '{}': {}", source.id, protocol_str);
            return std::unexpected(LoadError::ValidationError);
        }
        source.protocol = *protocol_opt;
    }
    TRY_ASSIGN(source.host, item, "host", std::string);
    if (item.contains("share_name")) {
        std::string share;
        TRY_ASSIGN(share, item, "share_name", std::string);
        source.share_name = share;
    }
    TRY_ASSIGN(source.bucket, item, "bucket", std::string);
    TRY_ASSIGN(source.prefix, item, "prefix", std::string);
    TRY_ASSIGN(source.storage_class, item, "storage_class", std::string);

    if (source.type == Storage::StorageSourceType::ObjectStorage && source.bucket.empty()) {
        source.bucket = source.path.filename().string();
    }
    if (!source.IsValid()) {
        spdlog::error("Parsed source definition is invalid: id='{}'", source.id);
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Parsed source: id='{}', name='{}', type='{}', path='{}'", source.id, source.name,
        Storage::StorageSourceTypeToString(source.type), source.path.string()
    );
    return source;
}

}  // namespace

// Parses a size string (e.g., "500MB", "2GB", "1024") into bytes.
// Returns std::nullopt if parsing fails.
std::optional<uint64_t> ParseSizeStringToBytes(const std::string &size_str)
{
    if (size_str.empty()) {
        return std::nullopt;
    }

    std::string num_part;
    std::string unit_part;

    size_t i = 0;
    while (i < size_str.length() && std::isdigit(static_cast<unsigned char>(size_str[i]))) {
        num_part += size_str[i];
        i++;
    }

    // Allow optional space between number and unit
    while (i < size_str.length() && std::isspace(static_cast<unsigned char>(size_str[i]))) {
        i++;
    }

    while (i < size_str.length() && std::isalpha(static_cast<unsigned char>(size_str[i]))) {
        unit_part += size_str[i];
        i++;
    }

    if (i < size_str.length()) {
        spdlog::warn("Invalid characters found after unit in size string: '{}'", size_str);
        return std::nullopt;
    }

    if (num_part.empty()) {
        spdlog::warn("No numeric part in size string: '{}'", size_str);
        return std::nullopt;
    }

    uint64_t value;
    auto conv_res = std::from_chars(num_part.data(), num_part.data() + num_part.length(), value);
    if (conv_res.ec != std::errc() || conv_res.ptr != num_part.data() + num_part.length()) {
        spdlog::warn("Failed to parse numeric part '{}' of size string: '{}'", num_part, size_str);
        return std::nullopt;
    }

    if (unit_part.empty()) {  // Assume bytes if no unit
        return value;
    }

    std::ranges::transform(unit_part, unit_part.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    static const std::unordered_map<std::string, uint64_t> unit_multipliers = {
        { "b",                                     1},
        {"kb",                               1024ULL},
        { "k",                               1024ULL},
        {"mb",                     1024ULL * 1024ULL},
        { "m",                     1024ULL * 1024ULL},
        {"gb",           1024ULL * 1024ULL * 1024ULL},
        { "g",           1024ULL * 1024ULL * 1024ULL},
        {"tb", 1024ULL * 1024ULL * 1024ULL * 1024ULL},
        { "t", 1024ULL * 1024ULL * 1024ULL * 1024ULL}
    };
    auto it = unit_multipliers.find(unit_part);
    if (it == unit_multipliers.end()) {
        spdlog::warn("Unknown size unit '{}' in string '{}'", unit_part, size_str);
        return std::nullopt;
    }
    return value * it->second;
}

LoadResult ParseConfig(const nlohmann::json &j)
{
    if (!j.is_object()) {
        spdlog::error("Configuration root must be an object.");
        return std::unexpected(LoadError::ValidationError);
    }
    for (const char *section : {"global_settings", "cache", "sync", "network"}) {
        if (auto res = RequireObject(j, section); !res) {
            return std::unexpected(res.error());
        }
    }

    AppConfig config;

    if (j.contains("global_settings")) {
        const auto &gs = j.at("global_settings");
        std::string log_level_str =
            spdlog::level::to_string_view(Constants::DEFAULT_LOG_LEVEL).data();
        TRY_ASSIGN(log_level_str, gs, "log_level", std::string);
        auto level_opt = StringToLogLevel(log_level_str);
        if (!level_opt) {
            spdlog::error(
                "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                spdlog::level::to_string_view(config.global_settings.log_level)
            );
        } else {
            config.global_settings.log_level = *level_opt;
        }
        std::string state_dir = config.global_settings.state_dir.string();
        TRY_ASSIGN(state_dir, gs, "state_dir", std::string);
        config.global_settings.state_dir = state_dir;
        TRY_ASSIGN(config.global_settings.io_threads, gs, "io_threads", std::size_t);
    }
    if (!config.global_settings.IsValid()) {
        spdlog::error("Global settings are invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Global settings: log_level='{}', state_dir='{}', io_threads={}",
        spdlog::level::to_string_view(config.global_settings.log_level),
        config.global_settings.state_dir.string(), config.global_settings.io_threads
    );

    if (!j.contains("cache")) {
        spdlog::error("'cache' object is missing.");
        return std::unexpected(LoadError::ValidationError);
    }
    {
        const auto &cs = j.at("cache");
        std::string cache_path;
        TRY_ASSIGN_REQUIRED(cache_path, cs, "path", std::string);
        config.cache.path = cache_path;
        if (auto res = AssignSize(cs, "max_size", config.cache.max_size); !res) {
            return std::unexpected(res.error());
        }
        if (cs.contains("eviction_policy")) {
            std::string policy_str;
            TRY_ASSIGN(policy_str, cs, "eviction_policy", std::string);
            auto policy_opt = Cache::StringToEvictionPolicy(policy_str);
            if (!policy_opt) {
                spdlog::error("Invalid 'eviction_policy' value: {}", policy_str);
                return std::unexpected(LoadError::ValidationError);
            }
            config.cache.eviction_policy = *policy_opt;
        }
    }
    if (!config.cache.IsValid()) {
        spdlog::error("Cache settings are invalid.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Cache settings: path='{}', max_size={}, eviction_policy='{}'", config.cache.path.string(),
        config.cache.max_size, Cache::EvictionPolicyToString(config.cache.eviction_policy)
    );

    if (j.contains("sync")) {
        const auto &ss = j.at("sync");
        if (auto res = AssignSize(ss, "cache_stage_threshold", config.sync.cache_stage_threshold);
            !res) {
            return std::unexpected(res.error());
        }
        TRY_ASSIGN(config.sync.max_job_history, ss, "max_job_history", std::size_t);
    }

    if (j.contains("network")) {
        const auto &ns = j.at("network");
        std::int64_t probe_ms   = config.network.probe_timeout.count();
        std::int64_t backoff_ms = config.network.backoff_base.count();
        TRY_ASSIGN(probe_ms, ns, "probe_timeout_ms", std::int64_t);
        TRY_ASSIGN(backoff_ms, ns, "backoff_base_ms", std::int64_t);
        TRY_ASSIGN(
            config.network.max_reconnect_attempts, ns, "max_reconnect_attempts", std::uint32_t
        );
        config.network.probe_timeout = std::chrono::milliseconds(probe_ms);
        config.network.backoff_base  = std::chrono::milliseconds(backoff_ms);
    }
    if (!config.network.IsValid()) {
        spdlog::error("Network settings are invalid.");
        return std::unexpected(LoadError::ValidationError);
    }

    if (j.contains("sources")) {
        if (!j.at("sources").is_array()) {
            spdlog::error("'sources' must be an array.");
            return std::unexpected(LoadError::ValidationError);
        }
        for (const auto &item : j.at("sources")) {
            auto source = ParseSource(item);
            if (!source) {
                return std::unexpected(source.error());
            }
            config.sources.push_back(std::move(*source));
        }
    }

    if (!config.IsValid()) {
        spdlog::error("Overall configuration is invalid after parsing.");
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info("Configured {} storage sources.", config.sources.size());
    return config;
}

LoadResult LoadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::info("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }
    return ParseConfig(j);
}

LoadErrorMsg LoadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = LoadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    }
    std::string error_message = "Failed to load config (" + file_path.string() + "): ";
    switch (result.error()) {
        case LoadError::FileNotFound:
            error_message += "File not found.";
            break;
        case LoadError::JsonParseError:
            error_message += "JSON parsing failed.";
            break;
        case LoadError::ValidationError:
            error_message += "Configuration validation failed.";
            break;
        default:
            error_message += "Unknown error.";
            break;
    }
    return std::unexpected(error_message);
}

}  // namespace TierFS::Config
