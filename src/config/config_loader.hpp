#ifndef TIERFS_SRC_CONFIG_CONFIG_LOADER_HPP_
#define TIERFS_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <string>

namespace TierFS::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<AppConfig, LoadError>;
using LoadErrorMsg = std::expected<AppConfig, std::string>;

// Parses a size string (e.g., "500MB", "2GB", "1024") into bytes.
std::optional<uint64_t> ParseSizeStringToBytes(const std::string &size_str);

LoadResult LoadConfigFromFile(const std::filesystem::path &file_path);
LoadErrorMsg LoadConfigFromFileVerbose(const std::filesystem::path &file_path);
/// Same rules as LoadConfigFromFile, for an already parsed document.
LoadResult ParseConfig(const nlohmann::json &j);

}  // namespace TierFS::Config

#endif  // TIERFS_SRC_CONFIG_CONFIG_LOADER_HPP_
