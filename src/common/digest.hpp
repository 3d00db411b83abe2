#ifndef TIERFS_SRC_COMMON_DIGEST_HPP_
#define TIERFS_SRC_COMMON_DIGEST_HPP_

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace TierFS::Common
{

/// Lowercase hex MD5 of the input. Used for naming, never for security.
std::string Md5Hex(std::span<const std::byte> data);
std::string Md5Hex(std::string_view text);

}  // namespace TierFS::Common

#endif  // TIERFS_SRC_COMMON_DIGEST_HPP_
