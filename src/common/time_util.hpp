#ifndef TIERFS_SRC_COMMON_TIME_UTIL_HPP_
#define TIERFS_SRC_COMMON_TIME_UTIL_HPP_

#include <chrono>
#include <cstdint>

namespace TierFS::Common
{

/// Milliseconds since the Unix epoch, the form timestamps take in JSON state files.
inline std::int64_t ToUnixMillis(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point FromUnixMillis(std::int64_t ms)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{ms}
        )
    };
}

}  // namespace TierFS::Common

#endif  // TIERFS_SRC_COMMON_TIME_UTIL_HPP_
