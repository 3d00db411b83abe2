#include "cache/cache_types.hpp"

namespace TierFS::Cache
{

const char *EvictionPolicyToString(EvictionPolicy policy)
{
    switch (policy) {
        case EvictionPolicy::Lru:
            return "lru";
        case EvictionPolicy::Lfu:
            return "lfu";
        case EvictionPolicy::Fifo:
            return "fifo";
    }
    return "unknown";
}

std::optional<EvictionPolicy> StringToEvictionPolicy(const std::string &policy_str)
{
    if (policy_str == "lru") {
        return EvictionPolicy::Lru;
    }
    if (policy_str == "lfu") {
        return EvictionPolicy::Lfu;
    }
    if (policy_str == "fifo") {
        return EvictionPolicy::Fifo;
    }
    return std::nullopt;
}

}  // namespace TierFS::Cache
