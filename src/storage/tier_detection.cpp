#include "storage/tier_detection.hpp"

#include "common/overloaded.hpp"

#include <algorithm>
#include <cctype>

namespace TierFS::Storage
{

namespace
{

std::string Uppercase(std::string text)
{
    std::ranges::transform(text, text.begin(), [](unsigned char c) {
        return std::toupper(c);
    });
    return text;
}

std::chrono::seconds RetrievalEstimateFor(StorageTier tier, const std::string &storage_class)
{
    switch (tier) {
        case StorageTier::Hot:
            return std::chrono::seconds{0};
        case StorageTier::Warm:
        case StorageTier::Cold:
        case StorageTier::Nearline:
            return std::chrono::seconds{1};
        case StorageTier::Archive:
            return storage_class == "DEEP_ARCHIVE" ? std::chrono::seconds{43200}
                                                   : std::chrono::seconds{3600};
    }
    return std::chrono::seconds{1};
}

}  // namespace

StorageTier TierForStorageClass(const std::string &storage_class)
{
    const std::string label = Uppercase(storage_class);
    if (label == "GLACIER_IR") {
        return StorageTier::Nearline;
    }
    if (label == "GLACIER" || label == "DEEP_ARCHIVE") {
        return StorageTier::Archive;
    }
    // STANDARD, STANDARD_IA, ONEZONE_IA, INTELLIGENT_TIERING, REDUCED_REDUNDANCY
    // and anything unrecognised.
    return StorageTier::Cold;
}

std::string StorageClassForTier(StorageTier tier)
{
    switch (tier) {
        case StorageTier::Hot:
        case StorageTier::Warm:
            return "STANDARD";
        case StorageTier::Cold:
            return "STANDARD_IA";
        case StorageTier::Nearline:
            return "GLACIER_IR";
        case StorageTier::Archive:
            return "DEEP_ARCHIVE";
    }
    return "STANDARD";
}

TierStatus DetectTier(const TierStrategy &strategy, const TierProbe &probe)
{
    return std::visit(
        Common::Overloaded{
            [](const FixedTier &) {
                return TierStatus::Hot();
            },
            [](const NetworkShareTier &s) {
                return TierStatus{StorageTier::Warm, false, true, s.retrieval_estimate};
            },
            [&probe](const StorageClassTier &) {
                const std::string label = Uppercase(probe.storage_class.value_or("STANDARD"));
                const StorageTier tier  = TierForStorageClass(label);
                return TierStatus{tier, false, true, RetrievalEstimateFor(tier, label)};
            },
            [&probe](const AccessAgeTier &s) {
                const auto age = probe.now - probe.last_accessed;
                if (age > s.archive_after) {
                    return TierStatus{StorageTier::Archive, false, true, std::chrono::seconds{3600}};
                }
                if (age > s.cold_after) {
                    return TierStatus{StorageTier::Cold, false, true, std::chrono::seconds{60}};
                }
                return TierStatus::Hot();
            },
        },
        strategy
    );
}

const char *TierStrategyName(const TierStrategy &strategy)
{
    return std::visit(
        Common::Overloaded{
            [](const FixedTier &) {
                return "fixed";
            },
            [](const NetworkShareTier &) {
                return "network_share";
            },
            [](const StorageClassTier &) {
                return "storage_class";
            },
            [](const AccessAgeTier &) {
                return "access_age";
            },
        },
        strategy
    );
}

}  // namespace TierFS::Storage
