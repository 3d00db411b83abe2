#include "sync/cross_storage.hpp"

#include "storage/virtual_path.hpp"

#include <spdlog/spdlog.h>

namespace TierFS::Sync
{

using Storage::StorageErrc;

CrossStorageTransfer::CrossStorageTransfer(
    Hydration::HydrationOrchestrator &from, Hydration::HydrationOrchestrator &to
)
    : from_(from), to_(to)
{
}

StorageResult<CrossStorageResult> CrossStorageTransfer::Run(
    const std::vector<std::string> &from_paths, const std::string &to_dir,
    const CrossStorageOptions &options
)
{
    if (from_paths.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidArgument));
    }
    const auto dest_root = Storage::NormalizeVirtualPath(to_dir);
    auto dest_meta       = to_.GetAdapter()->Stat(dest_root);
    if (!dest_meta) {
        spdlog::error(
            "Transfer target {}:{} unusable: {}", to_.GetSourceId(), dest_root,
            dest_meta.error().message()
        );
        return std::unexpected(dest_meta.error());
    }
    if (!dest_meta->is_directory) {
        return std::unexpected(make_error_code(StorageErrc::NotADirectory));
    }

    spdlog::info(
        "{} {} entries from {} to {}:{}", options.delete_source ? "Moving" : "Copying",
        from_paths.size(), from_.GetSourceId(), to_.GetSourceId(), dest_root
    );

    CrossStorageResult result;
    bool all_deleted = true;
    for (const auto &raw : from_paths) {
        const auto path = Storage::NormalizeVirtualPath(raw);
        auto entry      = from_.GetAdapter()->Stat(path);
        if (!entry) {
            RecordError_(result, path, entry.error());
            ++result.files_failed;
            all_deleted = false;
            continue;
        }
        if (entry->is_directory && !options.recursive) {
            RecordError_(result, path, make_error_code(StorageErrc::IsADirectory));
            ++result.files_failed;
            all_deleted = false;
            continue;
        }

        const auto to_path =
            Storage::JoinVirtualPath(dest_root, Storage::VirtualFileName(path));
        const bool complete = TransferEntry_(*entry, to_path, options, result);

        if (!options.delete_source) {
            continue;
        }
        if (!complete) {
            spdlog::warn("Keeping source {} after incomplete transfer", path);
            all_deleted = false;
            continue;
        }
        // Orchestrator delete drops cached copies of the whole subtree as well.
        if (auto res = from_.Delete(path); !res) {
            RecordError_(result, path, res.error());
            all_deleted = false;
        }
    }
    result.source_deleted = options.delete_source && all_deleted;
    return result;
}

bool CrossStorageTransfer::TransferEntry_(
    const Storage::VirtualFile &entry, const std::string &to_path,
    const CrossStorageOptions &options, CrossStorageResult &result
)
{
    if (!entry.is_directory) {
        return TransferFile_(entry, to_path, options, result);
    }

    auto dest = to_.GetAdapter();
    auto exists = dest->Exists(to_path);
    if (!exists) {
        RecordError_(result, to_path, exists.error());
        ++result.files_failed;
        return false;
    }
    if (!*exists) {
        if (auto res = dest->CreateDirectory(to_path); !res) {
            RecordError_(result, to_path, res.error());
            ++result.files_failed;
            return false;
        }
        ++result.directories_created;
    }

    auto children = from_.GetAdapter()->List(entry.path);
    if (!children) {
        RecordError_(result, entry.path, children.error());
        ++result.files_failed;
        return false;
    }
    bool complete = true;
    for (const auto &child : *children) {
        const auto child_to = Storage::JoinVirtualPath(to_path, child.name);
        complete &= TransferEntry_(child, child_to, options, result);
    }
    return complete;
}

bool CrossStorageTransfer::TransferFile_(
    const Storage::VirtualFile &entry, const std::string &to_path,
    const CrossStorageOptions &options, CrossStorageResult &result
)
{
    auto dest = to_.GetAdapter();
    if (!options.overwrite) {
        auto exists = dest->Exists(to_path);
        if (!exists) {
            RecordError_(result, to_path, exists.error());
            ++result.files_failed;
            return false;
        }
        if (*exists) {
            RecordError_(result, to_path, make_error_code(StorageErrc::AlreadyExists));
            ++result.files_failed;
            return false;
        }
    }

    // Cache-aside read, so a cached copy avoids touching a cold backend.
    auto data = from_.Read(entry.path);
    if (!data) {
        RecordError_(result, entry.path, data.error());
        ++result.files_failed;
        return false;
    }
    if (auto res = dest->Write(to_path, *data); !res) {
        RecordError_(result, to_path, res.error());
        ++result.files_failed;
        return false;
    }
    to_.Dehydrate(to_path);

    if (options.preserve_metadata && dest->SupportsFileOperations()) {
        auto res = dest->SetTimes(to_path, entry.last_accessed, entry.last_modified);
        if (!res && res.error() != make_error_code(StorageErrc::Unsupported)) {
            spdlog::debug("Could not carry timestamps to {}: {}", to_path, res.error().message());
        }
    }

    ++result.files_transferred;
    result.bytes_transferred += data->size();
    result.transferred_paths.push_back(to_path);
    spdlog::debug("Transferred {} -> {} ({} bytes)", entry.path, to_path, data->size());
    return true;
}

void CrossStorageTransfer::RecordError_(
    CrossStorageResult &result, const std::string &path, const std::error_code &ec
)
{
    spdlog::warn("Transfer of {} failed: {}", path, ec.message());
    result.errors.push_back(path + ": " + ec.message());
}

}  // namespace TierFS::Sync
