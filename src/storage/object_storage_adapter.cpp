#include "storage/object_storage_adapter.hpp"

#include "storage/virtual_path.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace TierFS::Storage
{

namespace
{

std::unexpected<std::error_code> Errc(StorageErrc errc)
{
    return std::unexpected(make_error_code(errc));
}

std::string NormalizePrefix(const std::string& prefix)
{
    std::string key = VirtualPathToKey(NormalizeVirtualPath(prefix));
    if (!key.empty()) {
        key += '/';
    }
    return key;
}

FileStat ObjectStat(const ObjectInfo& info)
{
    FileStat st;
    st.size     = info.size;
    st.mode     = 0644;
    st.accessed = info.last_modified;
    st.modified = info.last_modified;
    st.created  = info.last_modified;
    return st;
}

FileStat PrefixStat()
{
    FileStat st;
    st.is_directory = true;
    st.mode         = 0755;
    return st;
}

}  // namespace

ObjectStorageAdapter::ObjectStorageAdapter(
    std::shared_ptr<IObjectClient> client, std::string bucket, std::string prefix,
    std::string default_storage_class
)
    : client_(std::move(client)),
      bucket_(std::move(bucket)),
      prefix_(NormalizePrefix(prefix)),
      default_storage_class_(std::move(default_storage_class))
{
}

//------------------------------------------------------------------------------//
// Key Mapping
//------------------------------------------------------------------------------//

StorageResult<ObjectStorageAdapter::Location> ObjectStorageAdapter::Locate(
    const std::string& path
) const
{
    auto resolved = ResolveVirtualPath(path);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    Location loc;
    loc.virtual_path    = *resolved;
    const auto relative = VirtualPathToKey(loc.virtual_path);
    loc.is_root         = relative.empty();
    loc.key             = prefix_ + relative;
    return loc;
}

std::string ObjectStorageAdapter::DirPrefixOf(const Location& loc) const
{
    return loc.is_root ? prefix_ : loc.key + "/";
}

StorageResult<std::optional<ObjectInfo>> ObjectStorageAdapter::HeadIfExists(const std::string& key)
{
    auto head = client_->HeadObject(key);
    if (head) {
        return std::optional<ObjectInfo>{std::move(*head)};
    }
    if (head.error() == StorageErrc::NotFound) {
        return std::optional<ObjectInfo>{};
    }
    return std::unexpected(head.error());
}

StorageResult<ObjectStorageAdapter::EntryKind> ObjectStorageAdapter::Classify(const Location& loc)
{
    if (loc.is_root) {
        return EntryKind::Prefix;
    }
    auto head = HeadIfExists(loc.key);
    if (!head) {
        return std::unexpected(head.error());
    }
    if (*head) {
        return EntryKind::Object;
    }
    auto children = client_->ListObjects(DirPrefixOf(loc));
    if (!children) {
        return std::unexpected(children.error());
    }
    return children->empty() ? EntryKind::Missing : EntryKind::Prefix;
}

VirtualFile ObjectStorageAdapter::BuildFile(
    const std::string& virtual_path, const ObjectInfo& info
) const
{
    VirtualFile file = MakeVirtualFile(virtual_path, ObjectStat(info));
    TierProbe probe;
    probe.storage_class = info.storage_class;
    probe.last_accessed = info.last_modified;
    file.tier_status    = DetectTier(GetTierStrategy(), probe);
    return file;
}

VirtualFile ObjectStorageAdapter::BuildDirectory(const std::string& virtual_path) const
{
    VirtualFile dir = MakeVirtualFile(virtual_path, PrefixStat());
    dir.tier_status = TierStatus::Hot();
    return dir;
}

StorageResult<void> ObjectStorageAdapter::DeletePrefix(const std::string& dir_prefix)
{
    auto objects = client_->ListObjects(dir_prefix);
    if (!objects) {
        return std::unexpected(objects.error());
    }
    for (const auto& object : *objects) {
        auto res = client_->DeleteObject(object.key);
        if (!res && res.error() != StorageErrc::NotFound) {
            return res;
        }
    }
    return {};
}

StorageResult<void> ObjectStorageAdapter::PutPreservingClass(
    const std::string& key, std::span<const std::byte> data
)
{
    auto head = HeadIfExists(key);
    if (!head) {
        return std::unexpected(head.error());
    }
    const std::string& storage_class =
        *head ? (*head)->storage_class : default_storage_class_;
    return client_->PutObject(key, data, storage_class);
}

//------------------------------------------------------------------------------//
// Lifecycle
//------------------------------------------------------------------------------//

StorageResult<void> ObjectStorageAdapter::Initialize()
{
    if (auto res = client_->Open(); !res) {
        spdlog::error("Object store {}: open failed: {}", bucket_, res.error().message());
        return res;
    }
    auto reachable = client_->Ping();
    if (!reachable) {
        return std::unexpected(reachable.error());
    }
    if (!*reachable) {
        spdlog::error("Object store {} is not reachable", bucket_);
        return Errc(StorageErrc::Unavailable);
    }
    spdlog::info("Object store {} ready (prefix '{}')", bucket_, prefix_);
    return {};
}

StorageResult<void> ObjectStorageAdapter::Shutdown() { return {}; }

//------------------------------------------------------------------------------//
// Basic Contract
//------------------------------------------------------------------------------//

StorageResult<std::vector<VirtualFile>> ObjectStorageAdapter::List(const std::string& path)
{
    spdlog::trace("List({}) in bucket {}", path, bucket_);
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind == EntryKind::Missing) {
        return Errc(StorageErrc::NotFound);
    }
    if (*kind == EntryKind::Object) {
        return Errc(StorageErrc::NotADirectory);
    }

    const auto dir_prefix = DirPrefixOf(*loc);
    auto objects          = client_->ListObjects(dir_prefix);
    if (!objects) {
        return std::unexpected(objects.error());
    }

    std::vector<VirtualFile> entries;
    std::set<std::string> directories;
    for (const auto& object : *objects) {
        const auto rest = object.key.substr(dir_prefix.size());
        if (rest.empty()) {
            continue;  // the directory marker itself
        }
        const auto slash = rest.find('/');
        if (slash == std::string::npos) {
            entries.push_back(BuildFile(JoinVirtualPath(loc->virtual_path, rest), object));
        } else {
            directories.insert(rest.substr(0, slash));
        }
    }
    for (const auto& name : directories) {
        entries.push_back(BuildDirectory(JoinVirtualPath(loc->virtual_path, name)));
    }
    SortDirectoryListing(entries);
    return entries;
}

StorageResult<Bytes> ObjectStorageAdapter::Read(const std::string& path)
{
    spdlog::trace("Read({}) in bucket {}", path, bucket_);
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    if (loc->is_root) {
        return Errc(StorageErrc::IsADirectory);
    }
    auto data = client_->GetObject(loc->key);
    if (!data && data.error() == StorageErrc::NotFound) {
        auto kind = Classify(*loc);
        if (kind && *kind == EntryKind::Prefix) {
            return Errc(StorageErrc::IsADirectory);
        }
    }
    return data;
}

StorageResult<Bytes> ObjectStorageAdapter::ReadRange(
    const std::string& path, std::uint64_t offset, std::uint64_t length
)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    if (loc->is_root) {
        return Errc(StorageErrc::IsADirectory);
    }
    auto data = client_->GetObjectRange(loc->key, offset, length);
    if (!data && data.error() == StorageErrc::NotFound) {
        auto kind = Classify(*loc);
        if (kind && *kind == EntryKind::Prefix) {
            return Errc(StorageErrc::IsADirectory);
        }
    }
    return data;
}

StorageResult<void> ObjectStorageAdapter::Write(
    const std::string& path, std::span<const std::byte> data
)
{
    spdlog::trace("Write({}, {} bytes) in bucket {}", path, data.size(), bucket_);
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    if (loc->is_root) {
        return Errc(StorageErrc::IsADirectory);
    }
    auto children = client_->ListObjects(DirPrefixOf(*loc));
    if (!children) {
        return std::unexpected(children.error());
    }
    if (!children->empty()) {
        return Errc(StorageErrc::IsADirectory);
    }
    return client_->PutObject(loc->key, data, default_storage_class_);
}

StorageResult<void> ObjectStorageAdapter::Delete(const std::string& path)
{
    spdlog::trace("Delete({}) in bucket {}", path, bucket_);
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    if (loc->is_root) {
        return Errc(StorageErrc::InvalidPath);
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    switch (*kind) {
        case EntryKind::Missing:
            return Errc(StorageErrc::NotFound);
        case EntryKind::Object:
            return client_->DeleteObject(loc->key);
        case EntryKind::Prefix:
            return DeletePrefix(DirPrefixOf(*loc));
    }
    return Errc(StorageErrc::Internal);
}

StorageResult<void> ObjectStorageAdapter::CreateDirectory(const std::string& path)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    if (loc->is_root) {
        return {};
    }
    auto head = HeadIfExists(loc->key);
    if (!head) {
        return std::unexpected(head.error());
    }
    if (*head) {
        return Errc(StorageErrc::AlreadyExists);
    }
    return client_->PutObject(DirPrefixOf(*loc), {}, default_storage_class_);
}

StorageResult<bool> ObjectStorageAdapter::Exists(const std::string& path)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    return *kind != EntryKind::Missing;
}

StorageResult<VirtualFile> ObjectStorageAdapter::Stat(const std::string& path)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    if (loc->is_root) {
        return BuildDirectory(loc->virtual_path);
    }
    auto head = HeadIfExists(loc->key);
    if (!head) {
        return std::unexpected(head.error());
    }
    if (*head) {
        return BuildFile(loc->virtual_path, **head);
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind == EntryKind::Missing) {
        return Errc(StorageErrc::NotFound);
    }
    return BuildDirectory(loc->virtual_path);
}

StorageResult<std::uint64_t> ObjectStorageAdapter::FileSize(const std::string& path)
{
    auto st = StatEntry(path);
    if (!st) {
        return std::unexpected(st.error());
    }
    if (st->is_directory) {
        return Errc(StorageErrc::IsADirectory);
    }
    return st->size;
}

StorageResult<bool> ObjectStorageAdapter::TestConnection() { return client_->Ping(); }

//------------------------------------------------------------------------------//
// File Operations Surface
//------------------------------------------------------------------------------//

StorageResult<FileStat> ObjectStorageAdapter::StatEntry(const std::string& path)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    if (loc->is_root) {
        return PrefixStat();
    }
    auto head = HeadIfExists(loc->key);
    if (!head) {
        return std::unexpected(head.error());
    }
    if (*head) {
        return ObjectStat(**head);
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind == EntryKind::Missing) {
        return Errc(StorageErrc::NotFound);
    }
    return PrefixStat();
}

StorageResult<void> ObjectStorageAdapter::Rename(const std::string& from, const std::string& to)
{
    return Move(from, to, MoveOptions{.overwrite = true});
}

StorageResult<void> ObjectStorageAdapter::Copy(
    const std::string& from, const std::string& to, const CopyOptions& options
)
{
    spdlog::trace("Copy({} -> {}) in bucket {}", from, to, bucket_);
    auto src = Locate(from);
    if (!src) {
        return std::unexpected(src.error());
    }
    auto dst = Locate(to);
    if (!dst) {
        return std::unexpected(dst.error());
    }
    auto src_kind = Classify(*src);
    if (!src_kind) {
        return std::unexpected(src_kind.error());
    }
    auto dst_kind = Classify(*dst);
    if (!dst_kind) {
        return std::unexpected(dst_kind.error());
    }
    if (*src_kind == EntryKind::Missing) {
        return Errc(StorageErrc::NotFound);
    }
    if (*dst_kind != EntryKind::Missing && !options.overwrite) {
        return Errc(StorageErrc::AlreadyExists);
    }

    if (*src_kind == EntryKind::Object) {
        if (*dst_kind == EntryKind::Prefix) {
            return Errc(StorageErrc::IsADirectory);
        }
        return client_->CopyObject(src->key, dst->key, std::nullopt);
    }

    if (!options.recursive) {
        return Errc(StorageErrc::IsADirectory);
    }
    if (*dst_kind == EntryKind::Object) {
        return Errc(StorageErrc::NotADirectory);
    }
    if (IsWithinVirtualPath(dst->virtual_path, src->virtual_path)) {
        return Errc(StorageErrc::InvalidArgument);
    }

    const auto src_prefix = DirPrefixOf(*src);
    const auto dst_prefix = DirPrefixOf(*dst);
    auto objects          = client_->ListObjects(src_prefix);
    if (!objects) {
        return std::unexpected(objects.error());
    }
    if (!dst->is_root) {
        if (auto res = client_->PutObject(dst_prefix, {}, default_storage_class_); !res) {
            return res;
        }
    }
    for (const auto& object : *objects) {
        const auto rest = object.key.substr(src_prefix.size());
        if (rest.empty()) {
            continue;
        }
        if (auto res = client_->CopyObject(object.key, dst_prefix + rest, std::nullopt); !res) {
            spdlog::error("Copy of {} failed: {}", object.key, res.error().message());
            return res;
        }
    }
    return {};
}

StorageResult<void> ObjectStorageAdapter::Move(
    const std::string& from, const std::string& to, const MoveOptions& options
)
{
    CopyOptions copy_options;
    copy_options.overwrite = options.overwrite;
    copy_options.recursive = true;
    if (auto res = Copy(from, to, copy_options); !res) {
        return res;
    }
    return Delete(from);
}

StorageResult<void> ObjectStorageAdapter::RemoveDirectory(const std::string& path)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    if (loc->is_root) {
        return Errc(StorageErrc::InvalidPath);
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind == EntryKind::Missing) {
        return Errc(StorageErrc::NotFound);
    }
    if (*kind == EntryKind::Object) {
        return Errc(StorageErrc::NotADirectory);
    }
    const auto marker = DirPrefixOf(*loc);
    auto objects      = client_->ListObjects(marker);
    if (!objects) {
        return std::unexpected(objects.error());
    }
    const bool has_children = std::ranges::any_of(*objects, [&marker](const ObjectInfo& o) {
        return o.key != marker;
    });
    if (has_children) {
        return Errc(StorageErrc::NotEmpty);
    }
    return client_->DeleteObject(marker);
}

StorageResult<void> ObjectStorageAdapter::RemoveRecursive(const std::string& path)
{
    return Delete(path);
}

StorageResult<void> ObjectStorageAdapter::CreateDirectories(const std::string& path)
{
    // Intermediate prefixes exist implicitly once the leaf marker does.
    return CreateDirectory(path);
}

StorageResult<void> ObjectStorageAdapter::Append(
    const std::string& path, std::span<const std::byte> data
)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind == EntryKind::Prefix) {
        return Errc(StorageErrc::IsADirectory);
    }
    Bytes content;
    if (*kind == EntryKind::Object) {
        auto existing = client_->GetObject(loc->key);
        if (!existing) {
            return std::unexpected(existing.error());
        }
        content = std::move(*existing);
    }
    content.insert(content.end(), data.begin(), data.end());
    return PutPreservingClass(loc->key, content);
}

StorageResult<std::size_t> ObjectStorageAdapter::WriteAt(
    const std::string& path, std::uint64_t offset, std::span<const std::byte> data
)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind == EntryKind::Prefix) {
        return Errc(StorageErrc::IsADirectory);
    }
    Bytes content;
    if (*kind == EntryKind::Object) {
        auto existing = client_->GetObject(loc->key);
        if (!existing) {
            return std::unexpected(existing.error());
        }
        content = std::move(*existing);
    }
    if (content.size() < offset + data.size()) {
        content.resize(offset + data.size());
    }
    std::ranges::copy(data, content.begin() + static_cast<std::ptrdiff_t>(offset));
    if (auto res = PutPreservingClass(loc->key, content); !res) {
        return std::unexpected(res.error());
    }
    return data.size();
}

StorageResult<void> ObjectStorageAdapter::Truncate(const std::string& path, std::uint64_t size)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    if (loc->is_root) {
        return Errc(StorageErrc::IsADirectory);
    }
    auto content = client_->GetObject(loc->key);
    if (!content) {
        return std::unexpected(content.error());
    }
    content->resize(size);
    return PutPreservingClass(loc->key, *content);
}

StorageResult<void> ObjectStorageAdapter::Touch(const std::string& path)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    switch (*kind) {
        case EntryKind::Prefix:
            return {};
        case EntryKind::Object:
            return client_->CopyObject(loc->key, loc->key, std::nullopt);
        case EntryKind::Missing:
            return client_->PutObject(loc->key, {}, default_storage_class_);
    }
    return Errc(StorageErrc::Internal);
}

StorageResult<void> ObjectStorageAdapter::ChangeStorageClass(
    const std::string& path, const std::string& storage_class
)
{
    auto loc = Locate(path);
    if (!loc) {
        return std::unexpected(loc.error());
    }
    auto kind = Classify(*loc);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind == EntryKind::Missing) {
        return Errc(StorageErrc::NotFound);
    }
    if (*kind == EntryKind::Prefix) {
        return Errc(StorageErrc::IsADirectory);
    }
    spdlog::debug("Storage class of {} -> {}", loc->key, storage_class);
    return client_->CopyObject(loc->key, loc->key, storage_class);
}

}  // namespace TierFS::Storage
