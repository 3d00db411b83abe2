#include "storage/filesystem_object_client.hpp"

#include "app_constants.hpp"
#include "common/digest.hpp"
#include "common/time_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace TierFS::Storage
{

namespace
{

std::unexpected<std::error_code> Errc(StorageErrc code)
{
    return std::unexpected(make_error_code(code));
}

}  // namespace

FilesystemObjectClient::FilesystemObjectClient(fs::path bucket_dir)
    : bucket_dir_(std::move(bucket_dir)),
      blob_dir_(bucket_dir_ / "objects"),
      manifest_(bucket_dir_ / Constants::OBJECT_MANIFEST_FILE)
{
}

StorageResult<void> FilesystemObjectClient::Open()
{
    std::error_code ec;
    fs::create_directories(blob_dir_, ec);
    if (ec) {
        spdlog::error("Cannot prepare bucket directory {}: {}", bucket_dir_.string(), ec.message());
        return std::unexpected(ec);
    }
    return manifest_.Load();
}

fs::path FilesystemObjectClient::BlobPathFor(const std::string& key) const
{
    return blob_dir_ / Common::Md5Hex(std::string_view{key});
}

StorageResult<void> FilesystemObjectClient::WriteBlob(
    const fs::path& blob_path, std::span<const std::byte> data
) const
{
    fs::path tmp = blob_path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Errc(StorageErrc::IOError);
        }
        out.write(
            reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size())
        );
        if (!out) {
            return Errc(StorageErrc::IOError);
        }
    }
    std::error_code ec;
    fs::rename(tmp, blob_path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Errc(StorageErrc::IOError);
    }
    return {};
}

ObjectInfo FilesystemObjectClient::InfoFromRecord(
    const std::string& key, const nlohmann::json& record
)
{
    ObjectInfo info;
    info.key           = key;
    info.size          = record.value("size", std::uint64_t{0});
    info.storage_class = record.value("storage_class", std::string{"STANDARD"});
    info.etag          = record.value("etag", std::string{});
    info.last_modified =
        Common::FromUnixMillis(record.value("last_modified_ms", std::int64_t{0}));
    return info;
}

nlohmann::json FilesystemObjectClient::RecordFromInfo(const ObjectInfo& info)
{
    return nlohmann::json{
        {"size", info.size},
        {"storage_class", info.storage_class},
        {"etag", info.etag},
        {"last_modified_ms", Common::ToUnixMillis(info.last_modified)},
    };
}

StorageResult<void> FilesystemObjectClient::PutObject(
    const std::string& key, std::span<const std::byte> data, const std::string& storage_class
)
{
    if (key.empty()) {
        return Errc(StorageErrc::InvalidArgument);
    }
    std::lock_guard lock(mutex_);
    if (auto res = WriteBlob(BlobPathFor(key), data); !res) {
        spdlog::error("PutObject {}: blob write failed", key);
        return res;
    }
    ObjectInfo info;
    info.key           = key;
    info.size          = data.size();
    info.storage_class = storage_class.empty() ? std::string{"STANDARD"} : storage_class;
    info.etag          = Common::Md5Hex(data);
    info.last_modified = Clock::now();
    return manifest_.Put(key, RecordFromInfo(info));
}

StorageResult<Bytes> FilesystemObjectClient::GetObject(const std::string& key)
{
    std::lock_guard lock(mutex_);
    const auto record = manifest_.Get(key);
    if (!record) {
        return Errc(StorageErrc::NotFound);
    }
    std::ifstream in(BlobPathFor(key), std::ios::binary);
    if (!in) {
        spdlog::error("GetObject {}: manifest entry without blob", key);
        return Errc(StorageErrc::IOError);
    }
    Bytes data(record->value("size", std::uint64_t{0}));
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<size_t>(in.gcount()) != data.size()) {
        return Errc(StorageErrc::IOError);
    }
    return data;
}

StorageResult<Bytes> FilesystemObjectClient::GetObjectRange(
    const std::string& key, std::uint64_t offset, std::uint64_t length
)
{
    std::lock_guard lock(mutex_);
    const auto record = manifest_.Get(key);
    if (!record) {
        return Errc(StorageErrc::NotFound);
    }
    const auto size = record->value("size", std::uint64_t{0});
    if (offset >= size || length == 0) {
        return Bytes{};
    }
    const auto count = std::min<std::uint64_t>(length, size - offset);
    std::ifstream in(BlobPathFor(key), std::ios::binary);
    if (!in) {
        return Errc(StorageErrc::IOError);
    }
    in.seekg(static_cast<std::streamoff>(offset));
    Bytes data(count);
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(count));
    if (static_cast<std::uint64_t>(in.gcount()) != count) {
        return Errc(StorageErrc::IOError);
    }
    return data;
}

StorageResult<ObjectInfo> FilesystemObjectClient::HeadObject(const std::string& key)
{
    const auto record = manifest_.Get(key);
    if (!record) {
        return Errc(StorageErrc::NotFound);
    }
    return InfoFromRecord(key, *record);
}

StorageResult<void> FilesystemObjectClient::DeleteObject(const std::string& key)
{
    std::lock_guard lock(mutex_);
    if (!manifest_.Get(key)) {
        return Errc(StorageErrc::NotFound);
    }
    if (auto res = manifest_.Remove(key); !res) {
        return res;
    }
    std::error_code ec;
    fs::remove(BlobPathFor(key), ec);
    if (ec) {
        spdlog::warn("DeleteObject {}: orphaned blob left behind: {}", key, ec.message());
    }
    return {};
}

StorageResult<std::vector<ObjectInfo>> FilesystemObjectClient::ListObjects(const std::string& prefix)
{
    std::vector<ObjectInfo> out;
    for (const auto& [key, record] : manifest_.Snapshot()) {
        if (key.starts_with(prefix)) {
            out.push_back(InfoFromRecord(key, record));
        }
    }
    return out;
}

StorageResult<void> FilesystemObjectClient::CopyObject(
    const std::string& source_key, const std::string& destination_key,
    const std::optional<std::string>& storage_class
)
{
    if (destination_key.empty()) {
        return Errc(StorageErrc::InvalidArgument);
    }
    std::lock_guard lock(mutex_);
    const auto record = manifest_.Get(source_key);
    if (!record) {
        return Errc(StorageErrc::NotFound);
    }
    auto info = InfoFromRecord(destination_key, *record);
    if (storage_class) {
        info.storage_class = *storage_class;
    }
    info.last_modified = Clock::now();

    if (source_key != destination_key) {
        std::error_code ec;
        fs::copy_file(
            BlobPathFor(source_key), BlobPathFor(destination_key),
            fs::copy_options::overwrite_existing, ec
        );
        if (ec) {
            spdlog::error("CopyObject {} -> {}: {}", source_key, destination_key, ec.message());
            return Errc(StorageErrc::IOError);
        }
    }
    return manifest_.Put(destination_key, RecordFromInfo(info));
}

StorageResult<bool> FilesystemObjectClient::Ping()
{
    std::error_code ec;
    return fs::is_directory(blob_dir_, ec);
}

}  // namespace TierFS::Storage
