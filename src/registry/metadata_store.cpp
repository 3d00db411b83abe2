#include "registry/metadata_store.hpp"

#include "storage/virtual_path.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace TierFS::Registry
{

namespace
{

std::string KeyFor(const std::string &source_id, const std::string &path)
{
    return source_id + ":" + Storage::NormalizeVirtualPath(path);
}

nlohmann::json ToJson(const std::string &source_id, const std::string &path, const FileMetadata &m)
{
    nlohmann::json j{
        {"source_id", source_id},
        {"path", Storage::NormalizeVirtualPath(path)},
        {"tags", m.tags},
        {"is_favorite", m.is_favorite},
    };
    if (m.color_label) {
        j["color_label"] = *m.color_label;
    }
    if (m.rating) {
        j["rating"] = *m.rating;
    }
    if (m.comment) {
        j["comment"] = *m.comment;
    }
    return j;
}

std::optional<FileMetadata> FromJson(const nlohmann::json &j)
{
    try {
        FileMetadata m;
        m.tags        = j.value("tags", std::vector<std::string>{});
        m.is_favorite = j.value("is_favorite", false);
        if (j.contains("color_label")) {
            m.color_label = j.at("color_label").get<std::string>();
        }
        if (j.contains("rating")) {
            m.rating = std::min<std::uint8_t>(j.at("rating").get<std::uint8_t>(), 5);
        }
        if (j.contains("comment")) {
            m.comment = j.at("comment").get<std::string>();
        }
        return m;
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Skipping malformed metadata record: {}", e.what());
        return std::nullopt;
    }
}

}  // namespace

void ApplyMetadata(Storage::VirtualFile &file, const FileMetadata &metadata)
{
    file.tags        = metadata.tags;
    file.is_favorite = metadata.is_favorite;
    file.color_label = metadata.color_label;
    file.SetRating(metadata.rating.value_or(0));
    file.comment = metadata.comment;
}

JsonMetadataStore::JsonMetadataStore(fs::path file_path) : store_(std::move(file_path)) {}

StorageResult<void> JsonMetadataStore::Load() { return store_.Load(); }

std::optional<FileMetadata> JsonMetadataStore::Get(
    const std::string &source_id, const std::string &path
) const
{
    auto record = store_.Get(KeyFor(source_id, path));
    if (!record) {
        return std::nullopt;
    }
    return FromJson(*record);
}

StorageResult<void> JsonMetadataStore::Set(
    const std::string &source_id, const std::string &path, const FileMetadata &metadata
)
{
    if (metadata.IsEmpty()) {
        return store_.Remove(KeyFor(source_id, path));
    }
    return store_.Put(KeyFor(source_id, path), ToJson(source_id, path, metadata));
}

StorageResult<void> JsonMetadataStore::Delete(const std::string &source_id, const std::string &path)
{
    return store_.Remove(KeyFor(source_id, path));
}

StorageResult<void> JsonMetadataStore::Modify_(
    const std::string &source_id, const std::string &path,
    const std::function<void(FileMetadata &)> &change
)
{
    const auto key = KeyFor(source_id, path);
    return store_.Update([&](std::map<std::string, nlohmann::json> &records) {
        FileMetadata current;
        if (auto it = records.find(key); it != records.end()) {
            current = FromJson(it->second).value_or(FileMetadata{});
        }
        change(current);
        if (current.IsEmpty()) {
            records.erase(key);
        } else {
            records[key] = ToJson(source_id, path, current);
        }
    });
}

StorageResult<void> JsonMetadataStore::AddTag(
    const std::string &source_id, const std::string &path, const std::string &tag
)
{
    if (tag.empty()) {
        return std::unexpected(make_error_code(Storage::StorageErrc::InvalidArgument));
    }
    return Modify_(source_id, path, [&tag](FileMetadata &m) {
        if (std::ranges::find(m.tags, tag) == m.tags.end()) {
            m.tags.push_back(tag);
        }
    });
}

StorageResult<void> JsonMetadataStore::RemoveTag(
    const std::string &source_id, const std::string &path, const std::string &tag
)
{
    return Modify_(source_id, path, [&tag](FileMetadata &m) {
        std::erase(m.tags, tag);
    });
}

StorageResult<bool> JsonMetadataStore::ToggleFavorite(
    const std::string &source_id, const std::string &path
)
{
    bool now_favorite = false;
    auto res          = Modify_(source_id, path, [&now_favorite](FileMetadata &m) {
        m.is_favorite = !m.is_favorite;
        now_favorite  = m.is_favorite;
    });
    if (!res) {
        return std::unexpected(res.error());
    }
    return now_favorite;
}

StorageResult<void> JsonMetadataStore::SetRating(
    const std::string &source_id, const std::string &path, std::optional<std::uint8_t> rating
)
{
    if (rating && *rating > 5) {
        return std::unexpected(make_error_code(Storage::StorageErrc::InvalidArgument));
    }
    return Modify_(source_id, path, [rating](FileMetadata &m) {
        m.rating = rating;
    });
}

template <typename Pred>
std::vector<std::string> JsonMetadataStore::Select_(const std::string &source_id, Pred pred) const
{
    std::vector<std::string> paths;
    for (const auto &[key, record] : store_.Snapshot()) {
        if (record.value("source_id", std::string{}) != source_id) {
            continue;
        }
        auto metadata = FromJson(record);
        if (metadata && pred(*metadata)) {
            paths.push_back(record.value("path", std::string{}));
        }
    }
    return paths;
}

std::vector<std::string> JsonMetadataStore::ListFavorites(const std::string &source_id) const
{
    return Select_(source_id, [](const FileMetadata &m) {
        return m.is_favorite;
    });
}

std::vector<std::string> JsonMetadataStore::ListByTag(
    const std::string &source_id, const std::string &tag
) const
{
    return Select_(source_id, [&tag](const FileMetadata &m) {
        return std::ranges::find(m.tags, tag) != m.tags.end();
    });
}

}  // namespace TierFS::Registry
