#ifndef TIERFS_SRC_STORAGE_VIRTUAL_PATH_HPP_
#define TIERFS_SRC_STORAGE_VIRTUAL_PATH_HPP_

#include "storage/storage_error.hpp"
#include "storage/storage_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace TierFS::Storage
{

// Virtual paths are forward-slash, source-relative and always rooted ("/a/b").

/// Collapses separators and "." segments; ".." never climbs above "/".
std::string NormalizeVirtualPath(std::string_view path);

/// Like NormalizeVirtualPath, but fails InvalidPath when ".." escapes the root.
StorageResult<std::string> ResolveVirtualPath(std::string_view path);

std::string VirtualFileName(std::string_view path);
std::string VirtualParent(std::string_view path);
std::string JoinVirtualPath(std::string_view base, std::string_view name);

/// Path without the leading '/', "" for the root.
std::string VirtualPathToKey(std::string_view path);

bool IsVirtualRoot(std::string_view path);

/// True when `path` equals `ancestor` or lies beneath it.
bool IsWithinVirtualPath(std::string_view path, std::string_view ancestor);

/// Directories first, then case-insensitive by name.
bool ListingOrderLess(const VirtualFile &lhs, const VirtualFile &rhs);
void SortDirectoryListing(std::vector<VirtualFile> &entries);

}  // namespace TierFS::Storage

#endif  // TIERFS_SRC_STORAGE_VIRTUAL_PATH_HPP_
