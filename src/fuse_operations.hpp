#ifndef TIERFS_SRC_FUSE_OPERATIONS_HPP_
#define TIERFS_SRC_FUSE_OPERATIONS_HPP_

// clang-format off
#include "app_constants.hpp"
#include <fuse3/fuse.h>
// clang-format on

#include "config/config_types.hpp"
#include "registry/storage_registry.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace TierFS
{

struct FileSystemContext {
    Config::AppConfig config;
    std::string source_id;  ///< The one source exposed by this mount
    std::unique_ptr<Registry::StorageRegistry> registry = nullptr;
};

namespace FuseOps
{

inline FileSystemContext *get_context()
{
    if (!fuse_get_context() || !fuse_get_context()->private_data) {
        spdlog::critical("FUSE context not initialized or private data missing!");
        return nullptr;
    }
    return static_cast<FileSystemContext *>(fuse_get_context()->private_data);
}

// Declarations
int getattr(const char *path, struct stat *stbuf, struct fuse_file_info *fi);
int readdir(
    const char *path, void *buf, fuse_fill_dir_t filler, off_t offset, struct fuse_file_info *fi,
    enum fuse_readdir_flags flags
);
int open(const char *, fuse_file_info *);
int read(const char *, char *, size_t, off_t, fuse_file_info *);
int release(const char *, fuse_file_info *);
int opendir(const char *, fuse_file_info *);
int releasedir(const char *, fuse_file_info *);
int statfs(const char *, struct statvfs *);

// Mutations are refused on this read-only mount
int mknod(const char *, mode_t, dev_t);
int mkdir(const char *, mode_t);
int unlink(const char *);
int rmdir(const char *);
int rename(const char *, const char *, unsigned int);
int chmod(const char *, mode_t, fuse_file_info *);
int chown(const char *, uid_t, gid_t, fuse_file_info *);
int truncate(const char *, off_t, fuse_file_info *);
int write(const char *, const char *, size_t, off_t, fuse_file_info *);

// Get the initialized operations struct
fuse_operations get_fuse_operations();

}  // namespace FuseOps
}  // namespace TierFS

#endif  // TIERFS_SRC_FUSE_OPERATIONS_HPP_
