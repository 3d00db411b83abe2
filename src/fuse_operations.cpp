// clang-format off
#include "app_constants.hpp"
#include <fuse3/fuse.h>
#include "fuse_operations.hpp"
// clang-format on

#include "storage/posix_storage_adapter.hpp"
#include "storage/storage_error.hpp"

#include <spdlog/spdlog.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>

namespace TierFS::FuseOps
{

namespace
{

void FillStat(const Storage::VirtualFile &file, struct stat *stbuf)
{
    std::memset(stbuf, 0, sizeof(struct stat));
    // Read-only mount: drop every write bit
    const mode_t perms = file.mode & 0555;
    if (file.is_directory) {
        stbuf->st_mode  = S_IFDIR | (perms != 0 ? perms : 0555);
        stbuf->st_nlink = 2;
    } else {
        stbuf->st_mode  = S_IFREG | (perms != 0 ? perms : 0444);
        stbuf->st_nlink = 1;
    }
    stbuf->st_size   = static_cast<off_t>(file.size);
    stbuf->st_uid    = file.uid;
    stbuf->st_gid    = file.gid;
    stbuf->st_blocks = static_cast<blkcnt_t>((file.size + 511) / 512);
    stbuf->st_mtim   = Storage::ToTimespec(file.last_modified);
    stbuf->st_atim   = Storage::ToTimespec(file.last_accessed);
    stbuf->st_ctim   = stbuf->st_mtim;
}

}  // namespace

// FUSE Operation Implementations

int getattr(const char *path, struct stat *stbuf, struct fuse_file_info * /*fi*/)
{
    spdlog::debug("FUSE: getattr({})", path);
    FileSystemContext *ctx = get_context();
    if (!ctx || !ctx->registry) {
        return -EIO;
    }
    auto result = ctx->registry->Stat(ctx->source_id, path);
    if (!result) {
        return Storage::StorageResultToErrno(result);
    }
    FillStat(*result, stbuf);
    return 0;
}

int readdir(
    const char *path, void *buf, fuse_fill_dir_t filler, off_t /*offset*/,
    struct fuse_file_info * /*fi*/, enum fuse_readdir_flags /*flags*/
)
{
    spdlog::debug("FUSE: readdir({})", path);
    FileSystemContext *ctx = get_context();
    if (!ctx || !ctx->registry) {
        return -EIO;
    }

    auto list_res = ctx->registry->ListFiles(ctx->source_id, path);
    if (!list_res) {
        return Storage::StorageResultToErrno(list_res);
    }

    filler(buf, ".", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    filler(buf, "..", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    for (const auto &entry : list_res.value()) {
        struct stat st;
        FillStat(entry, &st);
        if (filler(buf, entry.name.c_str(), &st, 0, static_cast<fuse_fill_dir_flags>(0)) != 0) {
            spdlog::warn("FUSE readdir: filler buffer full for path {}", path);
            return -ENOMEM;
        }
    }
    return 0;
}

int open(const char *path, struct fuse_file_info *fi)
{
    spdlog::trace("FUSE open called for path: {}, flags={:#x}", path, fi->flags);
    if ((fi->flags & O_ACCMODE) != O_RDONLY || (fi->flags & (O_TRUNC | O_APPEND | O_CREAT))) {
        return -EROFS;
    }
    FileSystemContext *ctx = get_context();
    if (!ctx || !ctx->registry) {
        return -EIO;
    }
    auto result = ctx->registry->Stat(ctx->source_id, path);
    if (!result) {
        return Storage::StorageResultToErrno(result);
    }
    if (result->is_directory) {
        return -EISDIR;
    }
    return 0;
}

int read(const char *path, char *buf, size_t size, off_t offset, struct fuse_file_info * /*fi*/)
{
    spdlog::trace("FUSE read called for path: {}, size={}, offset={}", path, size, offset);
    if (offset < 0) {
        return -EINVAL;
    }
    FileSystemContext *ctx = get_context();
    if (!ctx || !ctx->registry) {
        return -EIO;
    }
    auto result = ctx->registry->ReadRange(
        ctx->source_id, path, static_cast<std::uint64_t>(offset), static_cast<std::uint64_t>(size)
    );
    if (!result) {
        return Storage::StorageResultToErrno(result);
    }
    const size_t n = std::min(size, result->size());
    std::memcpy(buf, result->data(), n);
    return static_cast<int>(n);
}

int release(const char *path, struct fuse_file_info * /*fi*/)
{
    spdlog::trace("FUSE release called for path: {}", path);
    return 0;
}

int opendir(const char *path, struct fuse_file_info * /*fi*/)
{
    spdlog::trace("FUSE opendir called for {}", path);
    FileSystemContext *ctx = get_context();
    if (!ctx || !ctx->registry) {
        return -EIO;
    }
    auto result = ctx->registry->Stat(ctx->source_id, path);
    if (!result) {
        return Storage::StorageResultToErrno(result);
    }
    if (!result->is_directory) {
        return -ENOTDIR;
    }
    return 0;
}

int releasedir(const char *path, struct fuse_file_info * /*fi*/)
{
    spdlog::trace("FUSE releasedir called for {}", path);
    return 0;
}

int statfs(const char *path, struct statvfs *stbuf)
{
    spdlog::trace("FUSE statfs called for {}", path);
    std::memset(stbuf, 0, sizeof(struct statvfs));
    stbuf->f_bsize   = 4096;
    stbuf->f_frsize  = 4096;
    stbuf->f_namemax = 255;
    stbuf->f_flag    = ST_RDONLY;
    return 0;
}

int mknod(const char *path, mode_t, dev_t)
{
    spdlog::debug("FUSE mknod refused on read-only mount: {}", path);
    return -EROFS;
}
int mkdir(const char *path, mode_t)
{
    spdlog::debug("FUSE mkdir refused on read-only mount: {}", path);
    return -EROFS;
}
int unlink(const char *path)
{
    spdlog::debug("FUSE unlink refused on read-only mount: {}", path);
    return -EROFS;
}
int rmdir(const char *path)
{
    spdlog::debug("FUSE rmdir refused on read-only mount: {}", path);
    return -EROFS;
}
int rename(const char *from, const char *, unsigned int)
{
    spdlog::debug("FUSE rename refused on read-only mount: {}", from);
    return -EROFS;
}
int chmod(const char *, mode_t, fuse_file_info *) { return -EROFS; }
int chown(const char *, uid_t, gid_t, fuse_file_info *) { return -EROFS; }
int truncate(const char *, off_t, fuse_file_info *) { return -EROFS; }
int write(const char *, const char *, size_t, off_t, fuse_file_info *) { return -EROFS; }

// Function to populate the fuse_operations struct
fuse_operations get_fuse_operations()
{
    fuse_operations ops = {};

    ops.getattr    = TierFS::FuseOps::getattr;
    ops.readdir    = TierFS::FuseOps::readdir;
    ops.mknod      = TierFS::FuseOps::mknod;
    ops.mkdir      = TierFS::FuseOps::mkdir;
    ops.unlink     = TierFS::FuseOps::unlink;
    ops.rmdir      = TierFS::FuseOps::rmdir;
    ops.rename     = TierFS::FuseOps::rename;
    ops.chmod      = TierFS::FuseOps::chmod;
    ops.chown      = TierFS::FuseOps::chown;
    ops.truncate   = TierFS::FuseOps::truncate;
    ops.open       = TierFS::FuseOps::open;
    ops.read       = TierFS::FuseOps::read;
    ops.write      = TierFS::FuseOps::write;
    ops.statfs     = TierFS::FuseOps::statfs;
    ops.release    = TierFS::FuseOps::release;
    ops.opendir    = TierFS::FuseOps::opendir;
    ops.releasedir = TierFS::FuseOps::releasedir;

    return ops;
}

}  // namespace TierFS::FuseOps
