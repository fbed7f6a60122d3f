#pragma once
/**
 * @file
 *
 * Utilities for manipulating the file system.
 */

#include "arbor/util/types.hh"
#include "arbor/util/error.hh"
#include "arbor/util/file-descriptor.hh"

#include <filesystem>
#include <optional>
#include <utility>

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>

namespace arbor {

/**
 * @return An absolutized path, resolving paths relative to the
 * specified directory, or the current directory otherwise. The path
 * is also canonicalised.
 */
Path absPath(PathView path, std::optional<PathView> dir = {});

/**
 * Canonicalise a path by removing all `.` or `..` components and
 * double or trailing slashes.
 */
Path canonPath(PathView path);

/**
 * @return The directory part of the given canonical path, i.e.,
 * everything before the final `/`.
 */
Path dirOf(const PathView path);

/**
 * @return the base name of the given canonical path, i.e., everything
 * following the final `/` (trailing slashes are removed).
 */
std::string_view baseNameOf(std::string_view path);

/**
 * Check whether 'path' is a descendant of 'dir'. Both paths must be
 * canonicalized.
 */
bool isInDir(std::string_view path, std::string_view dir);

struct stat lstat(const Path & path);

/**
 * `lstat` the given path if it exists.
 * @return std::nullopt if the path doesn't exist, or an optional
 * containing the result of `lstat` otherwise
 */
std::optional<struct stat> maybeLstat(const Path & path);

/**
 * @return true iff the given path exists.
 */
bool pathExists(const Path & path);

/**
 * Read the contents of a file into a string.
 */
std::string readFile(const Path & path);

/**
 * Write a string to a file.
 */
void writeFile(const Path & path, std::string_view s, mode_t mode = 0666, bool sync = false);

/**
 * Flush a file's parent directory to disk.
 */
void syncParent(const Path & path);

/**
 * Delete a path; i.e., in the case of a directory, it is deleted
 * recursively. It's not an error if the path does not exist.
 */
void deletePath(const std::filesystem::path & path);

/**
 * Create a directory and all its parents, if necessary.
 */
void createDirs(const std::filesystem::path & path);

/**
 * Create a symlink.
 */
void createSymlink(const Path & target, const Path & link);

/**
 * Copy the directory tree `from` to `to`, preserving file modes,
 * ownership (where permitted), timestamps and symlinks. Regular files
 * are cloned with `FICLONE` where the file system supports it.
 */
void copyTree(const std::filesystem::path & from, const std::filesystem::path & to);

/**
 * Copy a single regular file, reflinking it if possible.
 */
void copyFile(const std::filesystem::path & from, const std::filesystem::path & to);

/**
 * Atomically rename `oldName` to `newName`. Throws `SysError` with the
 * errno of the failed rename, so that callers can detect `EEXIST` or
 * `ENOTEMPTY`.
 */
void renameFile(const Path & oldName, const Path & newName);

/**
 * Create a fresh directory below `tmpRoot`, or below `TMPDIR` (falling
 * back to `/tmp`) if `tmpRoot` is empty.
 */
Path createTempDir(const Path & tmpRoot = "", const Path & prefix = "arbor", mode_t mode = 0755);

/**
 * Deletes a path when destroyed, unless cancelled.
 */
class AutoDelete
{
    std::filesystem::path path_;
    bool armed = false;
    bool recursive = true;

public:
    AutoDelete() {}
    AutoDelete(const std::filesystem::path & p, bool recursive = true);

    AutoDelete(AutoDelete && other) noexcept
        : path_(std::move(other.path_))
        , armed(std::exchange(other.armed, false))
        , recursive(other.recursive)
    {
    }

    ~AutoDelete();

    void cancel()
    {
        armed = false;
    }

    void reset(const std::filesystem::path & p, bool recursive = true);

    const std::filesystem::path & path() const
    {
        return path_;
    }

    operator const std::filesystem::path &() const
    {
        return path_;
    }

    operator Path() const
    {
        return path_;
    }
};

} // namespace arbor
