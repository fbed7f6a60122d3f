#pragma once
///@file

#include "arbor/util/types.hh"

#include <optional>

#include <sys/mount.h>

namespace arbor {

/**
 * Recursively bind-mount `source` onto `target`, creating the mount
 * point (a directory or an empty file, depending on the type of
 * `source`). Symlinks cannot be bind-mounted and are copied instead.
 *
 * @param readOnly Remount the bind read-only afterwards.
 * @param optional Silently skip a missing `source`.
 */
void bindPath(const Path & source, const Path & target, bool readOnly = false, bool optional = false);

/**
 * Mount a file system of type `fsType` from `source` on `target`.
 * `data` is the comma-separated option string passed to the kernel.
 */
void mountFilesystem(
    const std::string & source,
    const Path & target,
    const std::string & fsType,
    unsigned long flags = 0,
    const std::string & data = "");

/**
 * Remount an existing mount point read-only, keeping its other flags.
 */
void remountReadOnly(const Path & target);

/**
 * Lazily detach the mount on `target`.
 */
void unmountPath(const Path & target);

/**
 * Make all mounts below `/` private to this mount namespace, so that
 * nothing mounted here propagates back to the parent namespace.
 */
void makeMountsPrivate();

} // namespace arbor
