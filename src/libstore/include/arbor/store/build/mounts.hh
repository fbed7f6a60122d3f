#pragma once
///@file

#include "arbor/store/build/sandbox-error.hh"
#include "arbor/util/types.hh"

#include <optional>

#include <nlohmann/json.hpp>

namespace arbor {

/**
 * The kernel file system type of a mount type such as
 * `org.osbuild.ext4`. `org.osbuild.noop` maps to the empty string:
 * such mounts only create their mount point.
 *
 * @throws SandboxError for unknown mount types.
 */
std::string filesystemType(std::string_view mountType);

/**
 * Translate mount options to `mount(8)`-style option names, in a fixed
 * order: `ro`, `norecovery`, then `uid`, `gid`, `umask`, `shortname`,
 * `subvol` and `compress`.
 */
Strings translateMountOptions(const nlohmann::json & options);

/**
 * Translated options split into `mount(2)` flags and the data string
 * handed to the file system.
 */
struct MountFlags
{
    unsigned long flags = 0;
    std::string data;
};

MountFlags toMountFlags(const Strings & options);

/**
 * The identity of a device: its type, its parent's identity and its
 * options.
 */
std::string deviceId(
    const std::string & type, const std::optional<std::string> & parentId, const nlohmann::json & options);

/**
 * The identity of a mount: the SHA-256 of its type, device identity,
 * target and options, each serialized as JSON with sorted keys.
 */
std::string mountId(
    const std::string & type,
    const std::optional<std::string> & deviceId,
    const std::optional<std::string> & target,
    const nlohmann::json & options);

} // namespace arbor
