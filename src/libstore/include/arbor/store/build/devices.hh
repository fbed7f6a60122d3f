#pragma once
///@file

#include "arbor/store/build/sandbox-error.hh"
#include "arbor/util/file-descriptor.hh"

#include <nlohmann/json_fwd.hpp>

namespace arbor {

/**
 * Options of an `org.osbuild.loopback` device. Offsets are in units of
 * `sectorSize`.
 */
struct LoopOptions
{
    /**
     * The backing file or block device, as a host path.
     */
    Path filename;
    uint64_t start = 0;

    /**
     * 0 means up to the end of the backing file.
     */
    uint64_t size = 0;
    unsigned int sectorSize = 512;
    bool lock = false;
    bool partscan = false;
    bool readOnly = false;
};

/**
 * Parse loop device options. `filename` is resolved relative to
 * `treeDir` and must stay inside it; it may be omitted for devices
 * that have a parent.
 */
LoopOptions parseLoopOptions(const nlohmann::json & options, const Path & treeDir);

/**
 * An attached loop device. Holding it open keeps the kernel from
 * reusing the device; `detachLoopDevice` releases it.
 */
struct LoopDevice
{
    /**
     * The device node, e.g. `/dev/loop3`.
     */
    Path path;

    dev_t rdev = 0;

    AutoCloseFD fd;
};

/**
 * Attach a free loop device to `options.filename` through
 * `/dev/loop-control`. Requires `CAP_SYS_ADMIN`.
 */
LoopDevice attachLoopDevice(const LoopOptions & options);

/**
 * Detach `device`. A device that is still busy is switched to
 * autoclear mode, so the kernel detaches it once the last user closes
 * it.
 */
void detachLoopDevice(LoopDevice & device);

} // namespace arbor
