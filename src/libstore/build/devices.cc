#include "arbor/store/build/devices.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/json-utils.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/signals.hh"

#include <fcntl.h>
#include <linux/loop.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <sys/stat.h>

#include <cstring>

namespace arbor {

LoopOptions parseLoopOptions(const nlohmann::json & options, const Path & treeDir)
{
    auto & obj = getObject(options);

    LoopOptions res;

    /* Devices stacked on a parent have no file of their own. */
    if (auto v = optionalValueAt(obj, "filename")) {
        auto & filename = getString(*v);
        res.filename = canonPath(treeDir + "/" + filename);
        if (!isInDir(res.filename, canonPath(treeDir)))
            throw SandboxError("loop device file '%s' is outside of the tree", filename);
    }

    if (auto v = optionalValueAt(obj, "start"))
        res.start = getUnsigned(*v);
    if (auto v = optionalValueAt(obj, "size"))
        res.size = getUnsigned(*v);
    if (auto v = optionalValueAt(obj, "sector-size"))
        res.sectorSize = getUnsigned(*v);
    if (auto v = optionalValueAt(obj, "lock"))
        res.lock = getBoolean(*v);
    if (auto v = optionalValueAt(obj, "partscan"))
        res.partscan = getBoolean(*v);
    if (auto v = optionalValueAt(obj, "read-only"))
        res.readOnly = getBoolean(*v);

    if (res.sectorSize < 512 || (res.sectorSize & (res.sectorSize - 1)))
        throw SandboxError("invalid loop device sector size %d", res.sectorSize);

    return res;
}

LoopDevice attachLoopDevice(const LoopOptions & options)
{
    AutoCloseFD backing = open(options.filename.c_str(), (options.readOnly ? O_RDONLY : O_RDWR) | O_CLOEXEC);
    if (!backing)
        throw SysError("opening loop device backing file '%s'", options.filename);

    AutoCloseFD control = open("/dev/loop-control", O_RDWR | O_CLOEXEC);
    if (!control)
        throw SysError("opening '/dev/loop-control'");

    LoopDevice dev;

    /* Another process may grab the free device between
       LOOP_CTL_GET_FREE and LOOP_SET_FD; keep trying. */
    while (true) {
        checkInterrupt();

        int n = ioctl(control.get(), LOOP_CTL_GET_FREE);
        if (n == -1)
            throw SysError("finding a free loop device");

        dev.path = fmt("/dev/loop%d", n);
        dev.fd = open(dev.path.c_str(), (options.readOnly ? O_RDONLY : O_RDWR) | O_CLOEXEC);
        if (!dev.fd)
            throw SysError("opening '%s'", dev.path);

        if (ioctl(dev.fd.get(), LOOP_SET_FD, backing.get()) == 0)
            break;
        if (errno != EBUSY)
            throw SysError("attaching '%s' to '%s'", options.filename, dev.path);

        debug("loop device '%s' was taken, retrying", dev.path);
    }

    try {
        if (options.sectorSize != 512 && ioctl(dev.fd.get(), LOOP_SET_BLOCK_SIZE, options.sectorSize) == -1)
            throw SysError("setting the sector size of '%s'", dev.path);

        struct loop_info64 info;
        memset(&info, 0, sizeof(info));
        info.lo_offset = options.start * options.sectorSize;
        info.lo_sizelimit = options.size * options.sectorSize;
        info.lo_flags = LO_FLAGS_AUTOCLEAR;
        if (options.partscan)
            info.lo_flags |= LO_FLAGS_PARTSCAN;
        if (options.readOnly)
            info.lo_flags |= LO_FLAGS_READ_ONLY;
        strncpy((char *) info.lo_file_name, options.filename.c_str(), LO_NAME_SIZE - 1);

        if (ioctl(dev.fd.get(), LOOP_SET_STATUS64, &info) == -1)
            throw SysError("configuring loop device '%s'", dev.path);

        if (options.lock && flock(dev.fd.get(), LOCK_EX) == -1)
            throw SysError("locking loop device '%s'", dev.path);

        struct stat st;
        if (fstat(dev.fd.get(), &st) == -1)
            throw SysError("getting attributes of '%s'", dev.path);
        dev.rdev = st.st_rdev;
    } catch (...) {
        ioctl(dev.fd.get(), LOOP_CLR_FD, 0);
        throw;
    }

    debug("attached '%s' to '%s'", options.filename, dev.path);

    return dev;
}

void detachLoopDevice(LoopDevice & device)
{
    if (!device.fd)
        return;

    if (ioctl(device.fd.get(), LOOP_CLR_FD, 0) == -1) {
        if (errno != EBUSY && errno != ENXIO)
            throw SysError("detaching loop device '%s'", device.path);

        if (errno == EBUSY) {
            struct loop_info64 info;
            if (ioctl(device.fd.get(), LOOP_GET_STATUS64, &info) == -1)
                throw SysError("getting status of loop device '%s'", device.path);
            info.lo_flags |= LO_FLAGS_AUTOCLEAR;
            if (ioctl(device.fd.get(), LOOP_SET_STATUS64, &info) == -1)
                throw SysError("setting autoclear on busy loop device '%s'", device.path);
            debug("loop device '%s' is busy; it will be detached when released", device.path);
        }
    }

    device.fd.close();
    debug("detached loop device '%s'", device.path);
}

} // namespace arbor
