#include "arbor/util/mount.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/logging.hh"

#include <sys/statvfs.h>

namespace arbor {

void bindPath(const Path & source, const Path & target, bool readOnly, bool optional)
{
    debug("bind mounting '%1%' to '%2%'", source, target);

    auto bindMount = [&]() {
        if (mount(source.c_str(), target.c_str(), "", MS_BIND | MS_REC, 0) == -1)
            throw SysError("bind mount from '%1%' to '%2%' failed", source, target);
        if (readOnly)
            remountReadOnly(target);
    };

    auto maybeSt = maybeLstat(source);
    if (!maybeSt) {
        if (optional)
            return;
        else
            throw SysError("getting attributes of path '%1%'", source);
    }
    auto st = *maybeSt;

    if (S_ISDIR(st.st_mode)) {
        createDirs(target);
        bindMount();
    } else if (S_ISLNK(st.st_mode)) {
        // Symlinks can (apparently) not be bind-mounted, so just copy it
        createDirs(dirOf(target));
        copyTree(source, target);
    } else {
        createDirs(dirOf(target));
        writeFile(target, "");
        bindMount();
    }
}

void mountFilesystem(
    const std::string & source, const Path & target, const std::string & fsType, unsigned long flags, const std::string & data)
{
    debug("mounting %s file system '%s' on '%s' (%s)", fsType, source, target, data);

    createDirs(target);
    if (mount(source.c_str(), target.c_str(), fsType.c_str(), flags, data.empty() ? nullptr : data.c_str()) == -1)
        throw SysError("mounting %s file system '%s' on '%s'", fsType, source, target);
}

void remountReadOnly(const Path & target)
{
    struct statvfs st;
    if (statvfs(target.c_str(), &st) == -1)
        throw SysError("getting mount flags of '%1%'", target);

    /* Locked flags inherited from the parent namespace must be
       carried over, or the kernel refuses the remount. */
    unsigned long flags = MS_REMOUNT | MS_BIND | MS_RDONLY;
    if (st.f_flag & ST_NOSUID)
        flags |= MS_NOSUID;
    if (st.f_flag & ST_NODEV)
        flags |= MS_NODEV;
    if (st.f_flag & ST_NOEXEC)
        flags |= MS_NOEXEC;
    if (st.f_flag & ST_NOATIME)
        flags |= MS_NOATIME;
    if (st.f_flag & ST_NODIRATIME)
        flags |= MS_NODIRATIME;
    if (st.f_flag & ST_RELATIME)
        flags |= MS_RELATIME;

    if (mount("", target.c_str(), "", flags, 0) == -1)
        throw SysError("remounting '%1%' read-only", target);
}

void unmountPath(const Path & target)
{
    if (umount2(target.c_str(), MNT_DETACH) == -1 && errno != EINVAL && errno != ENOENT)
        throw SysError("unmounting '%1%'", target);
}

void makeMountsPrivate()
{
    if (mount(0, "/", 0, MS_PRIVATE | MS_REC, 0) == -1)
        throw SysError("unable to make '/' private");
}

} // namespace arbor
