#include "arbor/util/file-system.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/signals.hh"
#include "arbor/util/strings.hh"

#include <atomic>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <memory>
#include <random>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/fs.h>

namespace arbor {

namespace fs {
using namespace std::filesystem;
}

static Path currentDir()
{
    char buf[PATH_MAX];
    if (!getcwd(buf, sizeof(buf)))
        throw SysError("cannot get the current directory");
    return buf;
}

Path absPath(PathView path, std::optional<PathView> dir)
{
    if (!path.empty() && path[0] == '/')
        return canonPath(path);
    auto base = dir ? Path(*dir) : currentDir();
    return canonPath(base + "/" + std::string(path));
}

Path canonPath(PathView path)
{
    if (path.empty() || path[0] != '/')
        throw Error("not an absolute path: '%1%'", path);

    std::vector<std::string_view> components;

    while (!path.empty()) {
        auto slash = path.find('/');
        auto component = path.substr(0, slash);
        path = slash == path.npos ? PathView() : path.substr(slash + 1);

        if (component.empty() || component == ".")
            continue;
        if (component == "..") {
            if (!components.empty())
                components.pop_back();
            continue;
        }
        components.push_back(component);
    }

    if (components.empty())
        return "/";

    Path res;
    for (auto & component : components) {
        res += '/';
        res += component;
    }
    return res;
}

Path dirOf(const PathView path)
{
    auto slash = path.rfind('/');
    if (slash == path.npos)
        return ".";
    return slash == 0 ? "/" : Path(path.substr(0, slash));
}

std::string_view baseNameOf(std::string_view path)
{
    auto end = path.find_last_not_of('/');
    if (end == path.npos)
        return "";
    path = path.substr(0, end + 1);
    auto slash = path.rfind('/');
    return slash == path.npos ? path : path.substr(slash + 1);
}

bool isInDir(std::string_view path, std::string_view dir)
{
    if (path.empty() || path[0] != '/' || !hasPrefix(path, dir))
        return false;
    auto rest = path.substr(dir.size());
    if (dir == "/")
        return !rest.empty() && rest[0] != '/';
    return rest.size() >= 2 && rest[0] == '/';
}

struct stat lstat(const Path & path)
{
    struct stat st;
    if (::lstat(path.c_str(), &st))
        throw SysError("getting status of '%1%'", path);
    return st;
}

std::optional<struct stat> maybeLstat(const Path & path)
{
    std::optional<struct stat> st{std::in_place};
    if (::lstat(path.c_str(), &*st)) {
        if (errno == ENOENT || errno == ENOTDIR)
            st.reset();
        else
            throw SysError("getting status of '%s'", path);
    }
    return st;
}

bool pathExists(const Path & path)
{
    return maybeLstat(path).has_value();
}

std::string readFile(const Path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    return readFile(fd.get());
}

void writeFile(const Path & path, std::string_view s, mode_t mode, bool sync)
{
    AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%1%'", path);

    try {
        writeFull(fd.get(), s);

        if (sync)
            fd.fsync();
    } catch (Error & e) {
        e.addTrace("writing file '%1%'", path);
        throw;
    }

    /* Close explicitly to propagate the exceptions. */
    fd.close();
    if (sync)
        syncParent(path);
}

void syncParent(const Path & path)
{
    AutoCloseFD fd = open(dirOf(path).c_str(), O_RDONLY | O_CLOEXEC, 0);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    fd.fsync();
}

/**
 * Remove `name` below the directory `parentfd`, recursing into
 * directories. The first unlink failure is stored in `firstError` so
 * that the rest of the tree is still removed; other errors are thrown.
 */
static void deleteAt(Descriptor parentfd, const fs::path & path, std::exception_ptr & firstError)
{
    checkInterrupt();

    auto name = path.filename().string();

    struct stat st;
    if (fstatat(parentfd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) == -1) {
        if (errno == ENOENT)
            return;
        throw SysError("getting status of '%1%'", path.string());
    }

    bool isDir = S_ISDIR(st.st_mode);

    if (isDir) {
        /* Read-only directories would make their entries undeletable. */
        const mode_t rwx = S_IRWXU;
        if ((st.st_mode & rwx) != rwx && fchmodat(parentfd, name.c_str(), st.st_mode | rwx, 0) == -1)
            throw SysError("making '%1%' writable", path.string());

        AutoCloseFD fd = openat(parentfd, name.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
        if (!fd)
            throw SysError("opening directory '%1%'", path.string());

        std::unique_ptr<DIR, decltype(&closedir)> dir(fdopendir(fd.get()), closedir);
        if (!dir)
            throw SysError("opening directory '%1%'", path.string());
        /* The DIR now owns the descriptor. */
        auto dirDesc = fd.release();

        while (true) {
            errno = 0;
            auto entry = readdir(dir.get());
            if (!entry)
                break;
            std::string_view child = entry->d_name;
            if (child == "." || child == "..")
                continue;
            deleteAt(dirDesc, path / std::string(child), firstError);
        }
        if (errno)
            throw SysError("reading directory '%1%'", path.string());
    }

    if (unlinkat(parentfd, name.c_str(), isDir ? AT_REMOVEDIR : 0) == -1 && errno != ENOENT) {
        SysError e("removing '%1%'", path.string());
        if (firstError)
            debug("%s", e.what());
        else
            firstError = std::make_exception_ptr(e);
    }
}

void deletePath(const fs::path & path)
{
    if (!path.is_absolute() || !path.has_relative_path())
        throw Error("refusing to delete '%s'", path.string());

    auto parent = path.parent_path();
    AutoCloseFD parentfd = open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (!parentfd) {
        if (errno == ENOENT)
            return;
        throw SysError("opening directory '%1%'", parent.string());
    }

    std::exception_ptr firstError;
    deleteAt(parentfd.get(), path, firstError);
    if (firstError)
        std::rethrow_exception(firstError);
}

void createDirs(const fs::path & path)
{
    try {
        fs::create_directories(path);
    } catch (fs::filesystem_error & e) {
        throw SysError(e.code().value(), "creating directory '%1%'", path.string());
    }
}

void createSymlink(const Path & target, const Path & link)
{
    if (symlink(target.c_str(), link.c_str()) == -1)
        throw SysError("creating symlink '%1%' -> '%2%'", link, target);
}

static void copyMetadata(const fs::path & from, const fs::path & to, const struct stat & st)
{
    /* Ownership can only be preserved when running as root or inside
       a user namespace that maps the original owner. */
    if (lchown(to.c_str(), st.st_uid, st.st_gid) == -1 && errno != EPERM && errno != EINVAL)
        throw SysError("changing owner of '%1%'", to.string());

    if (!S_ISLNK(st.st_mode) && chmod(to.c_str(), st.st_mode & 07777) == -1)
        throw SysError("changing mode of '%1%'", to.string());

    struct timespec times[2];
    times[0] = st.st_atim;
    times[1] = st.st_mtim;
    if (utimensat(AT_FDCWD, to.c_str(), times, AT_SYMLINK_NOFOLLOW) == -1)
        throw SysError("changing modification time of '%1%'", to.string());
}

void copyFile(const fs::path & from, const fs::path & to)
{
    AutoCloseFD src = open(from.c_str(), O_RDONLY | O_CLOEXEC);
    if (!src)
        throw SysError("opening file '%1%'", from.string());

    struct stat st;
    if (fstat(src.get(), &st) == -1)
        throw SysError("statting file '%1%'", from.string());

    AutoCloseFD dst = open(to.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, st.st_mode & 0777);
    if (!dst)
        throw SysError("creating file '%1%'", to.string());

    if (ioctl(dst.get(), FICLONE, src.get()) == -1) {
        std::vector<char> buf(64 * 1024);
        while (true) {
            checkInterrupt();
            ssize_t n = read(src.get(), buf.data(), buf.size());
            if (n == -1) {
                if (errno == EINTR)
                    continue;
                throw SysError("reading file '%1%'", from.string());
            }
            if (n == 0)
                break;
            writeFull(dst.get(), {buf.data(), (size_t) n});
        }
    }

    dst.close();
}

void copyTree(const fs::path & from, const fs::path & to)
{
    checkInterrupt();

    auto st = lstat(from.string());

    if (S_ISDIR(st.st_mode)) {
        if (mkdir(to.c_str(), 0700) == -1 && errno != EEXIST)
            throw SysError("creating directory '%1%'", to.string());
        std::error_code ec;
        for (auto & entry : fs::directory_iterator(from, ec))
            copyTree(entry.path(), to / entry.path().filename());
        if (ec)
            throw SysError(ec.value(), "reading directory '%1%'", from.string());
    } else if (S_ISREG(st.st_mode)) {
        copyFile(from, to);
    } else if (S_ISLNK(st.st_mode)) {
        auto target = fs::read_symlink(from);
        createSymlink(target.string(), to.string());
    } else if (S_ISCHR(st.st_mode) || S_ISBLK(st.st_mode) || S_ISFIFO(st.st_mode)) {
        if (mknod(to.c_str(), st.st_mode, st.st_rdev) == -1)
            throw SysError("creating special file '%1%'", to.string());
    } else if (S_ISSOCK(st.st_mode)) {
        debug("skipping socket '%s'", from.string());
        return;
    } else
        throw Error("file '%s' has an unsupported type", from.string());

    copyMetadata(from, to, st);
}

void renameFile(const Path & oldName, const Path & newName)
{
    if (rename(oldName.c_str(), newName.c_str()) == -1)
        throw SysError("renaming '%1%' to '%2%'", oldName, newName);
}

AutoDelete::AutoDelete(const fs::path & p, bool recursive)
    : path_(p)
    , armed(true)
    , recursive(recursive)
{
}

AutoDelete::~AutoDelete()
{
    if (!armed)
        return;
    try {
        if (recursive)
            deletePath(path_);
        else
            fs::remove(path_);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoDelete::reset(const fs::path & p, bool recursive)
{
    path_ = p;
    this->recursive = recursive;
    armed = true;
}

Path createTempDir(const Path & tmpRoot, const Path & prefix, mode_t mode)
{
    /* Random start, so that leftovers from an earlier run with the same
       PID are skipped quickly. */
    static std::atomic<uint32_t> counter(std::random_device{}());

    Path root = tmpRoot;
    if (root.empty()) {
        auto env = getenv("TMPDIR");
        root = env && *env ? env : "/tmp";
    }
    root = absPath(root);

    while (true) {
        checkInterrupt();
        auto dir = fmt("%s/%s-%d-%d", root, prefix, getpid(), counter++);
        if (mkdir(dir.c_str(), mode) == 0)
            return dir;
        if (errno != EEXIST)
            throw SysError("creating directory '%1%'", dir);
    }
}

} // namespace arbor
