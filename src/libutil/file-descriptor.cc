#include "arbor/util/file-descriptor.hh"
#include "arbor/util/signals.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/strings.hh"

#include <fcntl.h>
#include <poll.h>
#include <dirent.h>
#include <sys/socket.h>
#include <sys/stat.h>

namespace arbor {

/**
 * Wait until a non-blocking `fd` is ready for `events`.
 */
static void waitUntilReady(Descriptor fd, short events)
{
    struct pollfd pfd{.fd = fd, .events = events, .revents = 0};
    while (poll(&pfd, 1, -1) == -1)
        if (errno != EINTR)
            throw SysError("waiting for file descriptor %d", fd);
}

std::string readFile(Descriptor fd)
{
    struct stat st;
    if (fstat(fd, &st) == -1)
        throw SysError("statting file descriptor %d", fd);
    return drainFD(fd, true, st.st_size);
}

void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts)
{
    while (!s.empty()) {
        if (allowInterrupts)
            checkInterrupt();
        auto n = write(fd, s.data(), s.size());
        if (n >= 0)
            s.remove_prefix(n);
        else if (errno == EAGAIN)
            waitUntilReady(fd, POLLOUT);
        else if (errno != EINTR)
            throw SysError("writing to file descriptor %d", fd);
    }
}

std::string readLine(Descriptor fd, bool eofOk)
{
    std::string line;
    char c;
    while (true) {
        checkInterrupt();
        auto n = read(fd, &c, 1);
        if (n == 1) {
            if (c == '\n')
                return line;
            line.push_back(c);
        } else if (n == 0) {
            if (!eofOk)
                throw EndOfFile("file descriptor %d closed in the middle of a line", fd);
            return line;
        } else if (errno == EAGAIN)
            waitUntilReady(fd, POLLIN);
        else if (errno != EINTR)
            throw SysError("reading a line from file descriptor %d", fd);
    }
}

std::string drainFD(Descriptor fd, bool block, size_t reserveSize)
{
    int flags = 0;
    if (!block) {
        flags = fcntl(fd, F_GETFL);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
            throw SysError("making file descriptor %d non-blocking", fd);
    }

    std::string data;
    data.reserve(reserveSize);

    std::vector<char> buf(64 * 1024);
    while (true) {
        checkInterrupt();
        auto n = read(fd, buf.data(), buf.size());
        if (n > 0)
            data.append(buf.data(), n);
        else if (n == 0)
            break;
        else if (!block && (errno == EAGAIN || errno == EWOULDBLOCK))
            break;
        else if (errno != EINTR)
            throw SysError("reading from file descriptor %d", fd);
    }

    if (!block && fcntl(fd, F_SETFL, flags) == -1)
        throw SysError("restoring flags of file descriptor %d", fd);

    return data;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoCloseFD::close()
{
    if (fd == INVALID_DESCRIPTOR)
        return;
    auto old = release();
    if (::close(old) == -1)
        throw SysError("closing file descriptor %d", old);
}

void AutoCloseFD::fsync() const
{
    if (fd != INVALID_DESCRIPTOR && ::fsync(fd) == -1)
        throw SysError("syncing file descriptor %d", fd);
}

void Pipe::create()
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1)
        throw SysError("creating pipe");
    readSide = fds[0];
    writeSide = fds[1];
}

void SocketPair::create()
{
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1)
        throw SysError("creating socket pair");
    parentSide = fds[0];
    childSide = fds[1];
}

void unix::closeExtraFDs(const std::set<Descriptor> & keep)
{
    auto unwanted = [&](int fd) { return fd > STDERR_FILENO && !keep.count(fd); };

    DIR * dir = opendir("/proc/self/fd");
    if (!dir) {
        for (int fd = STDERR_FILENO + 1; fd < sysconf(_SC_OPEN_MAX); ++fd)
            if (unwanted(fd))
                ::close(fd);
        return;
    }

    /* The directory stream has a descriptor of its own, so collect
       first and close afterwards. */
    std::vector<int> fds;
    while (auto entry = readdir(dir))
        if (auto fd = string2Int<int>(entry->d_name); fd && *fd != dirfd(dir) && unwanted(*fd))
            fds.push_back(*fd);
    closedir(dir);

    for (auto fd : fds)
        ::close(fd);
}

void unix::closeOnExec(Descriptor fd)
{
    int flags = fcntl(fd, F_GETFD);
    if (flags == -1 || fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1)
        throw SysError("setting close-on-exec on file descriptor %d", fd);
}

} // namespace arbor
