#pragma once
///@file

#include "arbor/util/types.hh"
#include "arbor/util/error.hh"

#include <utility>

#include <unistd.h>

namespace arbor {

using Descriptor = int;

const Descriptor INVALID_DESCRIPTOR = -1;

MakeError(EndOfFile, Error);

/**
 * Read from `fd` until end of file.
 */
std::string readFile(Descriptor fd);

/**
 * Write all of `s`, retrying on short writes. Checks for interrupts
 * between writes unless `allowInterrupts` is false.
 */
void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts = true);

/**
 * Read up to the next newline, which is not returned. At end of file
 * the partial line is returned if `eofOk`, otherwise EndOfFile is
 * thrown.
 */
std::string readLine(Descriptor fd, bool eofOk = false);

/**
 * Read until end of file, or with `block == false` until a read would
 * block.
 */
std::string drainFD(Descriptor fd, bool block = true, size_t reserveSize = 0);

/**
 * Owns a file descriptor and closes it on destruction.
 */
class AutoCloseFD
{
    Descriptor fd = INVALID_DESCRIPTOR;

public:
    AutoCloseFD() = default;

    AutoCloseFD(Descriptor fd)
        : fd(fd)
    {
    }

    AutoCloseFD(AutoCloseFD && other) noexcept
        : fd(other.release())
    {
    }

    AutoCloseFD & operator=(AutoCloseFD && other)
    {
        if (this != &other) {
            close();
            fd = other.release();
        }
        return *this;
    }

    AutoCloseFD(const AutoCloseFD &) = delete;
    AutoCloseFD & operator=(const AutoCloseFD &) = delete;

    ~AutoCloseFD();

    Descriptor get() const
    {
        return fd;
    }

    explicit operator bool() const
    {
        return fd != INVALID_DESCRIPTOR;
    }

    /**
     * Give up ownership without closing.
     */
    Descriptor release()
    {
        return std::exchange(fd, INVALID_DESCRIPTOR);
    }

    void close();

    void fsync() const;
};

/**
 * A close-on-exec pipe.
 */
struct Pipe
{
    AutoCloseFD readSide, writeSide;
    void create();
};

/**
 * A connected pair of close-on-exec `AF_UNIX` stream sockets.
 */
struct SocketPair
{
    AutoCloseFD parentSide, childSide;
    void create();
};

namespace unix {

/**
 * Close every descriptor above stderr except those in `keep`. For use
 * in a forked child before exec.
 */
void closeExtraFDs(const std::set<Descriptor> & keep = {});

void closeOnExec(Descriptor fd);

} // namespace unix

} // namespace arbor
