#pragma once
///@file

#include "arbor/util/file-descriptor.hh"

#include <functional>
#include <optional>

#include <nlohmann/json.hpp>

namespace arbor {

/**
 * What the runner does with the messages a stage sends over its API
 * channel. Unset handlers make the corresponding requests fail.
 */
struct ApiHandlers
{
    std::function<void(const nlohmann::json & data)> exception;
    std::function<void(const nlohmann::json & data)> metadata;
    std::function<void(const std::string & text)> log;
    std::function<void(uint64_t done, uint64_t expected)> progress;
    std::function<nlohmann::json(const nlohmann::json & data)> loopAttach;
    std::function<nlohmann::json(const nlohmann::json & data)> loopDetach;
};

/**
 * The parent end of a stage's API channel: newline-delimited JSON
 * messages over a socket. Messages carrying an `id` are requests and
 * are answered with `{"id": n, "result": ...}` or
 * `{"id": n, "error": "..."}`.
 */
class ApiChannel
{
    AutoCloseFD fd;
    ApiHandlers handlers;
    std::string buffer;
    bool eof = false;

public:

    ApiChannel(AutoCloseFD && fd, ApiHandlers handlers);

    Descriptor get() const
    {
        return fd.get();
    }

    bool atEOF() const
    {
        return eof;
    }

    /**
     * Read what is available and handle every complete message.
     * Call when the descriptor is readable.
     */
    void receive();

    /**
     * Handle one message; returns the reply to send, if any.
     */
    std::optional<nlohmann::json> dispatch(const nlohmann::json & msg);

private:

    void handleLine(std::string_view line);

    void reply(const nlohmann::json & reply);
};

} // namespace arbor
