#include "arbor/store/build/api-channel.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/signals.hh"

#include <sys/socket.h>
#include <unistd.h>

namespace arbor {

ApiChannel::ApiChannel(AutoCloseFD && fd, ApiHandlers handlers)
    : fd(std::move(fd))
    , handlers(std::move(handlers))
{
}

void ApiChannel::receive()
{
    char buf[8192];
    ssize_t rd = read(fd.get(), buf, sizeof(buf));
    if (rd == -1) {
        if (errno == EINTR || errno == EAGAIN)
            return;
        /* The stage closed its end abruptly. */
        if (errno == ECONNRESET) {
            eof = true;
            return;
        }
        throw SysError("reading from the API channel");
    }

    if (rd == 0) {
        eof = true;
        if (!buffer.empty()) {
            handleLine(buffer);
            buffer.clear();
        }
        return;
    }

    buffer.append(buf, rd);

    size_t pos;
    while ((pos = buffer.find('\n')) != std::string::npos) {
        auto line = buffer.substr(0, pos);
        buffer.erase(0, pos + 1);
        handleLine(line);
    }
}

void ApiChannel::handleLine(std::string_view line)
{
    if (line.find_first_not_of(" \t\r") == std::string_view::npos)
        return;

    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(line);
    } catch (nlohmann::json::parse_error & e) {
        warn("ignoring malformed message on the API channel: %s", e.what());
        return;
    }

    if (auto r = dispatch(msg))
        reply(*r);
}

std::optional<nlohmann::json> ApiChannel::dispatch(const nlohmann::json & msg)
{
    if (!msg.is_object()) {
        warn("ignoring API message that is not an object: %s", msg.dump());
        return std::nullopt;
    }

    auto data = msg.contains("data") ? msg["data"] : nlohmann::json();
    std::optional<nlohmann::json> id;
    if (msg.contains("id"))
        id = msg["id"];

    std::string type;
    const char * badType = nullptr;
    if (auto t = msg.find("type"); t != msg.end()) {
        if (t->is_string())
            type = t->get<std::string>();
        else
            badType = t->type_name();
    }

    auto fail = [&](const std::string & error) -> std::optional<nlohmann::json> {
        if (!id) {
            warn("API message of type '%s' failed: %s", type, error);
            return std::nullopt;
        }
        return nlohmann::json{{"id", *id}, {"error", error}};
    };

    if (badType)
        return fail(fmt("message type must be a string, not %s", badType));

    auto call = [&](auto & handler) -> std::optional<nlohmann::json> {
        if (!handler)
            return fail(fmt("'%s' is not supported", type));
        try {
            auto result = handler(data);
            if (!id)
                return std::nullopt;
            return nlohmann::json{{"id", *id}, {"result", result}};
        } catch (Error & e) {
            return fail(e.message());
        }
    };

    try {
        if (type == "exception") {
            if (handlers.exception)
                handlers.exception(data);
        } else if (type == "metadata") {
            if (!data.is_object())
                return fail("metadata must be an object");
            if (handlers.metadata)
                handlers.metadata(data);
        } else if (type == "log") {
            if (handlers.log)
                handlers.log(data.is_string() ? data.get<std::string>() : data.dump());
        } else if (type == "progress") {
            if (handlers.progress && data.is_object())
                handlers.progress(data.value("done", (uint64_t) 0), data.value("expected", (uint64_t) 0));
        } else if (type == "loop-attach")
            return call(handlers.loopAttach);
        else if (type == "loop-detach")
            return call(handlers.loopDetach);
        else if (id)
            return fail(fmt("unknown message type '%s'", type));
        else
            return std::nullopt;
    } catch (nlohmann::json::exception & e) {
        return fail(fmt("malformed '%s' message: %s", type, e.what()));
    }

    if (id)
        return nlohmann::json{{"id", *id}, {"result", nullptr}};
    return std::nullopt;
}

void ApiChannel::reply(const nlohmann::json & reply)
{
    auto s = reply.dump() + "\n";
    std::string_view rest(s);

    /* MSG_NOSIGNAL: a stage that exits without reading its reply must
       not take us down with SIGPIPE. */
    while (!rest.empty()) {
        checkInterrupt();
        ssize_t res = send(fd.get(), rest.data(), rest.size(), MSG_NOSIGNAL);
        if (res == -1) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            if (errno == EPIPE || errno == ECONNRESET) {
                debug("stage closed the API channel before reading the reply");
                return;
            }
            throw SysError("writing to the API channel");
        }
        rest.remove_prefix(res);
    }
}

} // namespace arbor
