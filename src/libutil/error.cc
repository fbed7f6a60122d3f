#include "arbor/util/error.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/strings.hh"

#include <sstream>

namespace arbor {

std::optional<std::string> ErrorInfo::programName;

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

const std::string & BaseError::calcWhat() const
{
    if (!what_) {
        std::ostringstream out;
        showErrorInfo(out, err, loggerSettings.showTrace);
        what_ = out.str();
    }
    return *what_;
}

static std::string_view levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return ANSI_RED "error";
    case lvlWarn:
        return ANSI_WARNING "warning";
    case lvlNotice:
        return ANSI_RED "note";
    case lvlInfo:
        return ANSI_GREEN "info";
    case lvlTalkative:
        return ANSI_GREEN "talk";
    case lvlChatty:
        return ANSI_GREEN "chat";
    case lvlDebug:
        return ANSI_WARNING "debug";
    case lvlVomit:
        return ANSI_GREEN "vomit";
    }
    unreachable();
}

/* Context lines shown without --show-trace. */
constexpr size_t shortTraceLength = 3;

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    std::string text;

    size_t shown = 0;
    for (auto & trace : einfo.traces) {
        auto line = trace.hint.str();
        if (line.empty())
            continue;
        if (!showTrace && shown == shortTraceLength) {
            text += "(stack trace truncated; use '--show-trace' to show the full trace)\n";
            break;
        }
        text += "… " + line + "\n";
        shown++;
    }

    text += std::string(levelPrefix(einfo.level)) + ":" ANSI_NORMAL " " + einfo.msg.str();

    return out << chomp(text);
}

void panic(std::string_view msg)
{
    writeToStderr(std::string(msg) + "\n");
    std::terminate();
}

void unreachable(std::source_location loc)
{
    panic(fmt("arbor: reached impossible code in %s at %s:%d", loc.function_name(), loc.file_name(), loc.line()));
}

} // namespace arbor
