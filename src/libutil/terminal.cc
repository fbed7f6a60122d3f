#include "arbor/util/terminal.hh"

#include <cstdlib>
#include <unistd.h>

namespace arbor {

static bool envSet(const char * name)
{
    return getenv(name) != nullptr;
}

bool isTTY()
{
    static const bool tty = [] {
        if (!isatty(STDERR_FILENO))
            return false;
        auto term = getenv("TERM");
        if (!term || std::string_view(term) == "dumb")
            return false;
        return !envSet("NO_COLOR") && !envSet("NOCOLOR");
    }();
    return tty;
}

/**
 * Length of the escape sequence at the start of `s`, which begins with
 * ESC. Control sequences (ESC '[') are parameter bytes, then
 * intermediate bytes, then one final byte.
 */
static size_t escapeLength(std::string_view s, bool & isSGR)
{
    auto in = [&](size_t i, char lo, char hi) { return i < s.size() && s[i] >= lo && s[i] <= hi; };

    isSGR = false;

    if (s.size() < 2 || s[1] != '[')
        return in(1, 0x40, 0x5f) ? 2 : 1;

    size_t i = 2;
    while (in(i, 0x30, 0x3f))
        ++i;
    while (in(i, 0x20, 0x2f))
        ++i;
    if (in(i, 0x40, 0x7e)) {
        isSGR = s[i] == 'm';
        ++i;
    }
    return i;
}

std::string filterANSIEscapes(std::string_view s, bool filterAll)
{
    std::string out;
    out.reserve(s.size());
    size_t column = 0;

    for (size_t i = 0; i < s.size();) {
        char c = s[i];

        if (c == '\e') {
            bool isSGR;
            auto len = escapeLength(s.substr(i), isSGR);
            if (isSGR && !filterAll)
                out.append(s.substr(i, len));
            i += len;
            continue;
        }

        ++i;

        switch (c) {
        case '\t':
            do {
                out += ' ';
                ++column;
            } while (column % 8);
            break;
        case '\r':
        case '\a':
            break;
        default:
            out += c;
            ++column;
        }
    }

    return out;
}

} // namespace arbor
