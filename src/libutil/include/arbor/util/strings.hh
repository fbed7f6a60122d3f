#pragma once
///@file

#include "arbor/util/types.hh"

#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace arbor {

/**
 * Split `s` at any of `separators`, dropping empty tokens.
 */
template<class C>
C tokenizeString(std::string_view s, std::string_view separators = " \t\n\r");

/**
 * Join `ss` with `sep` between consecutive elements.
 */
template<class C>
std::string concatStringsSep(const std::string_view sep, const C & ss)
{
    std::string res;
    bool first = true;
    for (auto & s : ss) {
        if (!first)
            res += sep;
        res += s;
        first = false;
    }
    return res;
}

/**
 * Remove whitespace from the start and end of a string.
 */
std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

/**
 * Remove trailing whitespace from a string.
 */
std::string chomp(std::string_view s);

/**
 * @return true iff `s` starts with `prefix`.
 */
bool hasPrefix(std::string_view s, std::string_view prefix);

/**
 * @return true iff `s` ends in `suffix`.
 */
bool hasSuffix(std::string_view s, std::string_view suffix);

/**
 * Convert a string to lower case.
 */
std::string toLower(std::string s);

/**
 * Parse a string into an integer. Returns `std::nullopt` on overflow,
 * trailing garbage, or a sign on an unsigned type.
 */
template<class N>
std::optional<N> string2Int(const std::string_view s);

/**
 * Decode Base64 as used by `data:` style inline sources. Padding is
 * optional and embedded newlines are ignored.
 */
std::string base64Decode(std::string_view s);

} // namespace arbor
