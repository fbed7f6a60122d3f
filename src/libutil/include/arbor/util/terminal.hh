#pragma once
///@file

#include <string>
#include <string_view>

namespace arbor {

/**
 * Determine whether ANSI escape sequences are appropriate for the
 * present output.
 */
bool isTTY();

/**
 * If 'filterAll' is true, all ANSI escape sequences are filtered out.
 * Otherwise, colour-setting sequences are kept and the rest are
 * dropped. Tabs are expanded to spaces.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

} // namespace arbor
