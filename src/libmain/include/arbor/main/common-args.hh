#pragma once
///@file

#include "arbor/util/args.hh"

namespace arbor {

/**
 * Flags shared by every arbor program: verbosity, `--option`,
 * `--log-format`, `--monitor-fd` and `--show-trace`.
 */
class MixCommonArgs : public virtual Args
{
public:
    std::string programName;
    MixCommonArgs(const std::string & programName);
};

} // namespace arbor
