#pragma once
///@file

#include "arbor/util/types.hh"

#include <functional>

namespace arbor {

extern const std::string arborVersion;

/**
 * Set up the process: load the configuration, start the signal
 * handler thread and reset inherited signal dispositions.
 */
void initArbor(bool loadConfig = true);

/**
 * Run `fun`, printing any exception it throws and turning it into an
 * exit status.
 */
int handleExceptions(const std::string & programName, std::function<void()> fun);

[[noreturn]] void printVersion(const std::string & programName);

} // namespace arbor
