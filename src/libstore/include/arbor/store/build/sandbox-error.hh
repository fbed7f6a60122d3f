#pragma once
///@file

#include "arbor/util/error.hh"

namespace arbor {

/**
 * Setting up or tearing down the isolated environment of a stage
 * failed. This aborts the whole build.
 */
MakeError(SandboxError, Error);

} // namespace arbor
