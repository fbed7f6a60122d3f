#pragma once
///@file

#include "arbor/util/types.hh"

namespace arbor {

/**
 * Whether unprivileged user namespaces can be created. The result is
 * computed once and cached.
 */
bool userNamespacesSupported();

bool mountAndPidNamespacesSupported();

} // namespace arbor
