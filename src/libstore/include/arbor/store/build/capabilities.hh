#pragma once
///@file

#include "arbor/store/build/sandbox-error.hh"
#include "arbor/util/types.hh"

#include <memory>
#include <optional>

namespace arbor {

class Settings;

/**
 * Map a capability name such as `CAP_SYS_ADMIN` to its number.
 */
std::optional<int> parseCapability(std::string_view name);

/**
 * Decides which capabilities a stage keeps in its bounding set.
 */
class CapabilityPolicy
{
public:
    virtual ~CapabilityPolicy() {}

    /**
     * Return the capabilities a stage that requests `requested`
     * (through its descriptor) runs with.
     *
     * @throws SandboxError if a requested capability is not permitted.
     */
    virtual StringSet allowedCapabilities(const StringSet & requested) const = 0;
};

/**
 * A policy granting `base` to every stage and, on request, anything
 * in `extra`.
 */
class AllowListCapabilityPolicy : public CapabilityPolicy
{
    StringSet base, extra;

public:

    AllowListCapabilityPolicy(StringSet base, StringSet extra);

    StringSet allowedCapabilities(const StringSet & requested) const override;
};

/**
 * The policy described by the `sandbox-capabilities` and
 * `sandbox-extra-capabilities` settings.
 */
std::unique_ptr<CapabilityPolicy> makeCapabilityPolicy(const Settings & settings);

/**
 * Remove every capability not in `keep` from the bounding set of the
 * calling process, then clear its inheritable and ambient sets. Must
 * run in the sandbox before `exec`.
 */
void dropCapabilities(const StringSet & keep);

/**
 * Empty the inheritable and ambient capability sets of the calling
 * process, so that nothing but the bounding set reaches the program
 * it `exec`s. Needs no privileges.
 */
void clearInheritableCapabilities();

} // namespace arbor
