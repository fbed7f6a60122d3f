#pragma once
///@file

#include "arbor/store/object-store.hh"

#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace arbor {

enum class PipelineState {
    Pending,
    ResolvingCache,
    Building,
    Done,
    Failed,
    Skipped,
};

std::string_view printPipelineState(PipelineState state);

struct PipelineResult
{
    std::string name;
    PipelineState state = PipelineState::Pending;

    /**
     * The fingerprint of the pipeline's output, if it has one.
     */
    std::optional<std::string> fingerprint;

    std::optional<std::string> error;

    size_t cachedStages = 0;
    size_t executedStages = 0;

    /**
     * The committed output, once the pipeline is `Done` and has
     * stages (directly or through its build pipeline).
     */
    std::optional<ObjectStore::Entry> output;

    nlohmann::json toJSON() const;
};

struct BuildResult
{
    /**
     * One result per pipeline of the manifest, in manifest order.
     */
    std::vector<PipelineResult> pipelines;

    /**
     * Whether no pipeline failed.
     */
    bool success() const;

    const PipelineResult * find(std::string_view name) const;

    nlohmann::json toJSON() const;
};

} // namespace arbor
