#include "arbor/build/build-result.hh"
#include "arbor/util/error.hh"

#include <nlohmann/json.hpp>

namespace arbor {

std::string_view printPipelineState(PipelineState state)
{
    switch (state) {
    case PipelineState::Pending:
        return "pending";
    case PipelineState::ResolvingCache:
        return "resolving-cache";
    case PipelineState::Building:
        return "building";
    case PipelineState::Done:
        return "done";
    case PipelineState::Failed:
        return "failed";
    case PipelineState::Skipped:
        return "skipped";
    }
    unreachable();
}

nlohmann::json PipelineResult::toJSON() const
{
    nlohmann::json res{
        {"name", name},
        {"state", std::string(printPipelineState(state))},
        {"fingerprint", fingerprint ? nlohmann::json(*fingerprint) : nlohmann::json()},
        {"error", error ? nlohmann::json(*error) : nlohmann::json()},
        {"cached-stages", cachedStages},
        {"executed-stages", executedStages},
    };
    if (output)
        res["tree"] = output->treePath.string();
    return res;
}

bool BuildResult::success() const
{
    for (auto & p : pipelines)
        if (p.state == PipelineState::Failed)
            return false;
    return true;
}

const PipelineResult * BuildResult::find(std::string_view name) const
{
    for (auto & p : pipelines)
        if (p.name == name)
            return &p;
    return nullptr;
}

nlohmann::json BuildResult::toJSON() const
{
    auto list = nlohmann::json::array();
    for (auto & p : pipelines)
        list.push_back(p.toJSON());
    return {{"success", success()}, {"pipelines", std::move(list)}};
}

} // namespace arbor
