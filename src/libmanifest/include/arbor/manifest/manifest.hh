#pragma once
///@file

#include "arbor/store/sources.hh"
#include "arbor/util/error.hh"

#include <map>
#include <optional>
#include <set>
#include <vector>

#include <nlohmann/json.hpp>

namespace arbor {

/**
 * A build description that cannot be used: malformed, cyclic, or
 * rejected by a stage's option schema.
 */
MakeError(ManifestError, Error);

struct StageInput
{
    enum class Origin { Source, Pipeline };

    std::string type;
    Origin origin = Origin::Pipeline;

    /**
     * Referenced ids and their per-reference options. Pipeline
     * references are stored as bare pipeline names, source references
     * as `<algo>:<hex>` checksums.
     */
    std::map<std::string, nlohmann::json> references;
};

std::string_view printOrigin(StageInput::Origin origin);

struct DeviceSpec
{
    std::string name;
    std::string type;
    std::optional<std::string> parent;
    nlohmann::json options = nlohmann::json::object();
};

struct MountSpec
{
    std::string name;
    std::string type;
    std::string source;
    std::string target;
    std::optional<uint64_t> partition;
    nlohmann::json options = nlohmann::json::object();
};

struct Stage
{
    std::string type;
    nlohmann::json options = nlohmann::json::object();
    std::map<std::string, StageInput> inputs;

    /**
     * Sorted by name.
     */
    std::vector<DeviceSpec> devices;

    /**
     * In manifest order.
     */
    std::vector<MountSpec> mounts;
};

struct Pipeline
{
    std::string name;

    /**
     * Name of the pipeline whose output is the build root of this one.
     */
    std::optional<std::string> build;

    std::optional<std::string> runner;
    std::optional<uint64_t> sourceEpoch;
    std::vector<Stage> stages;

    /**
     * The names of the pipelines this one needs: its build pipeline
     * and every pipeline input of its stages.
     */
    std::set<std::string> dependencies() const;
};

struct Manifest
{
    /**
     * "1" or "2", as declared by the document. Version 1 documents are
     * converted to the version 2 model when parsed.
     */
    std::string version;

    std::vector<Pipeline> pipelines;

    /**
     * Keyed by checksum.
     */
    std::map<std::string, SourceItem> sources;

    const Pipeline * findPipeline(std::string_view name) const;

    /**
     * Parse a manifest of either format version.
     *
     * @throws ManifestError
     */
    static Manifest fromJSON(const nlohmann::json & json);

    static Manifest parse(std::string_view text);
};

} // namespace arbor
