#pragma once
///@file

#include "arbor/manifest/graph.hh"
#include "arbor/manifest/stage-registry.hh"
#include "arbor/util/hash.hh"

namespace arbor {

/**
 * The cache key of a stage: the SHA-256 of its identity, which chains
 * in the fingerprints of everything the stage's result depends on.
 */
struct Fingerprint
{
    Hash hash{HashAlgorithm::SHA256};

    /**
     * 64 lowercase hex digits.
     */
    std::string to_string() const
    {
        return hash.to_string(false);
    }

    static Fingerprint parse(std::string_view s);

    bool operator==(const Fingerprint & other) const = default;

    auto operator<=>(const Fingerprint & other) const
    {
        return hash <=> other.hash;
    }
};

/**
 * The fingerprint of a stage with the given identity document. The
 * document is hashed in its canonical form, so key order does not
 * matter.
 */
Fingerprint computeFingerprint(const nlohmann::json & identity);

/**
 * A manifest that passed validation, with the fingerprint of every
 * stage.
 */
struct ResolvedManifest
{
    Manifest manifest;
    PipelineGraph graph;

    /**
     * `stageFingerprints[p][k]` is the fingerprint of stage `k` of
     * pipeline `p`.
     */
    std::vector<std::vector<Fingerprint>> stageFingerprints;

    /**
     * The fingerprint of each pipeline's output, if it has any output.
     */
    std::vector<std::optional<Fingerprint>> pipelineFingerprints;

    std::vector<std::vector<std::shared_ptr<const StageDescriptor>>> descriptors;

    std::optional<size_t> indexOf(std::string_view name) const;

    /**
     * The manifest in version 2 form with an `id` for every stage and
     * pipeline.
     */
    nlohmann::json inspect() const;
};

/**
 * Validate `manifest` against `registry`, build its graph and compute
 * all fingerprints. Nothing is returned unless the whole manifest is
 * valid.
 *
 * @throws ManifestError
 */
ResolvedManifest resolveManifest(Manifest manifest, const StageRegistry & registry);

} // namespace arbor
