#pragma once
///@file

#include "arbor/manifest/manifest.hh"

#include <set>
#include <vector>

namespace arbor {

/**
 * The dependency graph of a manifest's pipelines. Nodes are indices
 * into `Manifest::pipelines`.
 */
struct PipelineGraph
{
    /**
     * For every pipeline, the pipelines it needs (its build pipeline
     * and its pipeline inputs).
     */
    std::vector<std::set<size_t>> dependencies;

    /**
     * The inverse of `dependencies`.
     */
    std::vector<std::set<size_t>> dependents;

    /**
     * All pipelines, every one after the pipelines it needs.
     */
    std::vector<size_t> order;

    /**
     * @throws ManifestError on references to unknown pipelines and on
     * cycles.
     */
    static PipelineGraph build(const Manifest & manifest);

    /**
     * `roots` and everything they transitively need.
     */
    std::set<size_t> closure(const std::set<size_t> & roots) const;

    /**
     * Everything that transitively needs `node`, not including `node`.
     */
    std::set<size_t> transitiveDependents(size_t node) const;
};

} // namespace arbor
