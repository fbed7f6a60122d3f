#include "arbor/manifest/graph.hh"
#include "arbor/util/topo-sort.hh"
#include "arbor/util/types.hh"

#include <map>

namespace arbor {

PipelineGraph PipelineGraph::build(const Manifest & manifest)
{
    auto n = manifest.pipelines.size();

    std::map<std::string, size_t> index;
    for (size_t i = 0; i < n; ++i)
        index.emplace(manifest.pipelines[i].name, i);

    PipelineGraph graph;
    graph.dependencies.resize(n);
    graph.dependents.resize(n);

    for (size_t i = 0; i < n; ++i) {
        auto & pipeline = manifest.pipelines[i];
        for (auto & dep : pipeline.dependencies()) {
            auto j = index.find(dep);
            if (j == index.end())
                throw ManifestError("pipeline '%s' refers to unknown pipeline '%s'", pipeline.name, dep);
            graph.dependencies[i].insert(j->second);
            graph.dependents[j->second].insert(i);
        }
    }

    std::set<size_t> all;
    for (size_t i = 0; i < n; ++i)
        all.insert(i);

    auto sorted = topoSort<size_t>(all, {[&](const size_t & i) { return graph.dependents[i]; }});

    std::visit(
        overloaded{
            [&](Cycle<size_t> & cycle) {
                throw ManifestError(
                    "pipeline '%s' and pipeline '%s' depend on each other",
                    manifest.pipelines[cycle.path].name,
                    manifest.pipelines[cycle.parent].name);
            },
            [&](std::vector<size_t> & order) { graph.order = std::move(order); },
        },
        sorted);

    return graph;
}

std::set<size_t> PipelineGraph::closure(const std::set<size_t> & roots) const
{
    std::set<size_t> res;
    std::vector<size_t> todo(roots.begin(), roots.end());
    while (!todo.empty()) {
        auto i = todo.back();
        todo.pop_back();
        if (!res.insert(i).second)
            continue;
        for (auto dep : dependencies[i])
            todo.push_back(dep);
    }
    return res;
}

std::set<size_t> PipelineGraph::transitiveDependents(size_t node) const
{
    std::set<size_t> res;
    std::vector<size_t> todo(dependents[node].begin(), dependents[node].end());
    while (!todo.empty()) {
        auto i = todo.back();
        todo.pop_back();
        if (!res.insert(i).second)
            continue;
        for (auto dep : dependents[i])
            todo.push_back(dep);
    }
    return res;
}

} // namespace arbor
