#include <gtest/gtest.h>

#include "arbor/manifest/graph.hh"

#include <algorithm>

namespace arbor {

static Manifest pipelines(std::string_view json)
{
    return Manifest::parse(json);
}

static size_t position(const PipelineGraph & graph, size_t node)
{
    return std::find(graph.order.begin(), graph.order.end(), node) - graph.order.begin();
}

TEST(PipelineGraph, dependenciesComeFirst)
{
    auto manifest = pipelines(R"({
        "version": "2",
        "pipelines": [
            {"name": "image", "build": "name:build", "stages": [{
                "type": "org.osbuild.qemu",
                "inputs": {"tree": {"type": "org.osbuild.tree", "origin": "org.osbuild.pipeline", "references": ["name:tree"]}}
            }]},
            {"name": "tree", "build": "name:build"},
            {"name": "build"},
            {"name": "unrelated"}
        ]
    })");

    auto graph = PipelineGraph::build(manifest);

    ASSERT_EQ(graph.order.size(), 4u);
    ASSERT_LT(position(graph, 2), position(graph, 1));
    ASSERT_LT(position(graph, 1), position(graph, 0));

    ASSERT_EQ(graph.dependencies[0], (std::set<size_t>{1, 2}));
    ASSERT_EQ(graph.dependents[2], (std::set<size_t>{0, 1}));
    ASSERT_TRUE(graph.dependencies[3].empty());
}

TEST(PipelineGraph, closureAndDependents)
{
    auto manifest = pipelines(R"({
        "version": "2",
        "pipelines": [
            {"name": "build"},
            {"name": "tree", "build": "name:build"},
            {"name": "image", "build": "name:build", "stages": [{
                "type": "org.osbuild.qemu",
                "inputs": {"tree": {"type": "org.osbuild.tree", "origin": "org.osbuild.pipeline", "references": ["name:tree"]}}
            }]},
            {"name": "other"}
        ]
    })");

    auto graph = PipelineGraph::build(manifest);

    ASSERT_EQ(graph.closure({2}), (std::set<size_t>{0, 1, 2}));
    ASSERT_EQ(graph.closure({1, 3}), (std::set<size_t>{0, 1, 3}));
    ASSERT_EQ(graph.transitiveDependents(0), (std::set<size_t>{1, 2}));
    ASSERT_TRUE(graph.transitiveDependents(2).empty());
}

TEST(PipelineGraph, unknownReferenceIsRejected)
{
    auto manifest = pipelines(R"({"version": "2", "pipelines": [{"name": "tree", "build": "name:missing"}]})");

    ASSERT_THROW(PipelineGraph::build(manifest), ManifestError);
}

TEST(PipelineGraph, cycleIsRejected)
{
    auto manifest = pipelines(R"({
        "version": "2",
        "pipelines": [
            {"name": "a", "build": "name:b"},
            {"name": "b", "build": "name:a"}
        ]
    })");

    ASSERT_THROW(PipelineGraph::build(manifest), ManifestError);
}

TEST(PipelineGraph, selfReferenceIsRejected)
{
    auto manifest = pipelines(R"({"version": "2", "pipelines": [{"name": "a", "build": "name:a"}]})");

    ASSERT_THROW(PipelineGraph::build(manifest), ManifestError);
}

} // namespace arbor
