#include <map>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "arbor/util/topo-sort.hh"

namespace arbor {

/**
 * Run topoSort over `nodes`, where `edges[parent]` are the children of
 * `parent`.
 */
static TopoSortResult<std::string>
runTopoSort(const std::set<std::string> & nodes, const std::map<std::string, std::set<std::string>> & edges)
{
    return topoSort(
        nodes,
        std::function<std::set<std::string>(const std::string &)>(
            [&](const std::string & node) -> std::set<std::string> {
                auto it = edges.find(node);
                return it != edges.end() ? it->second : std::set<std::string>{};
            }));
}

/**
 * Whether every parent comes before all of its children.
 */
static bool isValidTopologicalOrder(
    const std::vector<std::string> & sorted, const std::map<std::string, std::set<std::string>> & edges)
{
    std::map<std::string, size_t> position;
    for (size_t i = 0; i < sorted.size(); ++i)
        position[sorted[i]] = i;

    for (const auto & [parent, children] : edges)
        for (const auto & child : children)
            if (position.count(parent) && position.count(child) && position[parent] > position[child])
                return false;
    return true;
}

TEST(topoSort, empty)
{
    auto result = runTopoSort({}, {});

    ASSERT_TRUE(std::holds_alternative<std::vector<std::string>>(result));
    ASSERT_TRUE(std::get<std::vector<std::string>>(result).empty());
}

TEST(topoSort, chain)
{
    std::map<std::string, std::set<std::string>> edges{{"build", {"tree"}}, {"tree", {"image"}}};

    auto result = runTopoSort({"image", "tree", "build"}, edges);

    ASSERT_TRUE(std::holds_alternative<std::vector<std::string>>(result));
    ASSERT_EQ(std::get<std::vector<std::string>>(result), (std::vector<std::string>{"build", "tree", "image"}));
}

TEST(topoSort, diamond)
{
    std::map<std::string, std::set<std::string>> edges{
        {"a", {"b", "c"}},
        {"b", {"d"}},
        {"c", {"d"}},
    };

    auto result = runTopoSort({"a", "b", "c", "d"}, edges);

    ASSERT_TRUE(std::holds_alternative<std::vector<std::string>>(result));
    auto & sorted = std::get<std::vector<std::string>>(result);
    ASSERT_EQ(sorted.size(), 4u);
    ASSERT_TRUE(isValidTopologicalOrder(sorted, edges));
    ASSERT_EQ(sorted.front(), "a");
    ASSERT_EQ(sorted.back(), "d");
}

TEST(topoSort, ignoresChildrenOutsideTheSet)
{
    std::map<std::string, std::set<std::string>> edges{{"a", {"b", "elsewhere"}}};

    auto result = runTopoSort({"a", "b"}, edges);

    ASSERT_TRUE(std::holds_alternative<std::vector<std::string>>(result));
    ASSERT_EQ(std::get<std::vector<std::string>>(result), (std::vector<std::string>{"a", "b"}));
}

TEST(topoSort, selfLoop)
{
    auto result = runTopoSort({"a"}, {{"a", {"a"}}});

    ASSERT_TRUE(std::holds_alternative<Cycle<std::string>>(result));
    auto & cycle = std::get<Cycle<std::string>>(result);
    ASSERT_EQ(cycle.path, "a");
    ASSERT_EQ(cycle.parent, "a");
}

TEST(topoSort, twoNodeCycle)
{
    auto result = runTopoSort({"a", "b"}, {{"a", {"b"}}, {"b", {"a"}}});

    ASSERT_TRUE(std::holds_alternative<Cycle<std::string>>(result));
    auto & cycle = std::get<Cycle<std::string>>(result);
    std::set<std::string> involved{cycle.path, cycle.parent};
    ASSERT_EQ(involved, (std::set<std::string>{"a", "b"}));
}

TEST(topoSort, cycleBehindAcyclicPrefix)
{
    std::map<std::string, std::set<std::string>> edges{
        {"root", {"x"}},
        {"x", {"y"}},
        {"y", {"z"}},
        {"z", {"x"}},
    };

    auto result = runTopoSort({"root", "x", "y", "z"}, edges);

    ASSERT_TRUE(std::holds_alternative<Cycle<std::string>>(result));
    auto & cycle = std::get<Cycle<std::string>>(result);
    ASSERT_NE(cycle.path, "root");
    ASSERT_NE(cycle.parent, "root");
}

} // namespace arbor
