#pragma once
///@file

#include <functional>
#include <map>
#include <set>
#include <variant>
#include <vector>

namespace arbor {

/**
 * An edge `parent -> path` that lies on a cycle.
 */
template<typename T>
struct Cycle
{
    T path;
    T parent;
};

template<typename T>
using TopoSortResult = std::variant<std::vector<T>, Cycle<T>>;

/**
 * Order `items` so that every item precedes its children, as returned
 * by `getChildren`. Children outside `items` are ignored. Among items
 * that are ready at the same time, the smallest comes first, so the
 * result is deterministic. If the relation has a cycle, one of its
 * edges is returned instead.
 */
template<typename T, typename Compare = std::less<T>>
TopoSortResult<T> topoSort(std::set<T, Compare> items, std::function<std::set<T, Compare>(const T &)> getChildren)
{
    std::map<T, std::set<T, Compare>, Compare> children, parents;
    std::map<T, size_t, Compare> pending;

    for (auto & item : items)
        pending[item] = 0;

    for (auto & item : items) {
        for (auto & child : getChildren(item)) {
            if (!items.count(child))
                continue;
            if (children[item].insert(child).second) {
                parents[child].insert(item);
                pending[child]++;
            }
        }
    }

    std::set<T, Compare> ready;
    for (auto & [item, n] : pending)
        if (n == 0)
            ready.insert(item);

    std::vector<T> sorted;
    while (!ready.empty()) {
        auto item = *ready.begin();
        ready.erase(ready.begin());
        pending.erase(item);
        sorted.push_back(item);
        for (auto & child : children[item])
            if (--pending[child] == 0)
                ready.insert(child);
    }

    if (pending.empty())
        return sorted;

    /* Every item left has a parent that is also left. Following parents
       backwards must therefore revisit an item, and that item is on a
       cycle. */
    std::set<T, Compare> seen;
    T path = pending.begin()->first;
    while (true) {
        T parent = path;
        for (auto & p : parents[path])
            if (pending.count(p)) {
                parent = p;
                break;
            }
        if (!seen.insert(parent).second)
            return Cycle<T>{path, parent};
        path = parent;
    }
}

} // namespace arbor
