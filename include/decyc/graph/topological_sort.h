// graph/topological_sort.h - Deterministic topological ordering
// Part of the decyc cyclic scheduling library (C++20)
//
// ALGORITHM: Kahn's algorithm.
// Complexity: O(V^2 + E) with the linear scan for the next ready node.
// Determinism: when several nodes have in-degree 0, the smallest stable
// index is emitted first.
//
// Used to check decyclify output (is_dag must hold) and to list the
// nodes of an acyclic graph in dependency order.

#ifndef DECYC_GRAPH_TOPOLOGICAL_SORT_H
#define DECYC_GRAPH_TOPOLOGICAL_SORT_H

#include "graph_concepts.h"

#include <cstddef>
#include <vector>

namespace decyc::graph {

/// Result of topological sort.
///
/// - order: nodes in topological order (dependencies before dependents)
/// - is_dag: false if a cycle was found; `order` then holds only the
///   nodes emitted before the cycle blocked the sort.
template<node_label Node>
struct topo_result {
    std::vector<Node> order{};
    bool is_dag = true;
};

/// Topological sort via Kahn's algorithm.
///
/// Example:
/// ```cpp
/// digraph<int> g{{0, 1}, {0, 2}, {1, 3}, {2, 3}};
/// auto r = topological_sort(g);
/// // r.is_dag, r.order == {0, 1, 2, 3}
/// ```
template<labelled_graph G>
[[nodiscard]] topo_result<typename G::node_type> topological_sort(G const& g) {
    topo_result<typename G::node_type> result;
    auto const V = g.node_count();
    if (V == 0) {
        return result;
    }

    std::vector<std::size_t> in_degree(V, 0);
    for (std::size_t u = 0; u < V; ++u) {
        for (auto v : g.out_indices(u)) {
            ++in_degree[static_cast<std::size_t>(v)];
        }
    }

    std::vector<bool> ready(V, false);
    for (std::size_t u = 0; u < V; ++u) {
        if (in_degree[u] == 0) ready[u] = true;
    }

    result.order.reserve(V);
    for (std::size_t iteration = 0; iteration < V; ++iteration) {
        std::size_t chosen = V;  // sentinel: nothing ready
        for (std::size_t u = 0; u < V; ++u) {
            if (ready[u]) {
                chosen = u;
                break;
            }
        }

        if (chosen == V) {
            result.is_dag = false;
            return result;
        }

        ready[chosen] = false;
        result.order.push_back(g.node_at(chosen));

        for (auto v : g.out_indices(chosen)) {
            auto const t = static_cast<std::size_t>(v);
            if (--in_degree[t] == 0) ready[t] = true;
        }
    }

    return result;
}

/// True if `g` has no directed cycle (self-edges count as cycles).
template<labelled_graph G>
[[nodiscard]] bool is_acyclic(G const& g) {
    return topological_sort(g).is_dag;
}

} // namespace decyc::graph

#endif // DECYC_GRAPH_TOPOLOGICAL_SORT_H
