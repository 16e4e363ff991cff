// graph/graph_equal.h - Structural equality for labelled graphs
// Part of the decyc cyclic scheduling library (C++20)
//
// Two graphs are equal if they list the same nodes in the same stable
// order and every node has the same successor set.  Successor order is
// not compared: removing and re-adding an edge changes adjacency order
// without changing the graph.

#ifndef DECYC_GRAPH_GRAPH_EQUAL_H
#define DECYC_GRAPH_GRAPH_EQUAL_H

#include "graph_concepts.h"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace decyc::graph {

/// Structural equality: same node order, same successor sets.
///
/// Example:
/// ```cpp
/// auto r = decyclify(g);
/// auto again = decyclify(r.graph);
/// assert(graph_equal(r.graph, again.graph));
/// ```
template<labelled_graph G1, labelled_graph G2>
[[nodiscard]] bool graph_equal(G1 const& a, G2 const& b) {
    auto const V = a.node_count();
    if (V != b.node_count()) {
        return false;
    }

    for (std::size_t i = 0; i < V; ++i) {
        if (!(a.node_at(i) == b.node_at(i))) {
            return false;
        }
    }

    for (std::size_t i = 0; i < V; ++i) {
        std::vector<std::size_t> sa(a.out_indices(i).begin(), a.out_indices(i).end());
        std::vector<std::size_t> sb(b.out_indices(i).begin(), b.out_indices(i).end());
        if (sa.size() != sb.size()) {
            return false;
        }
        std::sort(sa.begin(), sa.end());
        std::sort(sb.begin(), sb.end());
        if (sa != sb) {
            return false;
        }
    }

    return true;
}

} // namespace decyc::graph

#endif // DECYC_GRAPH_GRAPH_EQUAL_H
