// graph/dependency_matrix.h - Intra- and inter-iteration dependency matrices
// Part of the decyc cyclic scheduling library (C++20)
//
// Both matrices are square, indexed by the stable node index of one
// graph snapshot, with the bool_matrix convention:
//   cell(row, col) == true  <=>  node `row` depends on node `col`.
//
// intra-iteration:  the retained (acyclic) edges.  Edge j -> i sets
//                   cell(i, j): i runs after j in the same cycle.
// inter-iteration:  the removed back-edges.  Edge s -> t sets
//                   cell(t, s): t in cycle N runs after s in cycle N-1.
//
// For a decyclify result every input edge that was not discarded by
// the post-pass sets a cell in exactly one of the two matrices.

#ifndef DECYC_GRAPH_DEPENDENCY_MATRIX_H
#define DECYC_GRAPH_DEPENDENCY_MATRIX_H

#include "digraph.h"
#include "graph_concepts.h"
#include "graph_errors.h"
#include "graph_io_parse.h"
#include <decyc/core/bool_matrix.h>

#include <cstddef>
#include <ranges>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace decyc::graph {

/// Build the intra-iteration matrix of a graph.
///
/// cell(i, j) is set iff i != j and node i is a successor of node j.
/// The diagonal is never set, so a self-edge left in the input does not
/// appear.  Returns an empty matrix for an empty graph.
///
/// Complexity: O(V² + E) (matrix allocation dominates).
///
/// Example:
/// ```cpp
/// // a -> b -> c -> d after decyclify
/// auto m = build_intra_iteration_matrix(r.graph);
/// // m(1, 0): b depends on a
/// ```
template<labelled_graph G>
[[nodiscard]] bool_matrix build_intra_iteration_matrix(G const& g) {
    auto const V = g.node_count();
    if (V == 0) {
        return bool_matrix{};
    }

    bool_matrix m(V);
    for (std::size_t j = 0; j < V; ++j) {
        for (auto i : g.out_indices(j)) {
            auto const row = static_cast<std::size_t>(i);
            if (row != j) m.set(row, j);
        }
    }
    return m;
}

/// Edge-list overload: parse, then build.
template<edge_list R>
[[nodiscard]] bool_matrix build_intra_iteration_matrix(R const& lines) {
    return build_intra_iteration_matrix(io::parse_edge_list(lines));
}

/// Build the inter-iteration matrix from a node list and removed edges.
///
/// `nodes` fixes the index mapping (use graph.nodes() of the same
/// snapshot the intra matrix was built from).  Returns an empty matrix
/// if either argument is empty.
///
/// Throws not_found_error if a removed edge names a node missing from
/// `nodes`.
template<std::ranges::input_range Nodes, std::ranges::forward_range Edges>
    requires node_label<std::ranges::range_value_t<Nodes>> &&
             std::same_as<std::ranges::range_value_t<Edges>,
                          edge<std::ranges::range_value_t<Nodes>>>
[[nodiscard]] bool_matrix build_inter_iteration_matrix(Nodes const& nodes,
                                                       Edges const& removed)
{
    using Node = std::ranges::range_value_t<Nodes>;

    std::unordered_map<Node, std::size_t> index;
    for (auto const& n : nodes) {
        index.emplace(n, index.size());
    }
    if (index.empty() || std::ranges::empty(removed)) {
        return bool_matrix{};
    }

    auto lookup = [&index](Node const& n) {
        auto it = index.find(n);
        if (it == index.end()) {
            std::ostringstream oss;
            oss << "build_inter_iteration_matrix: removed edge names node '"
                << n << "', which is not in the node list";
            throw not_found_error(oss.str());
        }
        return it->second;
    };

    bool_matrix m(index.size());
    for (auto const& e : removed) {
        m.set(lookup(e.target), lookup(e.source));
    }
    return m;
}

/// Convenience: inter-iteration matrix for a graph and its removed edges.
template<node_label Node>
[[nodiscard]] bool_matrix
build_inter_iteration_matrix(digraph<Node> const& g,
                             std::vector<edge<Node>> const& removed)
{
    return build_inter_iteration_matrix(g.nodes(), removed);
}

} // namespace decyc::graph

#endif // DECYC_GRAPH_DEPENDENCY_MATRIX_H
