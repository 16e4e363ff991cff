// graph/graph_concepts.h - Node label, edge and graph concepts
// Part of the decyc cyclic scheduling library (C++20)
//
// Nodes are opaque labels chosen by the caller (short strings, small
// integers).  A label's position of first appearance in a graph gives
// it a stable index; every algorithm works on indices internally and
// translates back to labels only at its boundary.
//
// Two input shapes are accepted by the entry points:
//   labelled_graph  a graph object (digraph<Node> or anything shaped
//                   like it)
//   edge_list       a range of "source target" strings, parsed into a
//                   digraph<std::string> before the algorithm runs
// Anything else is rejected at compile time.

#ifndef DECYC_GRAPH_GRAPH_CONCEPTS_H
#define DECYC_GRAPH_GRAPH_CONCEPTS_H

#include <concepts>
#include <cstddef>
#include <functional>
#include <ostream>
#include <ranges>
#include <string_view>

namespace decyc::graph {

// =============================================================================
// Node label
// =============================================================================

/// A node label must be copyable, equality comparable, hashable with
/// std::hash, and printable (batch labels are "<node>.<cycle>").
template<typename T>
concept node_label =
    std::copyable<T> &&
    std::equality_comparable<T> &&
    requires(T const& t, std::ostream& os) {
        { std::hash<T>{}(t) } -> std::convertible_to<std::size_t>;
        { os << t } -> std::convertible_to<std::ostream&>;
    };

// =============================================================================
// Edge
// =============================================================================

/// Ordered (source, target) pair of node labels.
template<node_label Node>
struct edge {
    Node source{};
    Node target{};

    friend bool operator==(edge const&, edge const&) = default;
};

template<node_label Node>
std::ostream& operator<<(std::ostream& os, edge<Node> const& e) {
    return os << '(' << e.source << ", " << e.target << ')';
}

// =============================================================================
// Graph concept
// =============================================================================

/// A labelled_graph provides read access by stable node index.
///
/// Requirements:
/// - node_type: the label type
/// - node_count(): number of nodes
/// - node_at(i): label of the node with stable index i
/// - index_of(n): stable index of label n
/// - out_indices(i): successor indices of node i, in adjacency order
///
/// Satisfied by digraph<Node>.
template<typename G>
concept labelled_graph =
    node_label<typename G::node_type> &&
    requires(G const& g, std::size_t i, typename G::node_type const& n) {
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.node_at(i) } -> std::convertible_to<typename G::node_type const&>;
        { g.index_of(n) } -> std::convertible_to<std::size_t>;
        { g.out_indices(i) } -> std::ranges::input_range;
    };

/// An edge_list is a range of "source target" lines.
template<typename R>
concept edge_list =
    std::ranges::input_range<R> &&
    std::convertible_to<std::ranges::range_reference_t<R>, std::string_view> &&
    !labelled_graph<R>;

/// Either accepted input shape.
template<typename T>
concept graph_input = labelled_graph<T> || edge_list<T>;

} // namespace decyc::graph

#endif // DECYC_GRAPH_GRAPH_CONCEPTS_H
