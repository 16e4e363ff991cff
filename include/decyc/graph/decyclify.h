// graph/decyclify.h - Cycle removal by depth-first edge classification
// Part of the decyc cyclic scheduling library (C++20)
//
// ALGORITHM: iterative depth-first traversal with three-colour marking.
//   unvisited -> in_progress when the node is entered,
//   in_progress -> done when all its successors have been processed.
// An edge into an in_progress node closes a cycle (back-edge); it is
// recorded and deleted from the working copy immediately.
//
// Passes:
//   1. Traverse from the start node (default: first node in stable order).
//   2. Delete every edge from a node still unvisited into a node already
//      done.  These edges are reported in discarded_edges, NOT in
//      removed_edges, and feed neither dependency matrix.
//   3. Traverse from every node still unvisited, in stable order, until
//      all nodes are done.  Back-edges found here are appended to the
//      same removed_edges list.
//
// Complexity: O(V + E) traversal; each back-edge deletion is O(deg).
// Determinism: successors are taken in adjacency (insertion) order from
// a snapshot captured when the node is entered, so deletions never
// disturb the iteration of the node being processed.
//
// The traversal uses an explicit stack of (node, successor snapshot,
// next position) frames, so depth is bounded by memory, not by the
// call stack.  Discovery order and edge classification are those of
// the recursive formulation.
//
// Colours live in a vector local to one call; the input graph is never
// modified (the algorithm works on a copy).

#ifndef DECYC_GRAPH_DECYCLIFY_H
#define DECYC_GRAPH_DECYCLIFY_H

#include "digraph.h"
#include "graph_concepts.h"
#include "graph_errors.h"
#include "graph_io_parse.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace decyc::graph {

/// Traversal state of one node during a single decyclify call.
enum class node_color : std::uint8_t {
    unvisited,
    in_progress,
    done
};

/// Counters collected by one decyclify call.
///
/// Every input edge is counted exactly once in tree_edges,
/// back_edges, other_edges or discarded_edges, so their sum equals the
/// input edge count.
struct decyclify_stats {
    /// Nodes entered by the traversal (equals node count on return).
    std::size_t nodes_visited = 0;

    /// Edges that led the traversal to an unvisited node.
    std::size_t tree_edges = 0;

    /// Edges into an in_progress node: removed, reported in removed_edges.
    std::size_t back_edges = 0;

    /// Forward and cross edges into a done node: kept.
    std::size_t other_edges = 0;

    /// Edges deleted by the post-pass (unvisited source, done target).
    std::size_t discarded_edges = 0;

    /// Number of traversal roots: 1 for the start node plus one per
    /// restart from an unreached node.
    std::size_t roots = 0;

    /// Deepest explicit stack reached (longest tree path, in nodes).
    std::size_t max_stack_depth = 0;

    /// Counters sum; max_stack_depth takes the maximum.
    decyclify_stats operator+(decyclify_stats const& other) const {
        return decyclify_stats{
            .nodes_visited = nodes_visited + other.nodes_visited,
            .tree_edges = tree_edges + other.tree_edges,
            .back_edges = back_edges + other.back_edges,
            .other_edges = other_edges + other.other_edges,
            .discarded_edges = discarded_edges + other.discarded_edges,
            .roots = roots + other.roots,
            .max_stack_depth = (max_stack_depth > other.max_stack_depth)
                ? max_stack_depth : other.max_stack_depth,
        };
    }

    decyclify_stats& operator+=(decyclify_stats const& other) {
        *this = *this + other;
        return *this;
    }

    bool operator==(decyclify_stats const& other) const = default;
};

/// Result of decyclify.
///
/// - graph: acyclic copy of the input (same node order)
/// - removed_edges: back-edges, in discovery order
/// - discarded_edges: edges deleted by the post-pass, in deletion order
/// - stats: traversal counters
template<node_label Node>
struct decyclify_result {
    digraph<Node> graph{};
    std::vector<edge<Node>> removed_edges{};
    std::vector<edge<Node>> discarded_edges{};
    decyclify_stats stats{};
};

namespace detail {

/// Depth-first traversal from `root`, removing back-edges from `g`.
template<node_label Node>
void visit_from(std::size_t root,
                std::vector<node_color>& color,
                decyclify_result<Node>& out)
{
    auto& g = out.graph;
    auto& stats = out.stats;

    struct frame {
        std::size_t node;
        std::vector<std::size_t> successors;  // snapshot at entry
        std::size_t next;
    };
    std::vector<frame> stack;

    color[root] = node_color::in_progress;
    ++stats.nodes_visited;
    ++stats.roots;
    stack.push_back(frame{root, g.out_indices(root), 0});
    if (stack.size() > stats.max_stack_depth) stats.max_stack_depth = stack.size();

    while (!stack.empty()) {
        auto& top = stack.back();

        if (top.next == top.successors.size()) {
            color[top.node] = node_color::done;
            stack.pop_back();
            continue;
        }

        auto const u = top.node;
        auto const v = top.successors[top.next];
        ++top.next;

        switch (color[v]) {
        case node_color::unvisited:
            // Tree edge: descend into v.  `top` is not used past this push.
            ++stats.tree_edges;
            color[v] = node_color::in_progress;
            ++stats.nodes_visited;
            stack.push_back(frame{v, g.out_indices(v), 0});
            if (stack.size() > stats.max_stack_depth) stats.max_stack_depth = stack.size();
            break;

        case node_color::in_progress:
            // Back edge: v is on the current path.
            ++stats.back_edges;
            out.removed_edges.push_back(edge<Node>{g.node_at(u), g.node_at(v)});
            g.remove_edge(g.node_at(u), g.node_at(v));
            break;

        case node_color::done:
            ++stats.other_edges;
            break;
        }
    }
}

/// Post-pass: delete edges from unvisited nodes into done nodes.
template<node_label Node>
void discard_unreached_edges(std::vector<node_color> const& color,
                             decyclify_result<Node>& out)
{
    auto& g = out.graph;
    for (std::size_t u = 0; u < g.node_count(); ++u) {
        if (color[u] != node_color::unvisited) continue;

        auto const successors = g.out_indices(u);  // snapshot
        for (auto v : successors) {
            if (color[v] != node_color::done) continue;
            ++out.stats.discarded_edges;
            out.discarded_edges.push_back(edge<Node>{g.node_at(u), g.node_at(v)});
            g.remove_edge(g.node_at(u), g.node_at(v));
        }
    }
}

} // namespace detail

/// Remove cycles from a graph.
///
/// Returns an acyclic copy of `g` plus the removed back-edges.  The
/// input graph is not modified.  An empty graph yields an empty result
/// without traversal.
///
/// Throws not_found_error if `start` is given and is not a node of `g`.
///
/// Example:
/// ```cpp
/// digraph<std::string> g{{"a", "b"}, {"b", "c"}, {"c", "b"}, {"c", "d"}};
/// auto r = decyclify(g, std::string("a"));
/// // r.graph.nodes()  == {"a", "b", "c", "d"}
/// // r.removed_edges  == {{"c", "b"}}
/// ```
template<node_label Node>
[[nodiscard]] decyclify_result<Node>
decyclify(digraph<Node> const& g,
          std::optional<std::type_identity_t<Node>> const& start = std::nullopt) {
    decyclify_result<Node> result;
    result.graph = g.copy();

    auto const V = g.node_count();
    if (V == 0) {
        return result;
    }

    std::size_t root = 0;
    if (start) {
        if (!g.has_node(*start)) {
            std::ostringstream oss;
            oss << "decyclify: start node '" << *start << "' is not in the graph";
            throw not_found_error(oss.str());
        }
        root = g.index_of(*start);
    }

    std::vector<node_color> color(V, node_color::unvisited);

    detail::visit_from(root, color, result);
    detail::discard_unreached_edges(color, result);

    for (std::size_t u = 0; u < V; ++u) {
        if (color[u] == node_color::unvisited) {
            detail::visit_from(u, color, result);
        }
    }

    return result;
}

/// Remove cycles from an edge-list input ("source target" strings).
///
/// Throws format_error for a malformed line.
template<edge_list R>
[[nodiscard]] decyclify_result<std::string>
decyclify(R const& lines, std::optional<std::string> const& start = std::nullopt) {
    return decyclify(io::parse_edge_list(lines), start);
}

} // namespace decyc::graph

#endif // DECYC_GRAPH_DECYCLIFY_H
