// graph/digraph.h - Insertion-ordered labelled directed graph
// Part of the decyc cyclic scheduling library (C++20)
//
// digraph<Node> is the graph model every algorithm in the library reads.
//
// ORDERING:
// - Nodes are indexed by order of first appearance (add_node or either
//   endpoint of add_edge).  The index never changes for the lifetime of
//   the graph; remove_edge does not remove nodes.
// - Successor and predecessor lists keep edge insertion order.  This
//   order drives the depth-first traversal in decyclify, so it must be
//   deterministic.
//
// EDGES:
// - add_edge is idempotent: a repeated (source, target) pair is ignored.
// - Self-edges are kept (a self-edge is a cycle of length one).
//
// Storage is adjacency lists of stable indices in both directions plus
// a label -> index hash map.  Copying a digraph yields an independent
// graph with identical node order and edges.

#ifndef DECYC_GRAPH_DIGRAPH_H
#define DECYC_GRAPH_DIGRAPH_H

#include "graph_concepts.h"
#include "graph_errors.h"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace decyc::graph {

/// Mutable directed graph over caller-chosen node labels.
///
/// Example:
/// ```cpp
/// digraph<std::string> g;
/// g.add_edge("a", "b");
/// g.add_edge("b", "c");
/// g.add_edge("c", "b");
/// // g.nodes() == {"a", "b", "c"}
/// // g.successors("c") == {"b"}
/// ```
template<node_label Node>
class digraph {
public:
    using node_type = Node;
    using edge_type = edge<Node>;
    using index_list = std::vector<std::size_t>;

    digraph() = default;

    /// Build from an edge list, in order.
    digraph(std::initializer_list<edge_type> edges) {
        for (auto const& e : edges) {
            add_edge(e.source, e.target);
        }
    }

    // =========================================================================
    // Construction
    // =========================================================================

    /// Add a node if absent.  Returns its stable index either way.
    std::size_t add_node(Node const& n) {
        auto it = index_.find(n);
        if (it != index_.end()) {
            return it->second;
        }
        auto const idx = nodes_.size();
        nodes_.push_back(n);
        out_.emplace_back();
        in_.emplace_back();
        index_.emplace(n, idx);
        return idx;
    }

    /// Add the edge source -> target, adding either endpoint if absent.
    /// A duplicate edge is ignored.
    void add_edge(Node const& source, Node const& target) {
        auto const u = add_node(source);
        auto const v = add_node(target);
        auto& succ = out_[u];
        if (std::find(succ.begin(), succ.end(), v) != succ.end()) {
            return;
        }
        succ.push_back(v);
        in_[v].push_back(u);
        ++edge_count_;
    }

    /// Remove the edge source -> target.
    /// Throws not_found_error if the edge (or either node) is absent.
    void remove_edge(Node const& source, Node const& target) {
        auto const u = find_index(source);
        auto const v = find_index(target);
        if (u == npos || v == npos || !remove_edge_at(u, v)) {
            throw not_found_error("digraph::remove_edge: edge ("
                + to_text(source) + ", " + to_text(target)
                + ") is not in the graph");
        }
    }

    /// Index-level removal used by the traversal.  Returns false if
    /// the edge u -> v does not exist.
    bool remove_edge_at(std::size_t u, std::size_t v) {
        auto& succ = out_[u];
        auto it = std::find(succ.begin(), succ.end(), v);
        if (it == succ.end()) {
            return false;
        }
        succ.erase(it);
        auto& pred = in_[v];
        pred.erase(std::find(pred.begin(), pred.end(), u));
        --edge_count_;
        return true;
    }

    /// Independent copy with identical node order and edges.
    [[nodiscard]] digraph copy() const { return *this; }

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    // =========================================================================
    // Label access
    // =========================================================================

    /// Nodes in stable order.
    [[nodiscard]] std::vector<Node> const& nodes() const noexcept { return nodes_; }

    [[nodiscard]] bool has_node(Node const& n) const {
        return index_.find(n) != index_.end();
    }

    [[nodiscard]] bool has_edge(Node const& source, Node const& target) const {
        auto const u = find_index(source);
        auto const v = find_index(target);
        if (u == npos || v == npos) return false;
        auto const& succ = out_[u];
        return std::find(succ.begin(), succ.end(), v) != succ.end();
    }

    /// Stable index of `n`.  Throws not_found_error if absent.
    [[nodiscard]] std::size_t index_of(Node const& n) const {
        auto const idx = find_index(n);
        if (idx == npos) {
            throw not_found_error("digraph::index_of: node '"
                + to_text(n) + "' is not in the graph");
        }
        return idx;
    }

    [[nodiscard]] Node const& node_at(std::size_t i) const {
        if (i >= nodes_.size()) {
            throw not_found_error("digraph::node_at: index "
                + std::to_string(i) + " outside graph of "
                + std::to_string(nodes_.size()) + " nodes");
        }
        return nodes_[i];
    }

    /// Successors of `n` in edge insertion order.
    [[nodiscard]] std::vector<Node> successors(Node const& n) const {
        return labels(out_[index_of(n)]);
    }

    /// Nodes with an edge into `n`, in edge insertion order.
    [[nodiscard]] std::vector<Node> predecessors(Node const& n) const {
        return labels(in_[index_of(n)]);
    }

    /// All edges: grouped by source in stable node order, then by
    /// edge insertion order.
    [[nodiscard]] std::vector<edge_type> edges() const {
        std::vector<edge_type> result;
        result.reserve(edge_count_);
        for (std::size_t u = 0; u < nodes_.size(); ++u) {
            for (auto v : out_[u]) {
                result.push_back(edge_type{nodes_[u], nodes_[v]});
            }
        }
        return result;
    }

    // =========================================================================
    // Index access
    // =========================================================================

    [[nodiscard]] index_list const& out_indices(std::size_t u) const noexcept {
        return out_[u];
    }

    [[nodiscard]] index_list const& in_indices(std::size_t u) const noexcept {
        return in_[u];
    }

    [[nodiscard]] std::size_t out_degree(std::size_t u) const noexcept {
        return out_[u].size();
    }

    [[nodiscard]] std::size_t in_degree(std::size_t u) const noexcept {
        return in_[u].size();
    }

private:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    [[nodiscard]] std::size_t find_index(Node const& n) const {
        auto it = index_.find(n);
        return it == index_.end() ? npos : it->second;
    }

    [[nodiscard]] std::vector<Node> labels(index_list const& idx) const {
        std::vector<Node> result;
        result.reserve(idx.size());
        for (auto i : idx) {
            result.push_back(nodes_[i]);
        }
        return result;
    }

    static std::string to_text(Node const& n) {
        std::ostringstream oss;
        oss << n;
        return oss.str();
    }

    std::vector<Node> nodes_;
    std::vector<index_list> out_;
    std::vector<index_list> in_;
    std::unordered_map<Node, std::size_t> index_;
    std::size_t edge_count_ = 0;
};

static_assert(labelled_graph<digraph<int>>);
static_assert(!edge_list<digraph<int>>);

} // namespace decyc::graph

#endif // DECYC_GRAPH_DIGRAPH_H
