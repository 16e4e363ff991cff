// graph/cycle_iterator.h - Sequential replay of an acyclic graph
// Part of the decyc cyclic scheduling library (C++20)
//
// cycle_iterator replays the intra-iteration order of an acyclic graph
// one cycle after another: every batch of cycle N is produced before
// the first batch of cycle N+1.  Inter-iteration dependencies play no
// part here; see tasks_iterator for overlapping cycles.
//
// The sequence is forward-only.  With a cycle bound it is finite; with
// none it never ends for a non-empty graph.  An empty graph produces
// no batches.
//
// On a cyclic input the scan still releases nodes cycle by cycle,
// but the order no longer respects the dependencies; pass a decyclified
// graph.

#ifndef DECYC_GRAPH_CYCLE_ITERATOR_H
#define DECYC_GRAPH_CYCLE_ITERATOR_H

#include "dependency_matrix.h"
#include "digraph.h"
#include "graph_concepts.h"
#include "graph_errors.h"
#include "graph_io_parse.h"
#include "replay.h"
#include <decyc/core/bool_matrix.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace decyc::graph {

/// Replays an acyclic graph's dependency order cycle by cycle.
///
/// Example:
/// ```cpp
/// // a -> b, a -> e, b -> c, c -> d
/// cycle_iterator it(r.graph, 2);
/// while (auto b = it.next()) {
///     // {a.0} {b.0, e.0} {c.0} {d.0} {a.1} {b.1, e.1} {c.1} {d.1}
/// }
/// ```
template<node_label Node>
class cycle_iterator {
public:
    using node_type = Node;
    using batch_type = batch<Node>;

    /// Replay `g`.  `cycles` bounds the number of cycles; std::nullopt
    /// replays forever.
    ///
    /// Throws invalid_argument_value if `cycles` is given and < 1.
    template<labelled_graph G>
        requires std::same_as<typename G::node_type, Node>
    explicit cycle_iterator(G const& g,
                            std::optional<std::ptrdiff_t> cycles = std::nullopt,
                            first_batch_policy policy = first_batch_policy::sources)
        : policy_(policy)
    {
        if (cycles) {
            require_cycle_count(*cycles, "cycle_iterator");
            bound_ = static_cast<std::size_t>(*cycles);
        }
        nodes_.reserve(g.node_count());
        for (std::size_t i = 0; i < g.node_count(); ++i) {
            nodes_.push_back(g.node_at(i));
        }
        intra_ = build_intra_iteration_matrix(g);
        cursor_ = detail::cycle_cursor(intra_, policy_);
    }

    /// Replay an edge-list input ("source target" strings).
    template<edge_list R>
        requires std::same_as<Node, std::string>
    explicit cycle_iterator(R const& lines,
                            std::optional<std::ptrdiff_t> cycles = std::nullopt,
                            first_batch_policy policy = first_batch_policy::sources)
        : cycle_iterator(io::parse_edge_list(lines), cycles, policy) {}

    /// Next ready batch, or std::nullopt at the end of the sequence.
    [[nodiscard]] std::optional<batch_type> next() {
        while (!finished()) {
            if (auto const* ready = cursor_.candidate(intra_)) {
                batch_type out;
                out.reserve(ready->size());
                for (auto r : *ready) {
                    out.push_back(tagged_node<Node>{nodes_[r], cycle_});
                }
                cursor_.commit_all();
                return out;
            }
            ++cycle_;
            cursor_ = detail::cycle_cursor(intra_, policy_);
        }
        return std::nullopt;
    }

    /// Cycle number of the most recent (or upcoming) batch.
    [[nodiscard]] std::size_t current_cycle() const noexcept { return cycle_; }

    /// Cycle bound, if any.
    [[nodiscard]] std::optional<std::size_t> cycle_bound() const noexcept { return bound_; }

    [[nodiscard]] std::vector<Node> const& nodes() const noexcept { return nodes_; }
    [[nodiscard]] bool_matrix const& intra_iteration_matrix() const noexcept { return intra_; }

private:
    [[nodiscard]] bool finished() const noexcept {
        return nodes_.empty() || (bound_ && cycle_ >= *bound_);
    }

    std::vector<Node> nodes_;
    bool_matrix intra_;
    first_batch_policy policy_;
    std::optional<std::size_t> bound_;
    std::size_t cycle_ = 0;
    detail::cycle_cursor cursor_;
};

template<labelled_graph G>
cycle_iterator(G const&) -> cycle_iterator<typename G::node_type>;

template<labelled_graph G>
cycle_iterator(G const&, std::optional<std::ptrdiff_t>)
    -> cycle_iterator<typename G::node_type>;

template<labelled_graph G>
cycle_iterator(G const&, std::optional<std::ptrdiff_t>, first_batch_policy)
    -> cycle_iterator<typename G::node_type>;

template<edge_list R>
cycle_iterator(R const&) -> cycle_iterator<std::string>;

template<edge_list R>
cycle_iterator(R const&, std::optional<std::ptrdiff_t>) -> cycle_iterator<std::string>;

template<edge_list R>
cycle_iterator(R const&, std::optional<std::ptrdiff_t>, first_batch_policy)
    -> cycle_iterator<std::string>;

} // namespace decyc::graph

#endif // DECYC_GRAPH_CYCLE_ITERATOR_H
