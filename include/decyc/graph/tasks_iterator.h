// graph/tasks_iterator.h - Overlapping replay of repeated cycles
// Part of the decyc cyclic scheduling library (C++20)
//
// tasks_iterator replays `cycles` repetitions of a graph at once.  Each
// step advances every active cycle by at most one batch, so cycle N+1
// can start while cycle N is still running.  All "concurrency" is
// logical: a single next() call computes one step.
//
// STATE MACHINE
//   cycle:     active --(no batch left)--> exhausted (dropped from the
//              active list; never revisited)
//   iterator:  running --(a step releases nothing)--> done
//
// STEP
//   Active cycles are advanced in cycle-number order.  Cycle 0 (and any
//   cycle whose predecessor is exhausted) releases its next candidate
//   batch unconditionally.  A later cycle N gates each candidate node
//   on cycle N-1, using N-1's state as of this same step:
//     - a node with inter-iteration triggers (row of the inter matrix)
//       waits until cycle N-1 has emitted every trigger;
//     - a node without triggers waits until its own column has fired
//       in cycle N-1, so cycle N never runs ahead of cycle N-1.
//   While no candidate clears, the whole candidate is held for the next
//   step.  Once at least one clears, the candidate is committed with
//   the cleared nodes only and the scan moves past its column.
//
// Cycles live in an index-addressed vector; "previous cycle" is index
// arithmetic, the active set is an ordered list of indices.

#ifndef DECYC_GRAPH_TASKS_ITERATOR_H
#define DECYC_GRAPH_TASKS_ITERATOR_H

#include "decyclify.h"
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
#include <utility>
#include <vector>

namespace decyc::graph {

/// Outcome of advancing one cycle by one step.
enum class cycle_step_status {
    released,   ///< at least one node released
    held,       ///< candidate kept back by the cross-cycle gate
    exhausted   ///< no batch left; the cycle leaves the active set
};

/// Replays several cycles of a graph with cross-cycle overlap.
///
/// Example:
/// ```cpp
/// // a -> b, a -> e, b -> c, c -> b, c -> d; back-edge (c, b) removed
/// tasks_iterator it(g, 2);
/// while (auto b = it.next()) {
///     // {a.0} {b.0, e.0, a.1} {c.0, b.1} {d.0, c.1} {d.1}
/// }
/// ```
template<node_label Node>
class tasks_iterator {
public:
    using node_type = Node;
    using batch_type = batch<Node>;

    /// Decyclify a copy of `g` (from its first node) and replay it.
    ///
    /// Throws invalid_argument_value if `cycles` < 1.
    tasks_iterator(digraph<Node> const& g, std::ptrdiff_t cycles,
                   first_batch_policy policy = first_batch_policy::sources)
    {
        require_cycle_count(cycles, "tasks_iterator");
        init(decyclify(g), cycles, policy);
    }

    /// Replay an existing decyclify result: its graph gives the intra
    /// order, its removed edges the inter-iteration triggers.
    ///
    /// Throws invalid_argument_value if `cycles` < 1.
    tasks_iterator(decyclify_result<Node> const& decyclified, std::ptrdiff_t cycles,
                   first_batch_policy policy = first_batch_policy::sources)
    {
        require_cycle_count(cycles, "tasks_iterator");
        init(decyclified, cycles, policy);
    }

    /// Replay an edge-list input ("source target" strings).
    template<edge_list R>
        requires std::same_as<Node, std::string>
    tasks_iterator(R const& lines, std::ptrdiff_t cycles,
                   first_batch_policy policy = first_batch_policy::sources)
    {
        require_cycle_count(cycles, "tasks_iterator");
        init(decyclify(io::parse_edge_list(lines)), cycles, policy);
    }

    /// Next step's batch, or std::nullopt once a step releases nothing.
    [[nodiscard]] std::optional<batch_type> next() {
        if (done_) {
            return std::nullopt;
        }

        batch_type out;
        std::vector<std::size_t> still_active;
        still_active.reserve(active_.size());

        for (auto k : active_) {
            auto [status, released] = advance(k);
            switch (status) {
            case cycle_step_status::released:
                for (auto r : released) {
                    out.push_back(tagged_node<Node>{nodes_[r], k});
                }
                still_active.push_back(k);
                break;
            case cycle_step_status::held:
                still_active.push_back(k);
                break;
            case cycle_step_status::exhausted:
                break;
            }
        }

        active_ = std::move(still_active);
        if (out.empty()) {
            done_ = true;
            return std::nullopt;
        }
        return out;
    }

    /// Cycle numbers still active, ascending.
    [[nodiscard]] std::vector<std::size_t> const& active_cycles() const noexcept { return active_; }

    [[nodiscard]] std::size_t cycle_count() const noexcept { return cycles_.size(); }
    [[nodiscard]] bool done() const noexcept { return done_; }

    [[nodiscard]] std::vector<Node> const& nodes() const noexcept { return nodes_; }
    [[nodiscard]] std::vector<edge<Node>> const& removed_edges() const noexcept { return removed_; }
    [[nodiscard]] bool_matrix const& intra_iteration_matrix() const noexcept { return intra_; }
    [[nodiscard]] bool_matrix const& inter_iteration_matrix() const noexcept { return inter_; }

private:
    void init(decyclify_result<Node> const& decyclified, std::ptrdiff_t cycles,
              first_batch_policy policy)
    {
        auto const& g = decyclified.graph;
        nodes_ = g.nodes();
        removed_ = decyclified.removed_edges;
        intra_ = build_intra_iteration_matrix(g);
        inter_ = build_inter_iteration_matrix(nodes_, removed_);

        auto const V = nodes_.size();
        triggers_.assign(V, {});
        if (!inter_.empty()) {
            for (std::size_t r = 0; r < V; ++r) {
                for (std::size_t c = 0; c < V; ++c) {
                    if (inter_(r, c)) triggers_[r].push_back(c);
                }
            }
        }

        auto const n = static_cast<std::size_t>(cycles);
        cycles_.reserve(n);
        active_.reserve(n);
        for (std::size_t k = 0; k < n; ++k) {
            cycles_.emplace_back(intra_, policy);
            active_.push_back(k);
        }
        done_ = V == 0;
    }

    /// Advance cycle k by one step.
    std::pair<cycle_step_status, std::vector<std::size_t>> advance(std::size_t k) {
        auto& cursor = cycles_[k];
        auto const* candidate = cursor.candidate(intra_);
        if (candidate == nullptr) {
            return {cycle_step_status::exhausted, {}};
        }

        if (k == 0 || cycles_[k - 1].exhausted()) {
            std::vector<std::size_t> released = *candidate;
            cursor.commit_all();
            return {cycle_step_status::released, std::move(released)};
        }

        auto const& previous = cycles_[k - 1];
        std::vector<std::size_t> cleared;
        for (auto r : *candidate) {
            if (gate_open(r, previous)) cleared.push_back(r);
        }

        if (cleared.empty()) {
            return {cycle_step_status::held, {}};
        }
        cursor.commit(cleared);
        return {cycle_step_status::released, std::move(cleared)};
    }

    /// Whether node r of a later cycle may run, given cycle N-1.
    [[nodiscard]] bool gate_open(std::size_t r, detail::cycle_cursor const& previous) const {
        auto const& triggers = triggers_[r];
        if (triggers.empty()) {
            return previous.fired(r);
        }
        for (auto t : triggers) {
            if (!previous.released(t)) return false;
        }
        return true;
    }

    std::vector<Node> nodes_;
    std::vector<edge<Node>> removed_;
    bool_matrix intra_;
    bool_matrix inter_;
    std::vector<std::vector<std::size_t>> triggers_;  // per node: inter-matrix columns
    std::vector<detail::cycle_cursor> cycles_;        // index == cycle number
    std::vector<std::size_t> active_;
    bool done_ = false;
};

template<edge_list R>
tasks_iterator(R const&, std::ptrdiff_t) -> tasks_iterator<std::string>;

template<edge_list R>
tasks_iterator(R const&, std::ptrdiff_t, first_batch_policy) -> tasks_iterator<std::string>;

} // namespace decyc::graph

#endif // DECYC_GRAPH_TASKS_ITERATOR_H
