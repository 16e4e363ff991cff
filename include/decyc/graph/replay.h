// graph/replay.h - Batches, node tags and the per-cycle column scan
// Part of the decyc cyclic scheduling library (C++20)
//
// A replay walks the intra-iteration matrix of an acyclic graph and
// produces "ready batches": sets of nodes that become eligible at the
// same step.  One replay of the whole graph is one cycle; every node
// released by cycle N is tagged with N ("b.0", "a.1").
//
// COLUMN SCAN (cycle_cursor):
//   first batch   the source nodes (no intra predecessor), or node 0
//                 only under first_batch_policy::first_node
//   then          columns are consumed left to right; consuming column j
//                 "fires" node j.  A column yields every row with a set
//                 cell in it, so a node with k intra predecessors is
//                 released k times per cycle.  Empty columns are skipped
//                 within the same step.
//   end           when the scan passes the last column the cycle is
//                 exhausted and every column counts as fired.
//
// The cursor separates computing a candidate batch from committing it,
// so a caller can hold a candidate back (tasks_iterator gating) and
// retry it at a later step without rescanning.

#ifndef DECYC_GRAPH_REPLAY_H
#define DECYC_GRAPH_REPLAY_H

#include "graph_concepts.h"
#include <decyc/core/bool_matrix.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace decyc::graph {

/// Which nodes form the first batch of every cycle.
enum class first_batch_policy {
    sources,     ///< every node without an intra-iteration predecessor
    first_node   ///< node 0 in stable order only (single-root graphs)
};

/// A node released by a specific replay cycle.
template<node_label Node>
struct tagged_node {
    Node node{};
    std::size_t cycle = 0;

    /// "<node>.<cycle>", e.g. "b.0".
    [[nodiscard]] std::string to_label() const {
        std::ostringstream oss;
        oss << node << '.' << cycle;
        return oss.str();
    }

    friend bool operator==(tagged_node const&, tagged_node const&) = default;
};

template<node_label Node>
std::ostream& operator<<(std::ostream& os, tagged_node<Node> const& t) {
    return os << t.node << '.' << t.cycle;
}

/// Nodes released in one iteration step.
template<node_label Node>
using batch = std::vector<tagged_node<Node>>;

/// Labels of a batch, in batch order.
template<node_label Node>
[[nodiscard]] std::vector<std::string> to_labels(batch<Node> const& b) {
    std::vector<std::string> labels;
    labels.reserve(b.size());
    for (auto const& t : b) {
        labels.push_back(t.to_label());
    }
    return labels;
}

namespace detail {

/// Column-scan state of one replay cycle over an intra-iteration matrix.
///
/// The matrix is passed to each call rather than stored, so owners can
/// be copied and moved freely.
class cycle_cursor {
public:
    cycle_cursor() = default;

    cycle_cursor(bool_matrix const& intra, first_batch_policy policy)
        : policy_(policy),
          exhausted_(intra.empty()),
          released_(intra.size(), false),
          fired_(intra.size(), false) {}

    /// Candidate batch of this cycle, computed on first call and kept
    /// until commit().  nullptr once the cycle is exhausted.
    [[nodiscard]] std::vector<std::size_t> const* candidate(bool_matrix const& intra) {
        if (candidate_) return &*candidate_;
        if (exhausted_) return nullptr;

        if (!started_) {
            started_ = true;
            candidate_end_ = column_;
            candidate_ = first_batch(intra);
            if (!candidate_->empty()) return &*candidate_;
            candidate_.reset();
        }

        auto const V = intra.size();
        for (std::size_t c = column_; c < V; ++c) {
            std::vector<std::size_t> ready;
            for (std::size_t r = 0; r < V; ++r) {
                if (intra(r, c)) ready.push_back(r);
            }
            if (!ready.empty()) {
                candidate_end_ = c + 1;
                candidate_ = std::move(ready);
                return &*candidate_;
            }
        }

        // Past the last column: nothing left to release.
        for (std::size_t c = column_; c < V; ++c) {
            fired_[c] = true;
        }
        column_ = V;
        exhausted_ = true;
        return nullptr;
    }

    /// Commit the pending candidate, releasing only `released` (a
    /// subset of it).  The scan moves past the candidate's column, so
    /// the other nodes of the candidate are not offered again from it.
    void commit(std::vector<std::size_t> const& released) {
        for (auto r : released) {
            released_[r] = true;
        }
        for (std::size_t c = column_; c < candidate_end_; ++c) {
            fired_[c] = true;
        }
        column_ = candidate_end_;
        candidate_.reset();
    }

    /// Commit the pending candidate, releasing all of it.
    void commit_all() {
        if (!candidate_) return;
        auto const released = std::move(*candidate_);
        commit(released);
    }

    /// True once column `node` has been consumed by a committed batch
    /// (or the cycle is exhausted).
    [[nodiscard]] bool fired(std::size_t node) const noexcept { return fired_[node]; }

    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

    /// True once `node` has been emitted by a committed batch.
    [[nodiscard]] bool released(std::size_t node) const noexcept { return released_[node]; }

private:
    [[nodiscard]] std::vector<std::size_t> first_batch(bool_matrix const& intra) const {
        std::vector<std::size_t> first;
        if (policy_ == first_batch_policy::first_node) {
            first.push_back(0);
            return first;
        }
        for (std::size_t r = 0; r < intra.size(); ++r) {
            if (!intra.row_any(r)) first.push_back(r);
        }
        return first;
    }

    first_batch_policy policy_ = first_batch_policy::sources;
    bool started_ = false;
    bool exhausted_ = true;
    std::size_t column_ = 0;          // next column to consume
    std::size_t candidate_end_ = 0;   // one past the candidate's column
    std::vector<bool> released_;
    std::vector<bool> fired_;
    std::optional<std::vector<std::size_t>> candidate_;
};

} // namespace detail

} // namespace decyc::graph

#endif // DECYC_GRAPH_REPLAY_H
